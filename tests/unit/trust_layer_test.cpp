#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/crypto/digest.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/trust/trust_layer.hpp"
#include "internal/util/errors.hpp"

namespace {

using provgate::crypto::Ed25519Key;
using provgate::trust::TrustLayer;
using provgate::util::TimePoint;
using namespace provgate::v1;
using namespace std::chrono_literals;

struct ManualClock {
  TimePoint now = TimePoint{} + std::chrono::hours(24 * 365 * 50);
};

std::shared_ptr<TrustLayer> NewTrust(const std::shared_ptr<ManualClock>& clock) {
  return std::make_shared<TrustLayer>([clock] { return clock->now; });
}

const std::string kDigest = provgate::crypto::Sha256("receipt");

void TestSignatureVerifiesAgainstHistoricalKey() {
  auto            clock = std::make_shared<ManualClock>();
  auto            trust = NewTrust(clock);
  const TimePoint t     = clock->now + 1h;

  const auto old_key_id = trust->RegisterEntity("auditor-1", SIGNER_ROLE_AUDITOR, Ed25519Key::Generate(), clock->now, t);

  clock->now    = t - 1s;
  const auto before = trust->Sign(kDigest, SIGNER_ROLE_AUDITOR);
  assert(before.key_id() == old_key_id);

  const auto new_key_id = trust->RotateKey("auditor-1", Ed25519Key::Generate(), t + 1s);
  assert(new_key_id != old_key_id);

  clock->now       = t + 2s;
  const auto after = trust->Sign(kDigest, SIGNER_ROLE_AUDITOR);
  assert(after.key_id() == new_key_id);

  // verification uses signed_at, never the current time
  assert(trust->Verify(kDigest, before));
  assert(trust->Verify(kDigest, after));

  // between the windows no key is valid
  clock->now = t + 500ms;
  bool threw = false;
  try {
    trust->Sign(kDigest, SIGNER_ROLE_AUDITOR);
  } catch (const provgate::util::SigningUnavailableError&) {
    threw = true;
  }
  assert(threw);
}

void TestBackdatedSignatureOutsideWindowFails() {
  auto clock = std::make_shared<ManualClock>();
  auto trust = NewTrust(clock);
  trust->RegisterEntity("auditor-1", SIGNER_ROLE_AUDITOR, Ed25519Key::Generate(), clock->now);

  auto signature = trust->Sign(kDigest, SIGNER_ROLE_AUDITOR);
  *signature.mutable_signed_at() = provgate::util::ToProto(clock->now - 1h);
  assert(!trust->Verify(kDigest, signature));
}

void TestTamperedInputsFail() {
  auto clock = std::make_shared<ManualClock>();
  auto trust = NewTrust(clock);
  trust->RegisterEntity("auditor-1", SIGNER_ROLE_AUDITOR, Ed25519Key::Generate(), clock->now);
  trust->RegisterEntity("owner-1", SIGNER_ROLE_MODEL_OWNER, Ed25519Key::Generate(), clock->now);

  const auto signature = trust->Sign(kDigest, SIGNER_ROLE_AUDITOR);
  assert(!trust->Verify(provgate::crypto::Sha256("other"), signature));

  auto wrong_role = signature;
  wrong_role.set_role(SIGNER_ROLE_MODEL_OWNER);
  assert(!trust->Verify(kDigest, wrong_role));

  auto wrong_entity = signature;
  wrong_entity.set_entity_id("owner-1");
  assert(!trust->Verify(kDigest, wrong_entity));

  auto flipped = signature;
  std::string value = flipped.value();
  value[0] ^= 0x01;
  flipped.set_value(value);
  assert(!trust->Verify(kDigest, flipped));
}

void TestRevokedEntityCannotSignButOldSignaturesVerify() {
  auto clock = std::make_shared<ManualClock>();
  auto trust = NewTrust(clock);
  trust->RegisterEntity("auditor-1", SIGNER_ROLE_AUDITOR, Ed25519Key::Generate(), clock->now);

  const auto before = trust->Sign(kDigest, SIGNER_ROLE_AUDITOR);
  clock->now += 1s;
  trust->Revoke("auditor-1");
  assert(trust->IsRevoked("auditor-1"));

  bool threw = false;
  try {
    trust->Sign(kDigest, SIGNER_ROLE_AUDITOR);
  } catch (const provgate::util::RevokedEntityError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    trust->SignAs("auditor-1", kDigest);
  } catch (const provgate::util::RevokedEntityError&) {
    threw = true;
  }
  assert(threw);

  assert(trust->Verify(kDigest, before));
}

void TestUnavailableSignerFallsBackThenFails() {
  auto clock = std::make_shared<ManualClock>();
  auto trust = NewTrust(clock);
  trust->RegisterEntity("operator-a", SIGNER_ROLE_PLATFORM_OPERATOR, Ed25519Key::Generate(), clock->now);
  trust->RegisterEntity("operator-b", SIGNER_ROLE_PLATFORM_OPERATOR, Ed25519Key::Generate(), clock->now);

  trust->SetAvailable("operator-a", false);
  assert(trust->Sign(kDigest, SIGNER_ROLE_PLATFORM_OPERATOR).entity_id() == "operator-b");

  trust->SetAvailable("operator-b", false);
  bool threw = false;
  try {
    trust->Sign(kDigest, SIGNER_ROLE_PLATFORM_OPERATOR);
  } catch (const provgate::util::SigningUnavailableError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    trust->Sign(kDigest, SIGNER_ROLE_REGULATOR);
  } catch (const provgate::util::SigningUnavailableError&) {
    threw = true;
  }
  assert(threw);
}

void TestThresholdCountsDistinctEntities() {
  auto clock = std::make_shared<ManualClock>();
  auto trust = NewTrust(clock);
  for (const auto* id : {"reg-1", "reg-2", "reg-3"}) {
    trust->RegisterEntity(id, SIGNER_ROLE_REGULATOR, Ed25519Key::Generate(), clock->now);
  }

  auto signatures = trust->SignThreshold(kDigest, SIGNER_ROLE_REGULATOR, 2);
  assert(signatures.size() == 2);
  assert(trust->VerifyThreshold(kDigest, signatures, SIGNER_ROLE_REGULATOR, 2));
  assert(!trust->VerifyThreshold(kDigest, signatures, SIGNER_ROLE_REGULATOR, 3));

  // the same entity twice counts once
  std::vector<provgate::v1::Signature> duplicated{signatures[0], signatures[0]};
  assert(trust->CountValid(kDigest, duplicated, SIGNER_ROLE_REGULATOR) == 1);

  trust->SetAvailable("reg-2", false);
  trust->SetAvailable("reg-3", false);
  bool threw = false;
  try {
    trust->SignThreshold(kDigest, SIGNER_ROLE_REGULATOR, 2);
  } catch (const provgate::util::SigningUnavailableError&) {
    threw = true;
  }
  assert(threw);
}

void TestExportedKeysVerifyOffline() {
  auto clock = std::make_shared<ManualClock>();
  auto trust = NewTrust(clock);
  trust->RegisterEntity("auditor-1", SIGNER_ROLE_AUDITOR, Ed25519Key::Generate(), clock->now);

  const auto signature = trust->Sign(kDigest, SIGNER_ROLE_AUDITOR);
  const auto keys      = trust->PublicKeysFor({signature});
  assert(keys.size() == 1);
  assert(keys[0].public_key().size() == 32);
  assert(TrustLayer::VerifyWithKey(keys[0], kDigest, signature));
  assert(!TrustLayer::VerifyWithKey(keys[0], provgate::crypto::Sha256("x"), signature));

  clock->now += 1s;
  trust->Revoke("auditor-1");
  const auto exported = trust->ExportPublicKeys();
  assert(exported.size() == 1);
  assert(exported[0].has_valid_until());
  assert(TrustLayer::VerifyWithKey(exported[0], kDigest, signature));
}

void TestRegistrationIsValidated() {
  auto clock = std::make_shared<ManualClock>();
  auto trust = NewTrust(clock);
  trust->RegisterEntity("auditor-1", SIGNER_ROLE_AUDITOR, Ed25519Key::Generate(), clock->now);
  assert(trust->HasEntity("auditor-1"));
  assert(!trust->HasEntity("auditor-2"));

  bool threw = false;
  try {
    trust->RegisterEntity("auditor-1", SIGNER_ROLE_AUDITOR, Ed25519Key::Generate(), clock->now);
  } catch (const provgate::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    auto public_only = Ed25519Key::FromRawPublic(Ed25519Key::Generate().PublicRaw());
    trust->RegisterEntity("auditor-2", SIGNER_ROLE_AUDITOR, public_only, clock->now);
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    trust->SignAs("nobody", kDigest);
  } catch (const provgate::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSignatureVerifiesAgainstHistoricalKey();
  TestBackdatedSignatureOutsideWindowFails();
  TestTamperedInputsFail();
  TestRevokedEntityCannotSignButOldSignaturesVerify();
  TestUnavailableSignerFallsBackThenFails();
  TestThresholdCountsDistinctEntities();
  TestExportedKeysVerifyOffline();
  TestRegistrationIsValidated();

  std::cout << "provgate_unit_trust_layer: pass\n";
  return 0;
}
