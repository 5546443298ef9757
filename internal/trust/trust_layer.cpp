#include "trust_layer.hpp"

#include <set>

#include "internal/crypto/canonical.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace provgate::trust {

using namespace provgate::v1;
using provgate::observability::StringField;

TrustLayer::TrustLayer(ClockFn clock) : clock_(std::move(clock)) {
}

std::string TrustLayer::KeyIdFor(const crypto::Ed25519Key& key) {
  return crypto::Sha256Hex(key.PublicRaw()).substr(0, 16);
}

std::shared_ptr<SigningEntity> TrustLayer::Find(const std::string& entity_id) const {
  std::shared_lock lock(mutex_);
  auto             it = entities_.find(entity_id);
  if (it == entities_.end()) {
    return nullptr;
  }
  return it->second;
}

// ------------------------------------------------------------
// Entity management
// ------------------------------------------------------------

std::string TrustLayer::RegisterEntity(const std::string& entity_id, SignerRole role, crypto::Ed25519Key key, util::TimePoint valid_from,
                                       std::optional<util::TimePoint> valid_until) {
  if (entity_id.empty()) {
    throw util::InvalidArgument("signing entity id must not be empty");
  }
  if (role == SIGNER_ROLE_UNSPECIFIED) {
    throw util::InvalidArgument("signing entity " + entity_id + " has no role");
  }
  if (!key.HasPrivate()) {
    throw util::InvalidArgument("signing entity " + entity_id + " requires a private key");
  }

  auto entity  = std::make_shared<SigningEntity>();
  entity->id   = entity_id;
  entity->role = role;

  const auto key_id = KeyIdFor(key);
  entity->keys.push_back(KeyVersion{key_id, std::move(key), valid_from, valid_until});

  std::unique_lock lock(mutex_);
  if (!entities_.emplace(entity_id, std::move(entity)).second) {
    throw util::AlreadyExists("signing entity already registered: " + entity_id);
  }

  PROVGATE_LOG_INFO("Registered signing entity", {StringField("entity_id", entity_id), StringField("key_id", key_id)});
  return key_id;
}

std::string TrustLayer::RotateKey(const std::string& entity_id, crypto::Ed25519Key new_key, util::TimePoint effective_at,
                                  std::chrono::milliseconds overlap) {
  auto entity = Find(entity_id);
  if (!entity) {
    throw util::NotFound("unknown signing entity: " + entity_id);
  }
  if (!new_key.HasPrivate()) {
    throw util::InvalidArgument("rotation requires a private key");
  }

  std::lock_guard lock(entity->mutex);
  if (entity->revoked) {
    throw util::RevokedEntityError("cannot rotate revoked entity " + entity_id);
  }

  auto& current = entity->keys.back();
  if (effective_at <= current.valid_from) {
    throw util::InvalidArgument("rotation time must follow the current key's activation");
  }
  const auto retire_at = effective_at + std::chrono::duration_cast<util::Clock::duration>(overlap);
  if (!current.valid_until || *current.valid_until > retire_at) {
    current.valid_until = retire_at;
  }

  const auto key_id = KeyIdFor(new_key);
  entity->keys.push_back(KeyVersion{key_id, std::move(new_key), effective_at, std::nullopt});

  PROVGATE_LOG_INFO("Rotated signing key", {StringField("entity_id", entity_id), StringField("key_id", key_id),
                                            StringField("effective_at", util::FormatUtc(effective_at))});
  return key_id;
}

void TrustLayer::Revoke(const std::string& entity_id) {
  auto entity = Find(entity_id);
  if (!entity) {
    throw util::NotFound("unknown signing entity: " + entity_id);
  }

  std::lock_guard lock(entity->mutex);
  if (!entity->revoked) {
    entity->revoked    = true;
    entity->revoked_at = clock_();
    PROVGATE_LOG_WARN("Revoked signing entity", {StringField("entity_id", entity_id)});
  }
}

bool TrustLayer::IsRevoked(const std::string& entity_id) const {
  auto entity = Find(entity_id);
  if (!entity) {
    return false;
  }
  std::lock_guard lock(entity->mutex);
  return entity->revoked;
}

bool TrustLayer::HasEntity(const std::string& entity_id) const {
  return Find(entity_id) != nullptr;
}

std::optional<SignerRole> TrustLayer::RoleOf(const std::string& entity_id) const {
  auto entity = Find(entity_id);
  if (!entity) {
    return std::nullopt;
  }
  return entity->role;
}

void TrustLayer::SetAvailable(const std::string& entity_id, bool available) {
  auto entity = Find(entity_id);
  if (!entity) {
    throw util::NotFound("unknown signing entity: " + entity_id);
  }
  std::lock_guard lock(entity->mutex);
  entity->available = available;
}

std::vector<std::string> TrustLayer::EntitiesWithRole(SignerRole role) const {
  std::vector<std::string> out;
  std::shared_lock         lock(mutex_);
  for (const auto& [id, entity] : entities_) {
    if (entity->role == role) {
      out.push_back(id);
    }
  }
  return out;
}

// ------------------------------------------------------------
// Signing
// ------------------------------------------------------------

std::string TrustLayer::SignedPayload(const Signature& signature, const std::string& digest) {
  crypto::CanonicalWriter w("provgate.sig.v1");
  w.Bytes(1, signature.entity_id())
      .Bytes(2, signature.key_id())
      .Int(3, signature.role())
      .Int(4, signature.signed_at().seconds())
      .Int(5, signature.signed_at().nanos())
      .Bytes(6, digest);
  return w.Encoded();
}

Signature TrustLayer::SignLocked(SigningEntity& entity, const std::string& digest) {
  if (entity.revoked) {
    throw util::RevokedEntityError("signing entity " + entity.id + " is revoked");
  }
  if (!entity.available) {
    throw util::SigningUnavailableError("signing entity " + entity.id + " is unavailable");
  }

  const auto now = clock_();
  const auto key = entity.KeyValidAt(now);
  if (!key) {
    throw util::SigningUnavailableError("signing entity " + entity.id + " has no key valid at " + util::FormatUtc(now));
  }

  Signature signature;
  signature.set_entity_id(entity.id);
  signature.set_key_id(key->key_id);
  signature.set_role(entity.role);
  *signature.mutable_signed_at() = util::ToProto(now);
  signature.set_value(key->key.Sign(SignedPayload(signature, digest)));
  return signature;
}

Signature TrustLayer::SignAs(const std::string& entity_id, const std::string& digest) {
  auto entity = Find(entity_id);
  if (!entity) {
    throw util::NotFound("unknown signing entity: " + entity_id);
  }
  std::lock_guard lock(entity->mutex);
  return SignLocked(*entity, digest);
}

Signature TrustLayer::Sign(const std::string& digest, SignerRole role) {
  const auto candidates = EntitiesWithRole(role);
  bool       all_revoked = !candidates.empty();
  std::string last_error = "no signing entity holds role " + SignerRole_Name(role);

  for (const auto& id : candidates) {
    auto entity = Find(id);
    if (!entity) continue;

    std::lock_guard lock(entity->mutex);
    try {
      return SignLocked(*entity, digest);
    } catch (const util::RevokedEntityError& e) {
      last_error = e.what();
    } catch (const util::SigningUnavailableError& e) {
      all_revoked = false;
      last_error  = e.what();
    }
  }

  if (all_revoked) {
    throw util::RevokedEntityError(last_error);
  }
  throw util::SigningUnavailableError(last_error);
}

std::vector<Signature> TrustLayer::SignThreshold(const std::string& digest, SignerRole role, uint32_t threshold) {
  if (threshold == 0) {
    throw util::InvalidArgument("signature threshold must be at least 1");
  }

  std::vector<Signature> signatures;
  for (const auto& id : EntitiesWithRole(role)) {
    if (signatures.size() >= threshold) break;

    auto entity = Find(id);
    if (!entity) continue;

    std::lock_guard lock(entity->mutex);
    try {
      signatures.push_back(SignLocked(*entity, digest));
    } catch (const util::RevokedEntityError&) {
      continue;
    } catch (const util::SigningUnavailableError&) {
      continue;
    }
  }

  if (signatures.size() < threshold) {
    throw util::SigningUnavailableError("only " + std::to_string(signatures.size()) + " of " + std::to_string(threshold) + " " +
                                        SignerRole_Name(role) + " signatures available");
  }
  return signatures;
}

// ------------------------------------------------------------
// Verification
// ------------------------------------------------------------

bool TrustLayer::Verify(const std::string& digest, const Signature& signature) const {
  auto entity = Find(signature.entity_id());
  if (!entity) {
    return false;
  }

  std::lock_guard lock(entity->mutex);
  if (signature.role() != entity->role) {
    return false;
  }

  const auto* key = entity->FindKey(signature.key_id());
  if (!key) {
    return false;
  }

  const auto signed_at = util::FromProto(signature.signed_at());
  if (!key->ValidAt(signed_at)) {
    return false;
  }
  if (entity->revoked_at && signed_at > *entity->revoked_at) {
    return false;
  }

  return key->key.Verify(SignedPayload(signature, digest), signature.value());
}

uint32_t TrustLayer::CountValid(const std::string& digest, const std::vector<Signature>& signatures, SignerRole role) const {
  std::set<std::string> entities;
  for (const auto& signature : signatures) {
    if (signature.role() == role && Verify(digest, signature)) {
      entities.insert(signature.entity_id());
    }
  }
  return static_cast<uint32_t>(entities.size());
}

bool TrustLayer::VerifyThreshold(const std::string& digest, const std::vector<Signature>& signatures, SignerRole role, uint32_t threshold) const {
  return threshold > 0 && CountValid(digest, signatures, role) >= threshold;
}

bool TrustLayer::VerifyWithKey(const PublicKeyRecord& key, const std::string& digest, const Signature& signature) {
  if (key.entity_id() != signature.entity_id() || key.key_id() != signature.key_id() || key.role() != signature.role()) {
    return false;
  }

  const auto signed_at = util::FromProto(signature.signed_at());
  if (signed_at < util::FromProto(key.valid_from())) {
    return false;
  }
  if (key.has_valid_until() && signed_at > util::FromProto(key.valid_until())) {
    return false;
  }

  try {
    return crypto::VerifyEd25519(key.public_key(), SignedPayload(signature, digest), signature.value());
  } catch (const std::exception& e) {
    PROVGATE_LOG_WARN("Rejected malformed public key", {StringField("key_id", key.key_id()), StringField("error", e.what())});
    return false;
  }
}

// ------------------------------------------------------------
// Export
// ------------------------------------------------------------

namespace {

PublicKeyRecord ToRecord(const SigningEntity& entity, const KeyVersion& key) {
  PublicKeyRecord record;
  record.set_entity_id(entity.id);
  record.set_key_id(key.key_id);
  record.set_role(entity.role);
  record.set_public_key(key.key.PublicRaw());
  *record.mutable_valid_from() = util::ToProto(key.valid_from);

  std::optional<util::TimePoint> until = key.valid_until;
  if (entity.revoked_at && (!until || *entity.revoked_at < *until)) {
    until = entity.revoked_at;
  }
  if (until) {
    *record.mutable_valid_until() = util::ToProto(*until);
  }
  return record;
}

} // namespace

std::vector<PublicKeyRecord> TrustLayer::ExportPublicKeys() const {
  std::vector<std::shared_ptr<SigningEntity>> entities;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, entity] : entities_) {
      entities.push_back(entity);
    }
  }

  std::vector<PublicKeyRecord> out;
  for (const auto& entity : entities) {
    std::lock_guard lock(entity->mutex);
    for (const auto& key : entity->keys) {
      out.push_back(ToRecord(*entity, key));
    }
  }
  return out;
}

std::vector<PublicKeyRecord> TrustLayer::PublicKeysFor(const std::vector<Signature>& signatures) const {
  std::vector<PublicKeyRecord> out;
  std::set<std::string>        seen;
  for (const auto& signature : signatures) {
    if (!seen.insert(signature.entity_id() + "/" + signature.key_id()).second) continue;

    auto entity = Find(signature.entity_id());
    if (!entity) continue;

    std::lock_guard lock(entity->mutex);
    if (const auto* key = entity->FindKey(signature.key_id())) {
      out.push_back(ToRecord(*entity, *key));
    }
  }
  return out;
}

bool MayReview(SignerRole role) {
  return role == provgate::v1::SIGNER_ROLE_AUDITOR || role == provgate::v1::SIGNER_ROLE_REGULATOR;
}

} // namespace provgate::trust
