#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "signing_entity.hpp"

namespace provgate::trust {

/*
  Trust/signing layer.

  Holds the signing entities, their key history and the revocation set.
  Passed explicitly (by reference or shared_ptr) to every component that
  signs or verifies; there is no global key registry.

  Signatures embed their signing time and key id. Verification resolves the
  key that was valid at that time, so signatures made before a rotation or a
  revocation remain verifiable.
*/
class TrustLayer {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit TrustLayer(ClockFn clock = util::Now);

  TrustLayer(const TrustLayer&)            = delete;
  TrustLayer& operator=(const TrustLayer&) = delete;

  // Returns the key id of the initial key.
  std::string RegisterEntity(const std::string& entity_id, provgate::v1::SignerRole role, crypto::Ed25519Key key, util::TimePoint valid_from,
                             std::optional<util::TimePoint> valid_until = std::nullopt);

  /*
    Activates new_key at effective_at. The current key stays valid until
    effective_at + overlap, so in-flight signatures near the boundary still
    resolve to the right historical key. Returns the new key id.
  */
  std::string RotateKey(const std::string& entity_id, crypto::Ed25519Key new_key, util::TimePoint effective_at,
                        std::chrono::milliseconds overlap = std::chrono::milliseconds(0));

  void Revoke(const std::string& entity_id);
  bool IsRevoked(const std::string& entity_id) const;
  bool HasEntity(const std::string& entity_id) const;

  std::optional<provgate::v1::SignerRole> RoleOf(const std::string& entity_id) const;

  // Marks an entity's key store reachable or not (e.g. HSM offline).
  void SetAvailable(const std::string& entity_id, bool available);

  /*
    Signs with the first usable entity (ordered by id) holding `role`.

    Throws SigningUnavailableError when no entity is currently usable and
    RevokedEntityError when every entity of the role is revoked.
  */
  provgate::v1::Signature Sign(const std::string& digest, provgate::v1::SignerRole role);

  // Signs as a specific entity (human reviewers).
  provgate::v1::Signature SignAs(const std::string& entity_id, const std::string& digest);

  /*
    Collects signatures from `threshold` distinct entities of `role`.
    All or nothing: fewer usable entities throws SigningUnavailableError.
  */
  std::vector<provgate::v1::Signature> SignThreshold(const std::string& digest, provgate::v1::SignerRole role, uint32_t threshold);

  bool Verify(const std::string& digest, const provgate::v1::Signature& signature) const;

  // Number of distinct entities with a valid signature over digest for role.
  uint32_t CountValid(const std::string& digest, const std::vector<provgate::v1::Signature>& signatures, provgate::v1::SignerRole role) const;

  bool VerifyThreshold(const std::string& digest, const std::vector<provgate::v1::Signature>& signatures, provgate::v1::SignerRole role,
                       uint32_t threshold) const;

  std::vector<provgate::v1::PublicKeyRecord> ExportPublicKeys() const;
  std::vector<provgate::v1::PublicKeyRecord> PublicKeysFor(const std::vector<provgate::v1::Signature>& signatures) const;

  std::vector<std::string> EntitiesWithRole(provgate::v1::SignerRole role) const;

  // Bytes actually signed: envelope (entity, key, role, time) || digest.
  static std::string SignedPayload(const provgate::v1::Signature& signature, const std::string& digest);

  // Offline check against an exported public key record.
  static bool VerifyWithKey(const provgate::v1::PublicKeyRecord& key, const std::string& digest, const provgate::v1::Signature& signature);

 private:
  std::shared_ptr<SigningEntity> Find(const std::string& entity_id) const;

  // caller holds entity.mutex
  provgate::v1::Signature SignLocked(SigningEntity& entity, const std::string& digest);

  static std::string KeyIdFor(const crypto::Ed25519Key& key);

  ClockFn clock_;

  mutable std::shared_mutex                              mutex_;
  std::map<std::string, std::shared_ptr<SigningEntity>> entities_;
};

// Roles allowed to sign a human review decision.
bool MayReview(provgate::v1::SignerRole role);

} // namespace provgate::trust
