#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/crypto/ed25519.hpp"
#include "internal/util/time.hpp"
#include "provgate/v1.hpp"

namespace provgate::trust {

/*
  One key generation of an entity. valid_until is inclusive; an open window
  has no value.
*/
struct KeyVersion {
  std::string                     key_id;
  crypto::Ed25519Key              key;
  util::TimePoint                 valid_from{};
  std::optional<util::TimePoint>  valid_until;

  bool ValidAt(util::TimePoint t) const {
    return t >= valid_from && (!valid_until || t <= *valid_until);
  }
};

/*
  Signing entity state.

  `mutex` serializes every signature made with this entity's keys and guards
  the mutable flags; distinct entities sign in parallel.
*/
struct SigningEntity {
  std::string              id;
  provgate::v1::SignerRole role = provgate::v1::SIGNER_ROLE_UNSPECIFIED;
  std::vector<KeyVersion>  keys;

  bool                           revoked = false;
  std::optional<util::TimePoint> revoked_at;
  bool                           available = true;

  mutable std::mutex mutex;

  const KeyVersion* KeyValidAt(util::TimePoint t) const {
    // newest first so an overlapping successor wins
    for (auto it = keys.rbegin(); it != keys.rend(); ++it) {
      if (it->ValidAt(t)) return &*it;
    }
    return nullptr;
  }

  const KeyVersion* FindKey(const std::string& key_id) const {
    for (const auto& key : keys) {
      if (key.key_id == key_id) return &key;
    }
    return nullptr;
  }
};

} // namespace provgate::trust
