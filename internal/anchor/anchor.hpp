#pragma once

#include <string>

#include "internal/util/time.hpp"
#include "provgate/v1.hpp"

namespace provgate::anchor {

/*
  Stage-scoped commitment.

  `value` is secret material: whoever holds it can derive every later stage.
  Only `digest` (hex SHA-256 of value) is ever published in receipts.
  The root anchor has stage STAGE_UNSPECIFIED and no parent.
*/
struct Anchor {
  std::string             lifecycle_id;
  provgate::v1::Stage     stage = provgate::v1::STAGE_UNSPECIFIED;
  std::string             value;
  std::string             digest;
  std::string             parent_digest;
  std::string             salt;
  std::string             nonce;
  util::TimePoint         created_at{};
};

} // namespace provgate::anchor
