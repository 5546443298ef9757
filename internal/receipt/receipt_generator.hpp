#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "internal/anchor/anchor.hpp"
#include "internal/trust/trust_layer.hpp"
#include "internal/util/time.hpp"
#include "provgate/v1.hpp"

namespace provgate::receipt {

// Policy identity recorded in every receipt.
struct PolicyRef {
  std::string id;
  std::string version;
  std::string digest;
};

struct SealRequest {
  // generated when empty; preassigned so a review can reference it
  std::string         receipt_id;
  std::string         operation_id;
  std::string         lifecycle_id;
  provgate::v1::Stage stage = provgate::v1::STAGE_UNSPECIFIED;
  std::string         anchor_digest;
  std::string         evidence_digest;
  PolicyRef           policy;

  std::vector<provgate::v1::GateVerdict> verdicts;
  provgate::v1::GateStatus               aggregate_status = provgate::v1::GATE_STATUS_UNSPECIFIED;
  provgate::v1::EnforcementAction        enforcement_action = provgate::v1::ENFORCEMENT_ACTION_UNSPECIFIED;
  std::vector<std::string>               warnings;
  std::string                            reason;
};

/*
  Receipt generator.

  Assigns id, timestamp and sequence, computes the canonical digest and asks
  the trust layer for a signature. SigningUnavailableError and
  RevokedEntityError propagate unchanged; retrying is the caller's decision.

  All receipts from one generator share a MonotonicUtcClock, so issued_at never
  goes backwards across the stages of a lifecycle.
*/
class ReceiptGenerator {
 public:
  ReceiptGenerator(std::shared_ptr<trust::TrustLayer> trust, provgate::v1::SignerRole role);

  provgate::v1::Receipt Seal(const SealRequest& request);

  // Minimal form: verdict summary only, no policy context.
  provgate::v1::Receipt Seal(const std::string& operation_id, const anchor::Anchor& anchor, const std::string& evidence_digest,
                             const std::vector<provgate::v1::GateVerdict>& verdicts);

  /*
    Human decision on an escalated stage, signed by the reviewer's own
    entity. `subject` is the stage receipt request the review resolves; its
    receipt_id becomes the review's parent_receipt_id.

    Only AUDITOR and REGULATOR entities may review: an unknown reviewer
    throws NotFound, any other role InvalidArgument.
  */
  provgate::v1::Receipt SealReview(const SealRequest& subject, provgate::v1::ReviewDecision decision, const std::string& reviewer_id,
                                   const std::string& rationale);

  // Hex SHA-256 over the canonical encoding. Ignores digest and signature.
  static std::string Digest(const provgate::v1::Receipt& receipt);

  // Recomputed digest matches the stored one.
  static bool CheckDigest(const provgate::v1::Receipt& receipt);

  // Digest check plus signature check against the trust layer.
  static bool Verify(const provgate::v1::Receipt& receipt, const trust::TrustLayer& trust);

 private:
  void Stamp(provgate::v1::Receipt* receipt, const std::string& receipt_id);

  std::shared_ptr<trust::TrustLayer> trust_;
  provgate::v1::SignerRole           role_;
  util::MonotonicUtcClock            clock_;
  std::atomic<uint64_t>              sequence_{0};
};

} // namespace provgate::receipt
