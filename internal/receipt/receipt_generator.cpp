#include "receipt_generator.hpp"

#include <algorithm>
#include <utility>

#include "internal/crypto/canonical.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/model/stage.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace provgate::receipt {

using namespace provgate::v1;
using provgate::observability::IntField;
using provgate::observability::StringField;

namespace {

template <typename Map>
void WriteSortedMap(crypto::CanonicalWriter& w, std::uint8_t tag, const Map& values) {
  std::vector<std::pair<std::string, double>> sorted;
  sorted.reserve(values.size());
  for (const auto& [key, value] : values) {
    sorted.emplace_back(key, value);
  }
  std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

  w.Uint(tag, sorted.size());
  for (const auto& [key, value] : sorted) {
    w.Bytes(tag, key).Double(tag, value);
  }
}

void WriteVerdict(crypto::CanonicalWriter& w, const GateVerdict& verdict) {
  w.Bytes(16, verdict.gate_name())
      .Int(16, verdict.stage())
      .Int(16, verdict.status())
      .Bytes(16, verdict.evidence_digest())
      .Bytes(16, verdict.error());
  WriteSortedMap(w, 16, verdict.metrics());
  WriteSortedMap(w, 16, verdict.thresholds_applied());
  w.Uint(16, verdict.recommendations_size());
  for (const auto& recommendation : verdict.recommendations()) {
    w.Bytes(16, recommendation);
  }
}

} // namespace

ReceiptGenerator::ReceiptGenerator(std::shared_ptr<trust::TrustLayer> trust, SignerRole role) : trust_(std::move(trust)), role_(role) {
  if (!trust_) {
    throw util::InvalidArgument("receipt generator requires a trust layer");
  }
}

std::string ReceiptGenerator::Digest(const Receipt& receipt) {
  crypto::CanonicalWriter w("provgate.receipt.v1");
  w.Bytes(1, receipt.receipt_id())
      .Int(2, receipt.kind())
      .Bytes(3, receipt.operation_id())
      .Bytes(4, receipt.lifecycle_id())
      .Int(5, receipt.stage())
      .Bytes(6, receipt.anchor_digest())
      .Bytes(7, receipt.evidence_digest())
      .Bytes(8, receipt.policy_id())
      .Bytes(9, receipt.policy_version())
      .Bytes(10, receipt.policy_digest())
      .Int(11, receipt.issued_at().seconds())
      .Int(12, receipt.issued_at().nanos())
      .Uint(13, receipt.sequence())
      .Int(14, receipt.aggregate_status())
      .Int(15, receipt.enforcement_action());

  w.Uint(16, receipt.verdicts_size());
  for (const auto& verdict : receipt.verdicts()) {
    WriteVerdict(w, verdict);
  }

  w.Uint(17, receipt.warnings_size());
  for (const auto& warning : receipt.warnings()) {
    w.Bytes(17, warning);
  }

  w.Bytes(18, receipt.reason())
      .Bytes(19, receipt.parent_receipt_id())
      .Int(20, receipt.review_decision())
      .Bytes(21, receipt.reviewer_id())
      .Bytes(22, receipt.rationale());

  return crypto::ToHex(w.Digest());
}

bool ReceiptGenerator::CheckDigest(const Receipt& receipt) {
  return !receipt.digest().empty() && crypto::Equal(Digest(receipt), receipt.digest());
}

bool ReceiptGenerator::Verify(const Receipt& receipt, const trust::TrustLayer& trust) {
  if (!CheckDigest(receipt) || !receipt.has_signature()) {
    return false;
  }
  return trust.Verify(crypto::FromHex(receipt.digest()), receipt.signature());
}

void ReceiptGenerator::Stamp(Receipt* receipt, const std::string& receipt_id) {
  receipt->set_receipt_id(receipt_id.empty() ? util::NewId() : receipt_id);
  *receipt->mutable_issued_at() = util::ToProto(clock_.Now());
  receipt->set_sequence(++sequence_);
}

Receipt ReceiptGenerator::Seal(const SealRequest& request) {
  if (request.operation_id.empty()) {
    throw util::InvalidArgument("receipt requires an operation id");
  }
  if (!model::IsLifecycleStage(request.stage)) {
    throw util::InvalidArgument("receipt requires a lifecycle stage");
  }
  if (request.anchor_digest.empty()) {
    throw util::InvalidArgument("receipt requires an anchor reference");
  }

  Receipt receipt;
  receipt.set_kind(RECEIPT_KIND_STAGE);
  receipt.set_operation_id(request.operation_id);
  receipt.set_lifecycle_id(request.lifecycle_id);
  receipt.set_stage(request.stage);
  receipt.set_anchor_digest(request.anchor_digest);
  receipt.set_evidence_digest(request.evidence_digest);
  receipt.set_policy_id(request.policy.id);
  receipt.set_policy_version(request.policy.version);
  receipt.set_policy_digest(request.policy.digest);
  receipt.set_aggregate_status(request.aggregate_status);
  receipt.set_enforcement_action(request.enforcement_action);
  for (const auto& verdict : request.verdicts) {
    *receipt.add_verdicts() = verdict;
  }
  for (const auto& warning : request.warnings) {
    receipt.add_warnings(warning);
  }
  receipt.set_reason(request.reason);

  Stamp(&receipt, request.receipt_id);
  receipt.set_digest(Digest(receipt));
  *receipt.mutable_signature() = trust_->Sign(crypto::FromHex(receipt.digest()), role_);

  PROVGATE_LOG_DEBUG("Sealed receipt", {StringField("receipt_id", receipt.receipt_id()), StringField("operation_id", receipt.operation_id()),
                                        StringField("stage", model::StageName(receipt.stage())),
                                        IntField("sequence", static_cast<std::int64_t>(receipt.sequence()))});
  return receipt;
}

Receipt ReceiptGenerator::Seal(const std::string& operation_id, const anchor::Anchor& anchor, const std::string& evidence_digest,
                               const std::vector<GateVerdict>& verdicts) {
  SealRequest request;
  request.operation_id    = operation_id;
  request.lifecycle_id    = anchor.lifecycle_id;
  request.stage           = anchor.stage;
  request.anchor_digest   = anchor.digest;
  request.evidence_digest = evidence_digest;
  request.verdicts        = verdicts;

  request.aggregate_status = GATE_STATUS_PASS;
  for (const auto& verdict : verdicts) {
    if (verdict.status() != GATE_STATUS_SKIPPED) {
      request.aggregate_status = model::WorstStatus(request.aggregate_status, verdict.status());
    }
  }
  return Seal(request);
}

Receipt ReceiptGenerator::SealReview(const SealRequest& subject, ReviewDecision decision, const std::string& reviewer_id,
                                     const std::string& rationale) {
  if (subject.receipt_id.empty()) {
    throw util::InvalidArgument("review requires the id of the receipt it resolves");
  }
  if (decision == REVIEW_DECISION_UNSPECIFIED) {
    throw util::InvalidArgument("review decision must be APPROVE or REJECT");
  }
  if (reviewer_id.empty()) {
    throw util::InvalidArgument("review requires a reviewer id");
  }
  const auto reviewer_role = trust_->RoleOf(reviewer_id);
  if (!reviewer_role) {
    throw util::NotFound("unknown signing entity: " + reviewer_id);
  }
  if (!trust::MayReview(*reviewer_role)) {
    throw util::InvalidArgument("entity " + reviewer_id + " with role " + SignerRole_Name(*reviewer_role) + " may not sign reviews");
  }

  Receipt receipt;
  receipt.set_kind(RECEIPT_KIND_REVIEW);
  receipt.set_operation_id(subject.operation_id);
  receipt.set_lifecycle_id(subject.lifecycle_id);
  receipt.set_stage(subject.stage);
  receipt.set_anchor_digest(subject.anchor_digest);
  receipt.set_evidence_digest(subject.evidence_digest);
  receipt.set_policy_id(subject.policy.id);
  receipt.set_policy_version(subject.policy.version);
  receipt.set_policy_digest(subject.policy.digest);
  receipt.set_aggregate_status(subject.aggregate_status);
  receipt.set_enforcement_action(decision == REVIEW_DECISION_APPROVE ? ENFORCEMENT_ACTION_ESCALATE : ENFORCEMENT_ACTION_BLOCK);
  receipt.set_parent_receipt_id(subject.receipt_id);
  receipt.set_review_decision(decision);
  receipt.set_reviewer_id(reviewer_id);
  receipt.set_rationale(rationale);

  Stamp(&receipt, {});
  receipt.set_digest(Digest(receipt));
  *receipt.mutable_signature() = trust_->SignAs(reviewer_id, crypto::FromHex(receipt.digest()));

  PROVGATE_LOG_INFO("Sealed review receipt", {StringField("receipt_id", receipt.receipt_id()), StringField("parent", subject.receipt_id),
                                              StringField("decision", ReviewDecision_Name(decision)), StringField("reviewer", reviewer_id)});
  return receipt;
}

} // namespace provgate::receipt
