#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/anchor/anchor_chain.hpp"
#include "internal/audit/audit_trail.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/db/memory/memory_audit_log.hpp"
#include "internal/orchestrator/review_broker.hpp"
#include "internal/receipt/receipt_generator.hpp"
#include "internal/service/audit_service.hpp"
#include "internal/service/review_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace provgate::v1;
using namespace std::chrono_literals;
namespace sv1 = provgate::services::v1;

struct Harness {
  provgate::service::ServiceContext                    ctx;
  std::shared_ptr<provgate::receipt::ReceiptGenerator> generator;
  provgate::anchor::AnchorChain                        chain{"lifecycle-1", "0123456789abcdef0123456789abcdef"};

  Harness() {
    ctx.trust = std::make_shared<provgate::trust::TrustLayer>();
    ctx.trust->RegisterEntity("operator-1", SIGNER_ROLE_PLATFORM_OPERATOR, provgate::crypto::Ed25519Key::Generate(),
                              provgate::util::TimePoint{});
    ctx.trust->RegisterEntity("auditor-1", SIGNER_ROLE_AUDITOR, provgate::crypto::Ed25519Key::Generate(), provgate::util::TimePoint{});

    auto batcher = std::make_shared<provgate::merkle::MerkleBatcher>(ctx.trust, provgate::merkle::BatchWindow{100, 1h},
                                                                     provgate::merkle::RootSigning{});
    ctx.audit    = std::make_shared<provgate::audit::AuditTrail>(std::make_shared<provgate::db::memory::MemoryAuditLog>(), batcher, ctx.trust);
    ctx.reviews  = std::make_shared<provgate::orchestrator::ReviewBroker>();
    generator    = std::make_shared<provgate::receipt::ReceiptGenerator>(ctx.trust, SIGNER_ROLE_PLATFORM_OPERATOR);
  }

  Receipt Append(const std::string& operation_id, Stage stage) {
    auto receipt = generator->Seal(operation_id, chain.Derive(stage, "salt"), "", {});
    ctx.audit->Append(receipt);
    return receipt;
  }
};

void TestQueryReceipts() {
  Harness h;
  provgate::service::AuditService service(h.ctx);

  const auto dataset = h.Append("op-1", STAGE_DATASET);
  h.Append("op-2", STAGE_DATASET);
  const auto model = h.Append("op-1", STAGE_MODEL);

  sv1::QueryReceiptsRequest req;
  req.set_operation_id("op-1");
  auto resp = service.QueryReceipts(req);
  assert(resp.receipts_size() == 2);
  assert(resp.receipts(0).receipt_id() == dataset.receipt_id());
  assert(resp.receipts(1).receipt_id() == model.receipt_id());

  req.set_stage(STAGE_MODEL);
  resp = service.QueryReceipts(req);
  assert(resp.receipts_size() == 1);

  sv1::QueryReceiptsRequest limited;
  limited.set_limit(2);
  assert(service.QueryReceipts(limited).receipts_size() == 2);

  sv1::QueryReceiptsRequest reversed;
  *reversed.mutable_from() = model.issued_at();
  *reversed.mutable_to()   = dataset.issued_at();
  bool threw               = false;
  try {
    service.QueryReceipts(reversed);
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestExportAndVerify() {
  Harness h;
  provgate::service::AuditService service(h.ctx);
  h.Append("op-1", STAGE_DATASET);
  h.Append("op-1", STAGE_MODEL);

  sv1::ExportProofBundleRequest export_req;
  export_req.set_operation_id("op-1");
  const auto exported = service.ExportProofBundle(export_req);
  assert(exported.bundles_size() == 2);

  sv1::VerifyProofBundleRequest verify_req;
  *verify_req.mutable_bundle() = exported.bundles(1);
  auto verified                = service.VerifyProofBundle(verify_req);
  assert(verified.valid());
  assert(verified.reason().empty());

  verify_req.mutable_bundle()->mutable_receipt()->set_operation_id("op-9");
  verified = service.VerifyProofBundle(verify_req);
  assert(!verified.valid());
  assert(!verified.reason().empty());

  bool threw = false;
  try {
    service.ExportProofBundle(sv1::ExportProofBundleRequest{});
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    service.VerifyProofBundle(sv1::VerifyProofBundleRequest{});
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  export_req.set_operation_id("op-unknown");
  threw = false;
  try {
    service.ExportProofBundle(export_req);
  } catch (const provgate::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestReviewLifecycle() {
  Harness h;
  provgate::service::ReviewService service(h.ctx);

  provgate::orchestrator::ReviewRequest request;
  request.operation_id = "op-1";
  request.stage        = STAGE_MODEL;
  request.receipt_id   = "receipt-1";
  request.reason       = "gate robustness returned REVIEW";
  const auto first     = h.ctx.reviews->Open(request);
  request.operation_id = "op-2";
  const auto second    = h.ctx.reviews->Open(request);

  sv1::ListPendingReviewsRequest list;
  assert(service.ListPendingReviews(list).reviews_size() == 2);
  list.set_operation_id("op-1");
  const auto pending = service.ListPendingReviews(list);
  assert(pending.reviews_size() == 1);
  assert(pending.reviews(0).review_id() == first);
  assert(pending.reviews(0).receipt_id() == "receipt-1");
  assert(pending.reviews(0).stage() == STAGE_MODEL);

  sv1::SubmitReviewRequest submit;
  submit.set_review_id(first);
  submit.set_decision(REVIEW_DECISION_APPROVE);
  submit.set_reviewer_id("nobody");

  bool threw = false;
  try {
    service.SubmitReview(submit);
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  // the platform operator signs stage receipts but may not review them
  submit.set_reviewer_id("operator-1");
  threw = false;
  try {
    service.SubmitReview(submit);
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(service.ListPendingReviews({}).reviews_size() == 2);

  submit.set_reviewer_id("auditor-1");
  submit.set_rationale("reviewed metrics");
  assert(service.SubmitReview(submit).accepted());

  const auto outcome = h.ctx.reviews->Await(first, 1s);
  assert(outcome.kind == provgate::orchestrator::ReviewOutcome::Kind::kDecided);
  assert(outcome.reviewer_id == "auditor-1");

  threw = false;
  try {
    service.SubmitReview(submit);
  } catch (const provgate::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  sv1::CancelReviewRequest cancel;
  cancel.set_review_id(second);
  cancel.set_reason("superseded");
  assert(service.CancelReview(cancel).cancelled());
  assert(!service.CancelReview(cancel).cancelled());

  threw = false;
  try {
    service.CancelReview(sv1::CancelReviewRequest{});
  } catch (const provgate::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestQueryReceipts();
  TestExportAndVerify();
  TestReviewLifecycle();

  std::cout << "provgate_unit_service: pass\n";
  return 0;
}
