#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/audit/audit_trail.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/db/memory/memory_audit_log.hpp"
#include "internal/grpc/audit_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/review_server.hpp"
#include "internal/orchestrator/review_broker.hpp"
#include "internal/service/audit_service.hpp"
#include "internal/service/review_service.hpp"
#include "internal/service/service_context.hpp"

namespace {

using namespace std::chrono_literals;
namespace sv1 = provgate::services::v1;

provgate::service::ServiceContext BuildServiceContext() {
  provgate::service::ServiceContext ctx;
  ctx.trust = std::make_shared<provgate::trust::TrustLayer>();
  ctx.trust->RegisterEntity("operator-1", provgate::v1::SIGNER_ROLE_PLATFORM_OPERATOR, provgate::crypto::Ed25519Key::Generate(),
                            provgate::util::TimePoint{});
  auto batcher = std::make_shared<provgate::merkle::MerkleBatcher>(ctx.trust, provgate::merkle::BatchWindow{10, 1h},
                                                                   provgate::merkle::RootSigning{});
  ctx.audit    = std::make_shared<provgate::audit::AuditTrail>(std::make_shared<provgate::db::memory::MemoryAuditLog>(), batcher, ctx.trust);
  ctx.reviews  = std::make_shared<provgate::orchestrator::ReviewBroker>();
  return ctx;
}

void TestExportUnknownOperationReturnsNotFound() {
  provgate::grpc::AuditServer server(std::make_shared<provgate::service::AuditService>(BuildServiceContext()));

  sv1::ExportProofBundleRequest req;
  req.set_operation_id("missing-operation");
  sv1::ExportProofBundleResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  const auto status = server.ExportProofBundle(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestMissingBundleReturnsInvalidArgument() {
  provgate::grpc::AuditServer server(std::make_shared<provgate::service::AuditService>(BuildServiceContext()));

  sv1::VerifyProofBundleRequest  req;
  sv1::VerifyProofBundleResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  const auto status = server.VerifyProofBundle(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestReviewRoundTripThroughServer() {
  auto ctx = BuildServiceContext();
  ctx.trust->RegisterEntity("auditor-1", provgate::v1::SIGNER_ROLE_AUDITOR, provgate::crypto::Ed25519Key::Generate(),
                            provgate::util::TimePoint{});
  provgate::grpc::ReviewServer server(std::make_shared<provgate::service::ReviewService>(ctx));

  provgate::orchestrator::ReviewRequest request;
  request.operation_id = "op-1";
  request.stage        = provgate::v1::STAGE_DEPLOYMENT;
  request.receipt_id   = "receipt-1";
  const auto review_id = ctx.reviews->Open(request);

  ::grpc::ServerContext          list_ctx;
  sv1::ListPendingReviewsRequest list_req;
  sv1::ListPendingReviewsResponse list_resp;
  assert(server.ListPendingReviews(&list_ctx, &list_req, &list_resp).ok());
  assert(list_resp.reviews_size() == 1);

  sv1::SubmitReviewRequest submit;
  submit.set_review_id(review_id);
  submit.set_decision(provgate::v1::REVIEW_DECISION_REJECT);
  submit.set_reviewer_id("auditor-1");
  sv1::SubmitReviewResponse submit_resp;
  ::grpc::ServerContext     submit_ctx;
  assert(server.SubmitReview(&submit_ctx, &submit, &submit_resp).ok());
  assert(submit_resp.accepted());
  assert(ctx.reviews->Await(review_id, 1s).decision == provgate::v1::REVIEW_DECISION_REJECT);

  // already resolved
  ::grpc::ServerContext again_ctx;
  assert(server.SubmitReview(&again_ctx, &submit, &submit_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestErrorMapping() {
  using provgate::grpc::ToStatus;
  namespace util = provgate::util;

  assert(ToStatus(util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(util::InvalidParentError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(util::PolicyViolationError("x", {})).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(util::RevokedEntityError("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(util::SigningUnavailableError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(util::ProofVerificationError("x")).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(util::StageAbortedError("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestExportUnknownOperationReturnsNotFound();
  TestMissingBundleReturnsInvalidArgument();
  TestReviewRoundTripThroughServer();
  TestErrorMapping();

  std::cout << "provgate_unit_grpc_status: pass\n";
  return 0;
}
