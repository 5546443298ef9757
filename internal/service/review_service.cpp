#include "review_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/orchestrator/review_broker.hpp"
#include "internal/trust/trust_layer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace provgate::service {

using namespace provgate::services::v1;
using provgate::observability::StringField;

ReviewService::ReviewService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListPendingReviewsResponse ReviewService::ListPendingReviews(const ListPendingReviewsRequest& req) {
  ListPendingReviewsResponse resp;
  for (const auto& pending : ctx_.reviews->Pending()) {
    if (!req.operation_id().empty() && pending.operation_id != req.operation_id()) {
      continue;
    }

    auto* review = resp.add_reviews();
    review->set_review_id(pending.review_id);
    review->set_operation_id(pending.operation_id);
    review->set_lifecycle_id(pending.lifecycle_id);
    review->set_stage(pending.stage);
    review->set_receipt_id(pending.receipt_id);
    review->set_reason(pending.reason);
    for (const auto& verdict : pending.verdicts) {
      *review->add_verdicts() = verdict;
    }
    *review->mutable_requested_at() = util::ToProto(pending.requested_at);
  }
  return resp;
}

SubmitReviewResponse ReviewService::SubmitReview(const SubmitReviewRequest& req) {
  if (req.review_id().empty()) {
    throw util::InvalidArgument("review_id is required");
  }
  // reject unknown reviewers here rather than after the orchestrator resumes
  if (ctx_.trust) {
    const auto role = ctx_.trust->RoleOf(req.reviewer_id());
    if (!role) {
      throw util::InvalidArgument("unknown reviewer entity: " + req.reviewer_id());
    }
    if (!trust::MayReview(*role)) {
      throw util::InvalidArgument("entity " + req.reviewer_id() + " may not sign reviews");
    }
  }

  if (!ctx_.reviews->Decide(req.review_id(), req.decision(), req.reviewer_id(), req.rationale())) {
    throw util::NotFound("no pending review: " + req.review_id());
  }

  PROVGATE_LOG_INFO("Review submitted", {StringField("review_id", req.review_id()), StringField("reviewer", req.reviewer_id()),
                                         StringField("decision", provgate::core::v1::ReviewDecision_Name(req.decision()))});

  SubmitReviewResponse resp;
  resp.set_accepted(true);
  return resp;
}

CancelReviewResponse ReviewService::CancelReview(const CancelReviewRequest& req) {
  if (req.review_id().empty()) {
    throw util::InvalidArgument("review_id is required");
  }

  CancelReviewResponse resp;
  resp.set_cancelled(ctx_.reviews->Cancel(req.review_id(), req.reason()));
  return resp;
}

} // namespace provgate::service
