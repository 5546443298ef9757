#pragma once

#include "provgate/services/v1/review_service.pb.h"
#include "service_context.hpp"

namespace provgate::service {

class ReviewService {
 public:
  explicit ReviewService(ServiceContext ctx);

  provgate::services::v1::ListPendingReviewsResponse ListPendingReviews(const provgate::services::v1::ListPendingReviewsRequest& req);

  // Throws NotFound when the review is unknown or already resolved.
  provgate::services::v1::SubmitReviewResponse SubmitReview(const provgate::services::v1::SubmitReviewRequest& req);

  provgate::services::v1::CancelReviewResponse CancelReview(const provgate::services::v1::CancelReviewRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace provgate::service
