#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/review_service.hpp"
#include "provgate/services/v1/review_service.grpc.pb.h"

namespace provgate::grpc {

class ReviewServer final : public provgate::services::v1::ReviewService::Service {
 public:
  explicit ReviewServer(std::shared_ptr<provgate::service::ReviewService> svc);

  ::grpc::Status ListPendingReviews(::grpc::ServerContext*, const provgate::services::v1::ListPendingReviewsRequest*,
                                    provgate::services::v1::ListPendingReviewsResponse*) override;

  ::grpc::Status SubmitReview(::grpc::ServerContext*, const provgate::services::v1::SubmitReviewRequest*,
                              provgate::services::v1::SubmitReviewResponse*) override;

  ::grpc::Status CancelReview(::grpc::ServerContext*, const provgate::services::v1::CancelReviewRequest*,
                              provgate::services::v1::CancelReviewResponse*) override;

 private:
  std::shared_ptr<provgate::service::ReviewService> service_;
};

} // namespace provgate::grpc
