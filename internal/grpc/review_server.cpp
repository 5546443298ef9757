#include "review_server.hpp"

#include "grpc_error.hpp"

namespace provgate::grpc {

using namespace provgate::services::v1;

ReviewServer::ReviewServer(std::shared_ptr<provgate::service::ReviewService> svc) : service_(std::move(svc)) {
}

::grpc::Status ReviewServer::ListPendingReviews(::grpc::ServerContext*, const ListPendingReviewsRequest* req,
                                                ListPendingReviewsResponse* resp) {
  try {
    *resp = service_->ListPendingReviews(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReviewServer::SubmitReview(::grpc::ServerContext*, const SubmitReviewRequest* req, SubmitReviewResponse* resp) {
  try {
    *resp = service_->SubmitReview(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReviewServer::CancelReview(::grpc::ServerContext*, const CancelReviewRequest* req, CancelReviewResponse* resp) {
  try {
    *resp = service_->CancelReview(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace provgate::grpc
