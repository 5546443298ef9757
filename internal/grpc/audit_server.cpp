#include "audit_server.hpp"

#include "grpc_error.hpp"

namespace provgate::grpc {

using namespace provgate::services::v1;

AuditServer::AuditServer(std::shared_ptr<provgate::service::AuditService> svc) : service_(std::move(svc)) {
}

::grpc::Status AuditServer::QueryReceipts(::grpc::ServerContext*, const QueryReceiptsRequest* req, QueryReceiptsResponse* resp) {
  try {
    *resp = service_->QueryReceipts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuditServer::ExportProofBundle(::grpc::ServerContext*, const ExportProofBundleRequest* req,
                                              ExportProofBundleResponse* resp) {
  try {
    *resp = service_->ExportProofBundle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuditServer::VerifyProofBundle(::grpc::ServerContext*, const VerifyProofBundleRequest* req,
                                              VerifyProofBundleResponse* resp) {
  try {
    *resp = service_->VerifyProofBundle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace provgate::grpc
