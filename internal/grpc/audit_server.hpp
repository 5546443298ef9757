#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/audit_service.hpp"
#include "provgate/services/v1/audit_service.grpc.pb.h"

namespace provgate::grpc {

class AuditServer final : public provgate::services::v1::AuditService::Service {
 public:
  explicit AuditServer(std::shared_ptr<provgate::service::AuditService> svc);

  ::grpc::Status QueryReceipts(::grpc::ServerContext*, const provgate::services::v1::QueryReceiptsRequest*,
                               provgate::services::v1::QueryReceiptsResponse*) override;

  ::grpc::Status ExportProofBundle(::grpc::ServerContext*, const provgate::services::v1::ExportProofBundleRequest*,
                                   provgate::services::v1::ExportProofBundleResponse*) override;

  ::grpc::Status VerifyProofBundle(::grpc::ServerContext*, const provgate::services::v1::VerifyProofBundleRequest*,
                                   provgate::services::v1::VerifyProofBundleResponse*) override;

 private:
  std::shared_ptr<provgate::service::AuditService> service_;
};

} // namespace provgate::grpc
