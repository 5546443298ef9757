#pragma once

#include "provgate/services/v1/audit_service.pb.h"
#include "service_context.hpp"

namespace provgate::service {

class AuditService {
 public:
  explicit AuditService(ServiceContext ctx);

  provgate::services::v1::QueryReceiptsResponse QueryReceipts(const provgate::services::v1::QueryReceiptsRequest& req);

  provgate::services::v1::ExportProofBundleResponse ExportProofBundle(const provgate::services::v1::ExportProofBundleRequest& req);

  // Offline check: uses only the bundle, never the local trust layer.
  provgate::services::v1::VerifyProofBundleResponse VerifyProofBundle(const provgate::services::v1::VerifyProofBundleRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace provgate::service
