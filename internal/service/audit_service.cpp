#include "audit_service.hpp"

#include <chrono>

#include "internal/audit/audit_trail.hpp"
#include "internal/audit/proof_bundle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace provgate::service {

using namespace provgate::services::v1;
using provgate::observability::IntField;
using provgate::observability::StringField;

namespace {

// upper bound for a query without an explicit limit
constexpr uint32_t kDefaultQueryLimit = 1000;

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    PROVGATE_LOG_DEBUG("RPC completed", {StringField("route", route),
                                         IntField("duration_us", std::chrono::duration_cast<std::chrono::microseconds>(
                                                                     std::chrono::steady_clock::now() - started_at)
                                                                     .count())});
    return result;
  } catch (const std::exception& e) {
    PROVGATE_LOG_WARN("RPC failed", {StringField("route", route), StringField("error", e.what())});
    throw;
  }
}

} // namespace

AuditService::AuditService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

QueryReceiptsResponse AuditService::QueryReceipts(const QueryReceiptsRequest& req) {
  return ObserveRpc("AuditService.QueryReceipts", [&] {
    audit::ReceiptQuery query;
    if (!req.operation_id().empty()) {
      query.operation_id = req.operation_id();
    }
    if (req.stage() != provgate::core::v1::STAGE_UNSPECIFIED) {
      query.stage = req.stage();
    }
    if (req.has_from()) {
      query.from = util::FromProto(req.from());
    }
    if (req.has_to()) {
      query.to = util::FromProto(req.to());
    }
    if (query.from && query.to && *query.from > *query.to) {
      throw util::InvalidArgument("query range is reversed");
    }

    const uint32_t limit  = req.limit() == 0 ? kDefaultQueryLimit : req.limit();
    auto           cursor = ctx_.audit->Query(query);

    QueryReceiptsResponse resp;
    while (static_cast<uint32_t>(resp.receipts_size()) < limit) {
      auto receipt = cursor.Next();
      if (!receipt) {
        break;
      }
      *resp.add_receipts() = std::move(*receipt);
    }
    return resp;
  });
}

ExportProofBundleResponse AuditService::ExportProofBundle(const ExportProofBundleRequest& req) {
  return ObserveRpc("AuditService.ExportProofBundle", [&] {
    if (req.operation_id().empty()) {
      throw util::InvalidArgument("operation_id is required");
    }

    ExportProofBundleResponse resp;
    for (auto& bundle : ctx_.audit->ExportProofBundle(req.operation_id())) {
      *resp.add_bundles() = std::move(bundle);
    }
    return resp;
  });
}

VerifyProofBundleResponse AuditService::VerifyProofBundle(const VerifyProofBundleRequest& req) {
  return ObserveRpc("AuditService.VerifyProofBundle", [&] {
    if (!req.has_bundle()) {
      throw util::InvalidArgument("bundle is required");
    }

    const auto check = audit::VerifyProofBundle(req.bundle());

    VerifyProofBundleResponse resp;
    resp.set_valid(check.valid);
    resp.set_reason(check.reason);
    return resp;
  });
}

} // namespace provgate::service
