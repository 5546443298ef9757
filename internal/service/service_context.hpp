#pragma once

#include <memory>

namespace provgate::audit { class AuditTrail; }
namespace provgate::orchestrator { class ReviewBroker; }
namespace provgate::trust { class TrustLayer; }

namespace provgate::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<provgate::audit::AuditTrail>          audit;
  std::shared_ptr<provgate::orchestrator::ReviewBroker> reviews;
  std::shared_ptr<provgate::trust::TrustLayer>          trust;
};

} // namespace provgate::service
