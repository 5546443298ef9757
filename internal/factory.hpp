#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "config/config.pb.h"
#include "internal/anchor/anchor_chain.hpp"
#include "internal/audit/audit_trail.hpp"
#include "internal/audit/batch_ticker.hpp"
#include "internal/db/api/audit_log.hpp"
#include "internal/gate/gate_registry.hpp"
#include "internal/merkle/merkle_batcher.hpp"
#include "internal/orchestrator/evaluation_workers.hpp"
#include "internal/orchestrator/gate_orchestrator.hpp"
#include "internal/orchestrator/review_broker.hpp"
#include "internal/receipt/receipt_generator.hpp"
#include "internal/service/service_context.hpp"
#include "internal/trust/trust_layer.hpp"
#include "provgate/v1.hpp"

namespace provgate::factory {

// Anchor chains opened so far, one per lifecycle id.
struct LifecycleChains {
  std::mutex                                                   mutex;
  std::map<std::string, std::shared_ptr<anchor::AnchorChain>> chains;
};

/*
  Runtime

  Owns all long-lived singletons of the process. Gates are registered on
  `registry` by the embedding code before stages run.
*/
struct Runtime {
  std::shared_ptr<trust::TrustLayer>                   trust;
  std::shared_ptr<db::AuditLog>                        audit_log;
  std::shared_ptr<merkle::MerkleBatcher>               batcher;
  std::shared_ptr<audit::AuditTrail>                   audit;
  std::shared_ptr<audit::BatchTicker>                  batch_ticker;
  std::shared_ptr<gate::GateRegistry>                  registry;
  std::shared_ptr<orchestrator::ReviewBroker>          reviews;
  std::shared_ptr<orchestrator::EvaluationScheduler>   scheduler;
  std::shared_ptr<orchestrator::EvaluationWorkers>     workers;
  std::shared_ptr<receipt::ReceiptGenerator>           receipts;
  std::shared_ptr<orchestrator::GateOrchestrator>      orchestrator;

  std::string                      anchor_secret;
  std::shared_ptr<LifecycleChains> lifecycles = std::make_shared<LifecycleChains>();

  // Returns the chain of `lifecycle_id`, creating it on first use. Every
  // caller naming the same lifecycle shares one chain.
  std::shared_ptr<anchor::AnchorChain> OpenLifecycle(const std::string& lifecycle_id) const;

  service::ServiceContext Services() const;

  // Stops background threads and seals whatever is still pending.
  void Shutdown();
};

/*
  Build

  Constructs the whole backend from the runtime config and the active policy.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete storage types.
*/
Runtime Build(const provgate::runtime::config::RuntimeConfig& config, const provgate::v1::Policy& policy);

} // namespace provgate::factory
