#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

#include "evaluation_scheduler.hpp"
#include "internal/anchor/anchor_chain.hpp"
#include "internal/audit/audit_trail.hpp"
#include "internal/gate/gate_registry.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/policy/policy_engine.hpp"
#include "internal/receipt/receipt_generator.hpp"
#include "internal/util/retry.hpp"
#include "review_broker.hpp"

namespace provgate::orchestrator {

struct OrchestratorOptions {
  std::chrono::milliseconds gate_timeout{30000};
  std::chrono::milliseconds escalation_timeout{std::chrono::hours(1)};
  util::BackoffPolicy       sealing_retry;
};

// Record of one completed stage run.
struct StageOutcome {
  std::string                            operation_id;
  provgate::v1::Stage                    stage = provgate::v1::STAGE_UNSPECIFIED;
  model::RunState                        state = model::RunState::kIdle;
  std::vector<model::RunState>           transitions;
  std::vector<provgate::v1::GateVerdict> verdicts;
  policy::EnforcementDecision            decision;
  std::optional<provgate::v1::Receipt>   receipt;
  std::optional<provgate::v1::Receipt>   review_receipt;
};

/*
  Gate orchestrator.

  Drives one stage of one operation through
    IDLE -> GATES_RUNNING -> AGGREGATING -> ENFORCING -> SEALED
  or to ABORTED on an unrecoverable error.

  Many operations may run at once; each RunStage call owns its own state.
  The only shared mutable pieces are the halted set and the policy pointer.
*/
class GateOrchestrator {
 public:
  GateOrchestrator(std::shared_ptr<gate::GateRegistry> registry, std::shared_ptr<const policy::PolicyEngine> policy,
                   std::shared_ptr<receipt::ReceiptGenerator> receipts, std::shared_ptr<audit::AuditTrail> audit,
                   std::shared_ptr<ReviewBroker> reviews, std::shared_ptr<EvaluationScheduler> scheduler, OrchestratorOptions options);

  // Runs already in flight keep the engine they started with.
  void                                        SetPolicy(std::shared_ptr<const policy::PolicyEngine> policy);
  std::shared_ptr<const policy::PolicyEngine> CurrentPolicy() const;

  /*
    Runs the gates of ctx.stage, enforces the policy and seals a receipt.

    ALLOW, WARN and approved escalations return the outcome. BLOCK seals the
    receipt, halts the lifecycle and throws PolicyViolationError. Unrecoverable
    errors log an abort diagnostic, seal nothing and throw StageAbortedError.
    A halted lifecycle or operation throws PolicyViolationError without
    running any gate.
  */
  StageOutcome RunStage(anchor::AnchorChain& chain, const gate::OperationContext& ctx, std::stop_token stop = {});

  bool IsHalted(const std::string& lifecycle_id, const std::string& operation_id) const;

 private:
  class Run;

  std::vector<provgate::v1::GateVerdict> RunGates(const policy::StagePlan& plan, std::shared_ptr<const gate::OperationContext> ctx);

  void Escalate(receipt::SealRequest& request, policy::EnforcementDecision& decision, StageOutcome& outcome, std::stop_token stop);

  provgate::v1::Receipt SealWithRetry(const receipt::SealRequest& request);

  [[noreturn]] void Abort(Run& run, const std::string& cause);

  void Halt(const std::string& lifecycle_id, const std::string& operation_id);

  // Rebuilds the halted sets from the BLOCK receipts already in the audit log.
  void RestoreHalts();

  std::shared_ptr<gate::GateRegistry>        registry_;
  std::shared_ptr<receipt::ReceiptGenerator> receipts_;
  std::shared_ptr<audit::AuditTrail>         audit_;
  std::shared_ptr<ReviewBroker>              reviews_;
  std::shared_ptr<EvaluationScheduler>       scheduler_;
  OrchestratorOptions                        options_;

  mutable std::mutex                          policy_mutex_;
  std::shared_ptr<const policy::PolicyEngine> policy_;

  // Only grows by BLOCK receipts, so it is bounded by the audit log itself.
  // A BLOCK whose receipt never reached the log is not restored on restart.
  mutable std::mutex    halted_mutex_;
  std::set<std::string> halted_lifecycles_;
  std::set<std::string> halted_operations_;
};

} // namespace provgate::orchestrator
