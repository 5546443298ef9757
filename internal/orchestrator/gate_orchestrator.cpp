#include "gate_orchestrator.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <utility>

#include "internal/model/stage.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace provgate::orchestrator {

namespace {

using provgate::observability::BoolField;
using provgate::observability::IntField;
using provgate::observability::StringField;
using provgate::v1::GateStatus;
using provgate::v1::GateVerdict;

// Completion state shared between one RunGates call and its evaluation tasks.
// Tasks may outlive the call when a gate times out.
struct GateSlots {
  std::mutex                                                        mutex;
  std::condition_variable                                           cv;
  std::vector<std::optional<GateVerdict>>                           results;
  std::vector<std::optional<std::chrono::steady_clock::time_point>> started;
  // last start or completion of any gate in this call
  std::chrono::steady_clock::time_point                             progress;
  bool                                                              failed    = false;
  bool                                                              abandoned = false;

  explicit GateSlots(std::size_t n) : results(n), started(n) {
  }
};

GateVerdict OrchestratorVerdict(const policy::PlannedGate& planned, provgate::v1::Stage stage, GateStatus status,
                                const std::string& error) {
  GateVerdict verdict;
  verdict.set_gate_name(planned.gate->Name());
  verdict.set_stage(stage);
  verdict.set_status(status);
  verdict.set_error(error);
  for (const auto& [key, value] : planned.thresholds) {
    (*verdict.mutable_thresholds_applied())[key] = value;
  }
  return verdict;
}

bool IsVerdictStatus(GateStatus status) {
  return status == provgate::v1::GATE_STATUS_PASS || status == provgate::v1::GATE_STATUS_WARN ||
         status == provgate::v1::GATE_STATUS_REVIEW || status == provgate::v1::GATE_STATUS_FAIL;
}

// Name, stage and thresholds always come from the plan, never from the gate.
void Normalize(GateVerdict& verdict, const policy::PlannedGate& planned, const gate::OperationContext& ctx) {
  verdict.set_gate_name(planned.gate->Name());
  verdict.set_stage(ctx.stage);

  if (!IsVerdictStatus(verdict.status())) {
    verdict.set_error("gate returned invalid status " + model::StatusName(verdict.status()));
    verdict.set_status(provgate::v1::GATE_STATUS_REVIEW);
  }

  verdict.clear_thresholds_applied();
  for (const auto& [key, value] : planned.thresholds) {
    (*verdict.mutable_thresholds_applied())[key] = value;
  }

  if (verdict.evidence_digest().empty()) {
    verdict.set_evidence_digest(ctx.EvidenceDigest());
  }
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

// Tracks one stage run through the state machine.
class GateOrchestrator::Run {
 public:
  Run(const gate::OperationContext& ctx, std::string lifecycle_id) : ctx_(ctx), lifecycle_id_(std::move(lifecycle_id)) {
    outcome_.operation_id = ctx.operation_id;
    outcome_.stage        = ctx.stage;
    outcome_.transitions.push_back(outcome_.state);
  }

  void Transition(model::RunState to) {
    if (!model::CanTransition(outcome_.state, to)) {
      throw util::InvalidState("illegal run transition " + std::string(model::ToString(outcome_.state)) + " -> " +
                               std::string(model::ToString(to)));
    }

    PROVGATE_LOG_DEBUG("Run transition", {StringField("operation_id", ctx_.operation_id), StringField("stage", model::StageName(ctx_.stage)),
                                          StringField("from", model::ToString(outcome_.state)), StringField("to", model::ToString(to))});

    outcome_.state = to;
    outcome_.transitions.push_back(to);
  }

  const gate::OperationContext& Context() const {
    return ctx_;
  }

  const std::string& LifecycleId() const {
    return lifecycle_id_;
  }

  std::string PolicyLabel() const {
    return policy_.id.empty() ? std::string("none") : policy_.id + "@" + policy_.version;
  }

  void SetPolicy(receipt::PolicyRef ref) {
    policy_ = std::move(ref);
  }

  StageOutcome& Outcome() {
    return outcome_;
  }

 private:
  const gate::OperationContext& ctx_;
  std::string                   lifecycle_id_;
  receipt::PolicyRef            policy_;
  StageOutcome                  outcome_;
};

GateOrchestrator::GateOrchestrator(std::shared_ptr<gate::GateRegistry> registry, std::shared_ptr<const policy::PolicyEngine> policy,
                                   std::shared_ptr<receipt::ReceiptGenerator> receipts, std::shared_ptr<audit::AuditTrail> audit,
                                   std::shared_ptr<ReviewBroker> reviews, std::shared_ptr<EvaluationScheduler> scheduler,
                                   OrchestratorOptions options)
    : registry_(std::move(registry)),
      receipts_(std::move(receipts)),
      audit_(std::move(audit)),
      reviews_(std::move(reviews)),
      scheduler_(std::move(scheduler)),
      options_(options),
      policy_(std::move(policy)) {
  if (!registry_ || !policy_ || !receipts_ || !audit_ || !reviews_ || !scheduler_) {
    throw util::InvalidArgument("gate orchestrator requires registry, policy, receipts, audit, reviews and scheduler");
  }
  RestoreHalts();
}

void GateOrchestrator::SetPolicy(std::shared_ptr<const policy::PolicyEngine> policy) {
  if (!policy) {
    throw util::InvalidArgument("policy engine is null");
  }

  std::lock_guard lock(policy_mutex_);
  PROVGATE_LOG_INFO("Policy activated",
                    {StringField("policy_id", policy->Ref().id), StringField("version", policy->Ref().version),
                     StringField("previous_version", policy_->Ref().version)});
  policy_ = std::move(policy);
}

std::shared_ptr<const policy::PolicyEngine> GateOrchestrator::CurrentPolicy() const {
  std::lock_guard lock(policy_mutex_);
  return policy_;
}

bool GateOrchestrator::IsHalted(const std::string& lifecycle_id, const std::string& operation_id) const {
  std::lock_guard lock(halted_mutex_);
  return halted_lifecycles_.contains(lifecycle_id) || halted_operations_.contains(operation_id);
}

void GateOrchestrator::Halt(const std::string& lifecycle_id, const std::string& operation_id) {
  std::lock_guard lock(halted_mutex_);
  halted_lifecycles_.insert(lifecycle_id);
  halted_operations_.insert(operation_id);
}

void GateOrchestrator::RestoreHalts() {
  auto    cursor   = audit_->Query({});
  int64_t restored = 0;
  while (auto receipt = cursor.Next()) {
    if (receipt->enforcement_action() != provgate::v1::ENFORCEMENT_ACTION_BLOCK) {
      continue;
    }
    Halt(receipt->lifecycle_id(), receipt->operation_id());
    ++restored;
  }

  if (restored > 0) {
    std::lock_guard lock(halted_mutex_);
    PROVGATE_LOG_INFO("Halted lifecycles restored from audit log",
                      {IntField("block_receipts", restored), IntField("lifecycles", static_cast<int64_t>(halted_lifecycles_.size())),
                       IntField("operations", static_cast<int64_t>(halted_operations_.size()))});
  }
}

StageOutcome GateOrchestrator::RunStage(anchor::AnchorChain& chain, const gate::OperationContext& ctx, std::stop_token stop) {
  Run run(ctx, chain.LifecycleId());

  // a malformed context never reaches GATES_RUNNING
  if (ctx.operation_id.empty()) {
    Abort(run, "malformed context: operation_id is empty");
  }
  if (!model::IsLifecycleStage(ctx.stage)) {
    Abort(run, "malformed context: no lifecycle stage");
  }
  if (!ctx.lifecycle_id.empty() && ctx.lifecycle_id != chain.LifecycleId()) {
    Abort(run, "malformed context: lifecycle " + ctx.lifecycle_id + " does not match anchor chain " + chain.LifecycleId());
  }

  const auto engine = CurrentPolicy();
  run.SetPolicy(engine->Ref());

  if (IsHalted(chain.LifecycleId(), ctx.operation_id)) {
    PROVGATE_LOG_WARN("Stage refused for halted lifecycle",
                      {StringField("operation_id", ctx.operation_id), StringField("lifecycle_id", chain.LifecycleId()),
                       StringField("stage", model::StageName(ctx.stage))});

    util::PolicyViolationError::Details details;
    details.operation_id   = ctx.operation_id;
    details.stage          = model::StageName(ctx.stage);
    details.policy_id      = engine->Ref().id;
    details.policy_version = engine->Ref().version;
    throw util::PolicyViolationError("lifecycle " + chain.LifecycleId() + " is halted by an earlier BLOCK", std::move(details));
  }

  PROVGATE_LOG_INFO("Stage started", {StringField("operation_id", ctx.operation_id), StringField("lifecycle_id", chain.LifecycleId()),
                                      StringField("stage", model::StageName(ctx.stage)), StringField("policy", run.PolicyLabel())});

  auto& outcome = run.Outcome();
  try {
    const auto plan   = engine->Resolve(ctx.stage, *registry_);
    const auto anchor = chain.Derive(ctx.stage, ctx.salt);

    run.Transition(model::RunState::kGatesRunning);
    outcome.verdicts = RunGates(plan, std::make_shared<const gate::OperationContext>(ctx));

    run.Transition(model::RunState::kAggregating);
    outcome.decision = engine->Decide(plan, outcome.verdicts);

    run.Transition(model::RunState::kEnforcing);

    receipt::SealRequest request;
    request.operation_id     = ctx.operation_id;
    request.lifecycle_id     = chain.LifecycleId();
    request.stage            = ctx.stage;
    request.anchor_digest    = anchor.digest;
    request.evidence_digest  = ctx.EvidenceDigest();
    request.policy           = engine->Ref();
    request.verdicts         = outcome.verdicts;
    request.aggregate_status = outcome.decision.aggregate;

    if (outcome.decision.action == provgate::v1::ENFORCEMENT_ACTION_ESCALATE) {
      Escalate(request, outcome.decision, outcome, stop);
    }

    request.enforcement_action = outcome.decision.action;
    request.warnings           = outcome.decision.warnings;
    request.reason             = outcome.decision.reason;

    outcome.receipt = SealWithRetry(request);

    // a sealed BLOCK halts the lifecycle even if a later step fails
    if (outcome.decision.action == provgate::v1::ENFORCEMENT_ACTION_BLOCK) {
      Halt(chain.LifecycleId(), ctx.operation_id);
    }

    // sealing order: the review is issued before the stage receipt it resolves
    if (outcome.review_receipt) {
      audit_->Append(*outcome.review_receipt);
    }
    audit_->Append(*outcome.receipt);

    run.Transition(model::RunState::kSealed);
  } catch (const std::exception& e) {
    Abort(run, e.what());
  }

  PROVGATE_LOG_INFO("Stage sealed", {StringField("operation_id", ctx.operation_id), StringField("stage", model::StageName(ctx.stage)),
                                     StringField("aggregate", model::StatusName(outcome.decision.aggregate)),
                                     StringField("action", model::ActionName(outcome.decision.action)),
                                     StringField("receipt_id", outcome.receipt->receipt_id())});

  if (outcome.decision.action == provgate::v1::ENFORCEMENT_ACTION_BLOCK) {
    util::PolicyViolationError::Details details;
    details.operation_id   = ctx.operation_id;
    details.stage          = model::StageName(ctx.stage);
    details.gate_name      = outcome.decision.trigger_gate;
    details.threshold      = outcome.decision.threshold;
    details.policy_id      = engine->Ref().id;
    details.policy_version = engine->Ref().version;
    details.receipt_id     = outcome.receipt->receipt_id();

    PROVGATE_LOG_WARN("Lifecycle halted", {StringField("operation_id", ctx.operation_id), StringField("lifecycle_id", chain.LifecycleId()),
                                           StringField("gate", details.gate_name), StringField("reason", outcome.decision.reason)});
    throw util::PolicyViolationError(outcome.decision.reason, std::move(details));
  }

  return std::move(outcome);
}

std::vector<GateVerdict> GateOrchestrator::RunGates(const policy::StagePlan& plan, std::shared_ptr<const gate::OperationContext> ctx) {
  const std::size_t n       = plan.gates.size();
  auto              slots   = std::make_shared<GateSlots>(n);
  const auto        timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(options_.gate_timeout);

  auto dispatch = [&](std::size_t index) {
    const policy::PlannedGate planned = plan.gates[index];

    bool queued = scheduler_->Enqueue([slots, ctx, planned, index]() {
      const auto start = std::chrono::steady_clock::now();
      {
        std::lock_guard lock(slots->mutex);
        if (slots->abandoned) {
          return;
        }
        slots->started[index] = start;
        slots->progress       = start;
      }
      slots->cv.notify_all();

      GateVerdict verdict;
      try {
        verdict = planned.gate->Evaluate(gate::GateContext{*ctx, planned.thresholds});
        Normalize(verdict, planned, *ctx);
      } catch (const std::exception& e) {
        verdict = OrchestratorVerdict(planned, ctx->stage, provgate::v1::GATE_STATUS_REVIEW, std::string("evaluator error: ") + e.what());
      } catch (...) {
        verdict = OrchestratorVerdict(planned, ctx->stage, provgate::v1::GATE_STATUS_REVIEW, "evaluator error: non-standard exception");
      }
      verdict.set_duration_ms(ElapsedMs(start));

      std::lock_guard lock(slots->mutex);
      slots->failed         = slots->failed || verdict.status() == provgate::v1::GATE_STATUS_FAIL;
      slots->results[index] = std::move(verdict);
      slots->progress       = std::chrono::steady_clock::now();
      slots->cv.notify_all();
    });

    if (!queued) {
      std::lock_guard lock(slots->mutex);
      slots->results[index] = OrchestratorVerdict(planned, ctx->stage, provgate::v1::GATE_STATUS_REVIEW, "evaluation pool is shut down");
    }
  };

  // A started gate has gate_timeout from its own start. A queued gate waits
  // as long as the stage keeps making progress.
  auto deadline_of = [&](std::size_t index) {
    return (slots->started[index] ? *slots->started[index] : slots->progress) + timeout;
  };

  // Waits until every gate in [first, last) has a result or is past its deadline.
  auto wait_for = [&](std::size_t first, std::size_t last, bool stop_on_fail) {
    std::unique_lock lock(slots->mutex);
    while (!(stop_on_fail && slots->failed)) {
      const auto now     = std::chrono::steady_clock::now();
      auto       next    = std::chrono::steady_clock::time_point::max();
      bool       pending = false;
      for (std::size_t i = first; i < last; ++i) {
        if (slots->results[i]) {
          continue;
        }
        const auto deadline = deadline_of(i);
        if (deadline > now) {
          pending = true;
          next    = std::min(next, deadline);
        }
      }
      if (!pending) {
        break;
      }
      slots->cv.wait_until(lock, next);
    }
  };

  // Collects gate `index` under the slots lock; an unfinished gate becomes REVIEW.
  auto collect = [&](std::size_t index, bool cut, std::size_t& stalled) {
    if (slots->results[index]) {
      return *slots->results[index];
    }
    const auto& planned = plan.gates[index];
    if (cut) {
      return OrchestratorVerdict(planned, ctx->stage, provgate::v1::GATE_STATUS_SKIPPED, "");
    }

    const bool started = slots->started[index].has_value();
    if (started) {
      ++stalled;
    }
    PROVGATE_LOG_WARN("Gate timed out", {StringField("operation_id", ctx->operation_id), StringField("gate", planned.gate->Name()),
                                         IntField("timeout_ms", options_.gate_timeout.count()), BoolField("started", started)});
    auto verdict = OrchestratorVerdict(planned, ctx->stage, provgate::v1::GATE_STATUS_REVIEW,
                                       (started ? "gate timed out after " : "gate was not scheduled within ") +
                                           std::to_string(options_.gate_timeout.count()) + "ms");
    verdict.set_duration_ms(started ? ElapsedMs(*slots->started[index]) : 0.0);
    return verdict;
  };

  std::vector<GateVerdict> verdicts;
  verdicts.reserve(n);
  std::size_t stalled = 0;

  {
    std::lock_guard lock(slots->mutex);
    slots->progress = std::chrono::steady_clock::now();
  }

  if (plan.parallel) {
    for (std::size_t i = 0; i < n; ++i) {
      dispatch(i);
    }
    wait_for(0, n, plan.fail_fast);

    std::lock_guard lock(slots->mutex);
    const bool cut = plan.fail_fast && slots->failed;
    for (std::size_t i = 0; i < n; ++i) {
      verdicts.push_back(collect(i, cut, stalled));
    }
    slots->abandoned = true;
  } else {
    bool skip = false;
    for (std::size_t i = 0; i < n; ++i) {
      if (skip) {
        verdicts.push_back(OrchestratorVerdict(plan.gates[i], ctx->stage, provgate::v1::GATE_STATUS_SKIPPED, ""));
        continue;
      }

      {
        std::lock_guard lock(slots->mutex);
        slots->progress = std::chrono::steady_clock::now();
      }
      dispatch(i);
      wait_for(i, i + 1, false);

      std::lock_guard lock(slots->mutex);
      verdicts.push_back(collect(i, false, stalled));
      skip = plan.fail_fast && verdicts.back().status() == provgate::v1::GATE_STATUS_FAIL;
    }

    std::lock_guard lock(slots->mutex);
    slots->abandoned = true;
  }

  scheduler_->ReportStalled(stalled);
  return verdicts;
}

void GateOrchestrator::Escalate(receipt::SealRequest& request, policy::EnforcementDecision& decision, StageOutcome& outcome,
                                std::stop_token stop) {
  request.receipt_id = util::NewId();

  ReviewRequest review;
  review.operation_id = request.operation_id;
  review.lifecycle_id = request.lifecycle_id;
  review.stage        = request.stage;
  review.receipt_id   = request.receipt_id;
  review.reason       = decision.reason;
  review.verdicts     = request.verdicts;

  const auto review_id = reviews_->Open(std::move(review));
  const auto result    = reviews_->Await(review_id, options_.escalation_timeout, stop);

  switch (result.kind) {
    case ReviewOutcome::Kind::kTimedOut:
      decision.action = provgate::v1::ENFORCEMENT_ACTION_BLOCK;
      decision.reason += "; escalation timed out after " + std::to_string(options_.escalation_timeout.count()) + "ms";
      return;
    case ReviewOutcome::Kind::kCancelled:
      decision.action = provgate::v1::ENFORCEMENT_ACTION_BLOCK;
      decision.reason += "; escalation cancelled: " + result.rationale;
      return;
    case ReviewOutcome::Kind::kDecided:
      break;
  }

  request.enforcement_action = decision.action;
  request.warnings           = decision.warnings;
  request.reason             = decision.reason;

  try {
    outcome.review_receipt = util::RetryWithBackoff<util::SigningUnavailableError>(
        options_.sealing_retry, [&] { return receipts_->SealReview(request, result.decision, result.reviewer_id, result.rationale); });
  } catch (const std::exception& e) {
    PROVGATE_LOG_WARN("Review could not be sealed", {StringField("operation_id", request.operation_id), StringField("review_id", review_id),
                                                     StringField("reviewer", result.reviewer_id), StringField("error", e.what())});
    decision.action = provgate::v1::ENFORCEMENT_ACTION_BLOCK;
    decision.reason += "; review by " + result.reviewer_id + " could not be recorded: " + e.what();
    return;
  }

  if (result.decision == provgate::v1::REVIEW_DECISION_APPROVE) {
    decision.reason += "; approved by " + result.reviewer_id;
  } else {
    decision.action = provgate::v1::ENFORCEMENT_ACTION_BLOCK;
    decision.reason += "; rejected by " + result.reviewer_id;
    if (!result.rationale.empty()) {
      decision.reason += ": " + result.rationale;
    }
  }
}

provgate::v1::Receipt GateOrchestrator::SealWithRetry(const receipt::SealRequest& request) {
  return util::RetryWithBackoff<util::SigningUnavailableError>(
      options_.sealing_retry, [&] { return receipts_->Seal(request); },
      [&](uint32_t attempt, const util::SigningUnavailableError& e) {
        PROVGATE_LOG_WARN("Receipt signing retry", {StringField("operation_id", request.operation_id), IntField("attempt", attempt),
                                                    StringField("error", e.what())});
      });
}

void GateOrchestrator::Abort(Run& run, const std::string& cause) {
  auto&      outcome = run.Outcome();
  const auto at      = outcome.state;
  outcome.state      = model::RunState::kAborted;
  outcome.transitions.push_back(outcome.state);

  std::size_t evaluated = 0;
  for (const auto& verdict : outcome.verdicts) {
    if (verdict.status() != provgate::v1::GATE_STATUS_SKIPPED) {
      ++evaluated;
    }
  }

  PROVGATE_LOG_ERROR("abort diagnostic", {StringField("operation_id", run.Context().operation_id), StringField("lifecycle_id", run.LifecycleId()),
                                          StringField("stage", model::StageName(run.Context().stage)), StringField("state", model::ToString(at)),
                                          StringField("policy", run.PolicyLabel()), IntField("verdicts", static_cast<int64_t>(evaluated)),
                                          StringField("cause", cause)});

  throw util::StageAbortedError("stage " + model::StageName(run.Context().stage) + " of operation " + run.Context().operation_id +
                                " aborted in " + std::string(model::ToString(at)) + ": " + cause);
}

} // namespace provgate::orchestrator
