#include "policy_engine.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <map>
#include <set>
#include <sstream>

#include "internal/crypto/digest.hpp"
#include "internal/model/stage.hpp"
#include "internal/util/errors.hpp"

namespace provgate::policy {

using namespace provgate::v1;

namespace {

std::string FormatThresholds(const google::protobuf::Map<std::string, double>& thresholds) {
  std::map<std::string, double> sorted;
  for (const auto& [key, value] : thresholds) {
    sorted.emplace(key, value);
  }
  std::ostringstream out;
  bool               first = true;
  for (const auto& [key, value] : sorted) {
    if (!first) out << ",";
    out << key << "=" << value;
    first = false;
  }
  return out.str();
}

EnforcementAction DefaultFor(const StagePlan& plan, GateStatus status) {
  switch (status) {
    case GATE_STATUS_WARN:
      return plan.on_warn;
    case GATE_STATUS_FAIL:
      return plan.on_fail;
    case GATE_STATUS_REVIEW:
      return plan.on_review;
    default:
      return ENFORCEMENT_ACTION_ALLOW;
  }
}

EnforcementAction OrDefault(EnforcementAction action, EnforcementAction fallback) {
  return action == ENFORCEMENT_ACTION_UNSPECIFIED ? fallback : action;
}

} // namespace

PolicyEngine::PolicyEngine(provgate::v1::Policy policy, const gate::GateRegistry* registry) {
  const auto errors = Validate(policy, registry);
  if (!errors.empty()) {
    std::string message = "invalid policy " + policy.policy_id() + "@" + policy.version() + ":";
    for (const auto& error : errors) {
      message += "\n  - " + error;
    }
    throw util::InvalidArgument(message);
  }

  ref_.id      = policy.policy_id();
  ref_.version = policy.version();
  ref_.digest  = Digest(policy);
  policy_      = std::make_shared<const provgate::v1::Policy>(std::move(policy));
}

std::vector<std::string> PolicyEngine::Validate(const provgate::v1::Policy& policy, const gate::GateRegistry* registry) {
  std::vector<std::string> errors;
  if (policy.policy_id().empty()) {
    errors.push_back("policy_id is empty");
  }
  if (policy.version().empty()) {
    errors.push_back("version is empty");
  }

  std::set<int> stages;
  for (const auto& stage : policy.stages()) {
    if (!model::IsLifecycleStage(stage.stage())) {
      errors.push_back("stage entry has no lifecycle stage");
      continue;
    }
    const auto stage_name = model::StageName(stage.stage());
    if (!stages.insert(stage.stage()).second) {
      errors.push_back("stage " + stage_name + " is declared twice");
    }
    if (stage.on_fail() == ENFORCEMENT_ACTION_ALLOW) {
      errors.push_back("stage " + stage_name + " allows FAIL verdicts");
    }

    std::set<std::string> names;
    for (const auto& gate : stage.gates()) {
      if (gate.gate_name().empty()) {
        errors.push_back("stage " + stage_name + " has a gate without a name");
        continue;
      }
      if (!names.insert(gate.gate_name()).second) {
        errors.push_back("gate " + gate.gate_name() + " is declared twice in stage " + stage_name);
      }
      if (registry && gate.enabled() && !registry->Contains(stage.stage(), gate.gate_name())) {
        errors.push_back("gate " + gate.gate_name() + " is enabled for " + stage_name + " but not registered");
      }
    }
  }
  return errors;
}

std::string PolicyEngine::Digest(const provgate::v1::Policy& policy) {
  std::string bytes;
  {
    google::protobuf::io::StringOutputStream raw(&bytes);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    policy.SerializeToCodedStream(&coded);
  }
  return crypto::Sha256Hex(bytes);
}

const StagePolicy* PolicyEngine::FindStage(Stage stage) const {
  for (const auto& candidate : policy_->stages()) {
    if (candidate.stage() == stage) return &candidate;
  }
  return nullptr;
}

StagePlan PolicyEngine::Resolve(Stage stage, const gate::GateRegistry& registry) const {
  StagePlan plan;
  plan.stage = stage;

  const auto* stage_policy = FindStage(stage);
  if (!stage_policy) {
    return plan;
  }

  plan.fail_fast = stage_policy->fail_fast();
  plan.parallel  = stage_policy->parallel_execution();
  plan.on_warn   = OrDefault(stage_policy->on_warn(), plan.on_warn);
  plan.on_fail   = OrDefault(stage_policy->on_fail(), plan.on_fail);
  plan.on_review = OrDefault(stage_policy->on_review(), plan.on_review);

  std::map<std::string, const GatePolicy*> enabled;
  for (const auto& gate_policy : stage_policy->gates()) {
    if (gate_policy.enabled()) {
      enabled[gate_policy.gate_name()] = &gate_policy;
    }
  }

  std::size_t found = 0;
  for (const auto& gate : registry.GatesFor(stage)) {
    auto it = enabled.find(gate->Name());
    if (it == enabled.end()) continue;

    PlannedGate planned;
    planned.gate = gate;
    for (const auto& [key, value] : it->second->thresholds()) {
      planned.thresholds.emplace(key, value);
    }
    planned.action = it->second->enforcement_action();
    plan.gates.push_back(std::move(planned));
    ++found;
  }

  if (found != enabled.size()) {
    for (const auto& [name, gate_policy] : enabled) {
      if (!registry.Contains(stage, name)) {
        throw util::InvalidState("policy " + ref_.id + "@" + ref_.version + " enables unregistered gate " + name + " for " +
                                 model::StageName(stage));
      }
    }
  }
  return plan;
}

EnforcementDecision PolicyEngine::Decide(const StagePlan& plan, const std::vector<GateVerdict>& verdicts) const {
  EnforcementDecision decision;

  for (const auto& verdict : verdicts) {
    if (verdict.status() == GATE_STATUS_SKIPPED) continue;
    decision.aggregate = model::WorstStatus(decision.aggregate, verdict.status());
    if (verdict.status() == GATE_STATUS_WARN) {
      decision.warnings.push_back(verdict.gate_name() + ": WARN");
    }
  }

  if (decision.aggregate == GATE_STATUS_PASS) {
    decision.action = ENFORCEMENT_ACTION_ALLOW;
    return decision;
  }

  decision.action = ENFORCEMENT_ACTION_UNSPECIFIED;
  const GateVerdict* trigger = nullptr;
  for (const auto& verdict : verdicts) {
    if (verdict.status() != decision.aggregate) continue;

    auto action = DefaultFor(plan, verdict.status());
    for (const auto& planned : plan.gates) {
      if (planned.gate->Name() == verdict.gate_name()) {
        action = OrDefault(planned.action, action);
        break;
      }
    }

    if (model::ActionSeverity(action) > model::ActionSeverity(decision.action)) {
      decision.action = action;
      trigger         = &verdict;
    }
  }

  if (trigger) {
    decision.trigger_gate = trigger->gate_name();
    decision.threshold    = FormatThresholds(trigger->thresholds_applied());

    std::ostringstream reason;
    reason << "gate " << trigger->gate_name() << " returned " << model::StatusName(trigger->status());
    if (!decision.threshold.empty()) {
      reason << " (thresholds " << decision.threshold << ")";
    }
    if (!trigger->error().empty()) {
      reason << ": " << trigger->error();
    }
    reason << "; action " << model::ActionName(decision.action) << " under policy " << ref_.id << "@" << ref_.version;
    decision.reason = reason.str();
  }
  return decision;
}

std::string PolicyEngine::Describe(Stage stage) const {
  std::ostringstream out;
  out << "policy " << ref_.id << "@" << ref_.version << " stage " << model::StageName(stage);

  const auto* stage_policy = FindStage(stage);
  if (!stage_policy) {
    out << ": no gates";
    return out.str();
  }

  out << (stage_policy->fail_fast() ? " fail_fast" : "") << (stage_policy->parallel_execution() ? " parallel" : " sequential");
  out << " on_warn=" << model::ActionName(OrDefault(stage_policy->on_warn(), ENFORCEMENT_ACTION_WARN))
      << " on_fail=" << model::ActionName(OrDefault(stage_policy->on_fail(), ENFORCEMENT_ACTION_BLOCK))
      << " on_review=" << model::ActionName(OrDefault(stage_policy->on_review(), ENFORCEMENT_ACTION_ESCALATE));
  for (const auto& gate : stage_policy->gates()) {
    out << "\n  " << gate.gate_name() << (gate.enabled() ? "" : " (disabled)");
    if (gate.enforcement_action() != ENFORCEMENT_ACTION_UNSPECIFIED) {
      out << " action=" << model::ActionName(gate.enforcement_action());
    }
    const auto thresholds = FormatThresholds(gate.thresholds());
    if (!thresholds.empty()) {
      out << " thresholds " << thresholds;
    }
  }
  return out.str();
}

} // namespace provgate::policy
