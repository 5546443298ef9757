#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/gate/gate_registry.hpp"
#include "internal/receipt/receipt_generator.hpp"
#include "provgate/v1.hpp"

namespace provgate::policy {

struct PlannedGate {
  std::shared_ptr<const gate::Gate> gate;
  gate::Thresholds                  thresholds;
  // UNSPECIFIED: use the stage default for the verdict's status
  provgate::v1::EnforcementAction action = provgate::v1::ENFORCEMENT_ACTION_UNSPECIFIED;
};

struct StagePlan {
  provgate::v1::Stage stage = provgate::v1::STAGE_UNSPECIFIED;
  bool                fail_fast = false;
  bool                parallel  = false;

  provgate::v1::EnforcementAction on_warn   = provgate::v1::ENFORCEMENT_ACTION_WARN;
  provgate::v1::EnforcementAction on_fail   = provgate::v1::ENFORCEMENT_ACTION_BLOCK;
  provgate::v1::EnforcementAction on_review = provgate::v1::ENFORCEMENT_ACTION_ESCALATE;

  // registry order
  std::vector<PlannedGate> gates;
};

struct EnforcementDecision {
  provgate::v1::GateStatus        aggregate = provgate::v1::GATE_STATUS_PASS;
  provgate::v1::EnforcementAction action    = provgate::v1::ENFORCEMENT_ACTION_ALLOW;

  // first gate (registry order) contributing the winning action; empty on ALLOW
  std::string trigger_gate;
  std::string threshold;

  std::vector<std::string> warnings;
  std::string              reason;
};

/*
  Policy engine over one immutable policy version.

  A new policy version means a new engine; the orchestrator swaps engines
  atomically and every run keeps the engine it started with.
*/
class PolicyEngine {
 public:
  // Throws InvalidArgument listing every validation error.
  explicit PolicyEngine(provgate::v1::Policy policy, const gate::GateRegistry* registry = nullptr);

  /*
    Structural checks, plus registration checks when a registry is given.
    Empty result means valid.
  */
  static std::vector<std::string> Validate(const provgate::v1::Policy& policy, const gate::GateRegistry* registry = nullptr);

  // Hex SHA-256 of the deterministic serialization.
  static std::string Digest(const provgate::v1::Policy& policy);

  const provgate::v1::Policy& Current() const {
    return *policy_;
  }

  const receipt::PolicyRef& Ref() const {
    return ref_;
  }

  /*
    Enabled gates of `stage` that are registered, in registry order, with
    their thresholds and actions. Throws InvalidState when an enabled gate is
    missing from the registry. A stage absent from the policy has no gates.
  */
  StagePlan Resolve(provgate::v1::Stage stage, const gate::GateRegistry& registry) const;

  // Pure function of (plan, verdicts).
  EnforcementDecision Decide(const StagePlan& plan, const std::vector<provgate::v1::GateVerdict>& verdicts) const;

  std::string Describe(provgate::v1::Stage stage) const;

 private:
  const provgate::v1::StagePolicy* FindStage(provgate::v1::Stage stage) const;

  std::shared_ptr<const provgate::v1::Policy> policy_;
  receipt::PolicyRef                          ref_;
};

} // namespace provgate::policy
