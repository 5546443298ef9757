#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/gate/gate_registry.hpp"
#include "internal/policy/policy_engine.hpp"
#include "internal/util/errors.hpp"

namespace {

using provgate::gate::GateRegistry;
using provgate::gate::MakeGate;
using provgate::policy::PolicyEngine;
using namespace provgate::v1;

std::shared_ptr<const provgate::gate::Gate> Fixed(const std::string& name, GateStatus status) {
  return MakeGate(name, [name, status](const provgate::gate::GateContext&) {
    GateVerdict verdict;
    verdict.set_gate_name(name);
    verdict.set_status(status);
    return verdict;
  });
}

GatePolicy* AddGate(StagePolicy* stage, const std::string& name, bool enabled = true) {
  auto* gate = stage->add_gates();
  gate->set_gate_name(name);
  gate->set_enabled(enabled);
  return gate;
}

Policy Baseline() {
  Policy policy;
  policy.set_policy_id("baseline");
  policy.set_version("1.0");

  auto* dataset = policy.add_stages();
  dataset->set_stage(STAGE_DATASET);
  auto* quality = AddGate(dataset, "quality");
  (*quality->mutable_thresholds())["min_rows"] = 1000;
  auto* bias = AddGate(dataset, "bias");
  (*bias->mutable_thresholds())["max_disparity"] = 0.1;
  AddGate(dataset, "legacy", false);

  auto* model = policy.add_stages();
  model->set_stage(STAGE_MODEL);
  model->set_fail_fast(true);
  model->set_parallel_execution(true);
  AddGate(model, "robustness")->set_enforcement_action(ENFORCEMENT_ACTION_ESCALATE);
  return policy;
}

void RegisterAll(GateRegistry& registry) {
  registry.Register(STAGE_DATASET, Fixed("bias", GATE_STATUS_PASS));
  registry.Register(STAGE_DATASET, Fixed("quality", GATE_STATUS_PASS));
  registry.Register(STAGE_DATASET, Fixed("legacy", GATE_STATUS_PASS));
  registry.Register(STAGE_MODEL, Fixed("robustness", GATE_STATUS_PASS));
}

GateVerdict Verdict(const std::string& gate, GateStatus status, const provgate::gate::Thresholds& thresholds = {}) {
  GateVerdict verdict;
  verdict.set_gate_name(gate);
  verdict.set_stage(STAGE_DATASET);
  verdict.set_status(status);
  for (const auto& [key, value] : thresholds) {
    (*verdict.mutable_thresholds_applied())[key] = value;
  }
  return verdict;
}

bool Contains(const std::vector<std::string>& errors, const std::string& expected) {
  for (const auto& error : errors) {
    if (error == expected) return true;
  }
  return false;
}

void TestValidateReportsEveryError() {
  Policy policy;
  auto*  dataset = policy.add_stages();
  dataset->set_stage(STAGE_DATASET);
  dataset->set_on_fail(ENFORCEMENT_ACTION_ALLOW);
  AddGate(dataset, "bias");
  AddGate(dataset, "bias");
  policy.add_stages()->set_stage(STAGE_DATASET);

  const auto errors = PolicyEngine::Validate(policy);
  assert(Contains(errors, "policy_id is empty"));
  assert(Contains(errors, "version is empty"));
  assert(Contains(errors, "stage dataset allows FAIL verdicts"));
  assert(Contains(errors, "gate bias is declared twice in stage dataset"));
  assert(Contains(errors, "stage dataset is declared twice"));

  bool threw = false;
  try {
    PolicyEngine engine(policy);
  } catch (const provgate::util::InvalidArgument& e) {
    threw = std::string(e.what()).find("policy_id is empty") != std::string::npos;
  }
  assert(threw);
}

void TestValidateChecksRegistrationWhenGiven() {
  GateRegistry registry;
  registry.Register(STAGE_DATASET, Fixed("bias", GATE_STATUS_PASS));

  const auto errors = PolicyEngine::Validate(Baseline(), &registry);
  assert(Contains(errors, "gate quality is enabled for dataset but not registered"));
  assert(Contains(errors, "gate robustness is enabled for model but not registered"));
  // disabled gates need no registration
  for (const auto& error : errors) {
    assert(error.find("legacy") == std::string::npos);
  }

  assert(PolicyEngine::Validate(Baseline()).empty());
}

void TestResolveFollowsRegistryOrder() {
  GateRegistry registry;
  RegisterAll(registry);
  const PolicyEngine engine(Baseline(), &registry);

  const auto plan = engine.Resolve(STAGE_DATASET, registry);
  assert(plan.gates.size() == 2);
  assert(plan.gates[0].gate->Name() == "bias");
  assert(plan.gates[1].gate->Name() == "quality");
  assert(plan.gates[0].thresholds.at("max_disparity") == 0.1);
  assert(!plan.fail_fast);
  assert(!plan.parallel);
  assert(plan.on_warn == ENFORCEMENT_ACTION_WARN);
  assert(plan.on_fail == ENFORCEMENT_ACTION_BLOCK);
  assert(plan.on_review == ENFORCEMENT_ACTION_ESCALATE);

  const auto model = engine.Resolve(STAGE_MODEL, registry);
  assert(model.fail_fast && model.parallel);
  assert(model.gates.size() == 1);
  assert(model.gates[0].action == ENFORCEMENT_ACTION_ESCALATE);

  assert(engine.Resolve(STAGE_INFERENCE, registry).gates.empty());
}

void TestResolveRejectsUnregisteredGate() {
  GateRegistry       registry;
  const PolicyEngine engine(Baseline());
  registry.Register(STAGE_DATASET, Fixed("bias", GATE_STATUS_PASS));

  bool threw = false;
  try {
    engine.Resolve(STAGE_DATASET, registry);
  } catch (const provgate::util::InvalidState& e) {
    threw = std::string(e.what()).find("quality") != std::string::npos;
  }
  assert(threw);
}

void TestWarnMapsToWarn() {
  GateRegistry registry;
  RegisterAll(registry);
  const PolicyEngine engine(Baseline(), &registry);
  const auto         plan = engine.Resolve(STAGE_DATASET, registry);

  const auto decision =
      engine.Decide(plan, {Verdict("bias", GATE_STATUS_WARN, {{"max_disparity", 0.1}}), Verdict("quality", GATE_STATUS_PASS)});
  assert(decision.aggregate == GATE_STATUS_WARN);
  assert(decision.action == ENFORCEMENT_ACTION_WARN);
  assert(decision.warnings.size() == 1);
  assert(decision.warnings[0] == "bias: WARN");
  assert(decision.trigger_gate == "bias");
  assert(decision.threshold == "max_disparity=0.1");
  assert(decision.reason == "gate bias returned WARN (thresholds max_disparity=0.1); action warn under policy baseline@1.0");
}

void TestFailBlocksAndNamesTrigger() {
  GateRegistry registry;
  RegisterAll(registry);
  const PolicyEngine engine(Baseline(), &registry);
  const auto         plan = engine.Resolve(STAGE_DATASET, registry);

  auto failed = Verdict("quality", GATE_STATUS_FAIL, {{"min_rows", 1000}});
  failed.set_error("only 12 rows");

  const auto decision = engine.Decide(plan, {Verdict("bias", GATE_STATUS_WARN), failed});
  assert(decision.aggregate == GATE_STATUS_FAIL);
  assert(decision.action == ENFORCEMENT_ACTION_BLOCK);
  assert(decision.trigger_gate == "quality");
  assert(decision.warnings.size() == 1);
  assert(decision.reason == "gate quality returned FAIL (thresholds min_rows=1000): only 12 rows; action block under policy baseline@1.0");
}

void TestPerGateActionOverridesStageDefault() {
  GateRegistry registry;
  RegisterAll(registry);
  const PolicyEngine engine(Baseline(), &registry);
  const auto         plan = engine.Resolve(STAGE_MODEL, registry);

  auto verdict = Verdict("robustness", GATE_STATUS_WARN);
  verdict.set_stage(STAGE_MODEL);
  const auto decision = engine.Decide(plan, {verdict});
  assert(decision.action == ENFORCEMENT_ACTION_ESCALATE);
  assert(decision.trigger_gate == "robustness");
}

void TestReviewEscalatesAndSkippedIsIgnored() {
  GateRegistry registry;
  RegisterAll(registry);
  const PolicyEngine engine(Baseline(), &registry);
  const auto         plan = engine.Resolve(STAGE_DATASET, registry);

  const auto review = engine.Decide(plan, {Verdict("bias", GATE_STATUS_REVIEW), Verdict("quality", GATE_STATUS_SKIPPED)});
  assert(review.aggregate == GATE_STATUS_REVIEW);
  assert(review.action == ENFORCEMENT_ACTION_ESCALATE);

  const auto pass = engine.Decide(plan, {Verdict("bias", GATE_STATUS_PASS), Verdict("quality", GATE_STATUS_SKIPPED)});
  assert(pass.aggregate == GATE_STATUS_PASS);
  assert(pass.action == ENFORCEMENT_ACTION_ALLOW);
  assert(pass.reason.empty());
  assert(pass.trigger_gate.empty());

  const auto empty = engine.Decide(plan, {});
  assert(empty.action == ENFORCEMENT_ACTION_ALLOW);
}

void TestDecideIsDeterministic() {
  GateRegistry registry;
  RegisterAll(registry);
  const PolicyEngine engine(Baseline(), &registry);
  const auto         plan = engine.Resolve(STAGE_DATASET, registry);

  const std::vector<GateVerdict> verdicts = {Verdict("bias", GATE_STATUS_FAIL), Verdict("quality", GATE_STATUS_FAIL)};
  const auto                     first    = engine.Decide(plan, verdicts);
  for (int i = 0; i < 10; ++i) {
    const auto again = engine.Decide(plan, verdicts);
    assert(again.reason == first.reason);
    assert(again.trigger_gate == "bias");
  }
}

void TestDigestAndRef() {
  GateRegistry registry;
  RegisterAll(registry);
  const PolicyEngine engine(Baseline(), &registry);

  assert(engine.Ref().id == "baseline");
  assert(engine.Ref().version == "1.0");
  assert(engine.Ref().digest == PolicyEngine::Digest(Baseline()));
  assert(engine.Ref().digest.size() == 64);

  auto changed = Baseline();
  (*changed.mutable_stages(0)->mutable_gates(1)->mutable_thresholds())["max_disparity"] = 0.2;
  assert(PolicyEngine::Digest(changed) != engine.Ref().digest);
}

void TestDescribe() {
  GateRegistry registry;
  RegisterAll(registry);
  const PolicyEngine engine(Baseline(), &registry);

  const auto dataset = engine.Describe(STAGE_DATASET);
  assert(dataset.find("policy baseline@1.0 stage dataset sequential") == 0);
  assert(dataset.find("bias thresholds max_disparity=0.1") != std::string::npos);
  assert(dataset.find("legacy (disabled)") != std::string::npos);

  const auto model = engine.Describe(STAGE_MODEL);
  assert(model.find("fail_fast parallel") != std::string::npos);
  assert(model.find("robustness action=escalate") != std::string::npos);

  assert(engine.Describe(STAGE_INFERENCE) == "policy baseline@1.0 stage inference: no gates");
}

} // namespace

int main() {
  TestValidateReportsEveryError();
  TestValidateChecksRegistrationWhenGiven();
  TestResolveFollowsRegistryOrder();
  TestResolveRejectsUnregisteredGate();
  TestWarnMapsToWarn();
  TestFailBlocksAndNamesTrigger();
  TestPerGateActionOverridesStageDefault();
  TestReviewEscalatesAndSkippedIsIgnored();
  TestDecideIsDeterministic();
  TestDigestAndRef();
  TestDescribe();

  std::cout << "provgate_unit_policy_engine: pass\n";
  return 0;
}
