#include "internal/model/stage.hpp"

namespace provgate::model {

using namespace provgate::v1;

std::string StageName(Stage stage) {
  switch (stage) {
    case STAGE_DATASET:
      return "dataset";
    case STAGE_MODEL:
      return "model";
    case STAGE_TRAINING:
      return "training";
    case STAGE_DEPLOYMENT:
      return "deployment";
    case STAGE_INFERENCE:
      return "inference";
    default:
      return "unspecified";
  }
}

std::string StatusName(GateStatus status) {
  switch (status) {
    case GATE_STATUS_PASS:
      return "PASS";
    case GATE_STATUS_WARN:
      return "WARN";
    case GATE_STATUS_REVIEW:
      return "REVIEW";
    case GATE_STATUS_FAIL:
      return "FAIL";
    case GATE_STATUS_SKIPPED:
      return "SKIPPED";
    default:
      return "UNSPECIFIED";
  }
}

std::string ActionName(EnforcementAction action) {
  switch (action) {
    case ENFORCEMENT_ACTION_ALLOW:
      return "allow";
    case ENFORCEMENT_ACTION_WARN:
      return "warn";
    case ENFORCEMENT_ACTION_ESCALATE:
      return "escalate";
    case ENFORCEMENT_ACTION_BLOCK:
      return "block";
    default:
      return "unspecified";
  }
}

Stage PreviousStage(Stage stage) {
  switch (stage) {
    case STAGE_MODEL:
      return STAGE_DATASET;
    case STAGE_TRAINING:
      return STAGE_MODEL;
    case STAGE_DEPLOYMENT:
      return STAGE_TRAINING;
    case STAGE_INFERENCE:
      return STAGE_DEPLOYMENT;
    default:
      return STAGE_UNSPECIFIED;
  }
}

bool IsLifecycleStage(Stage stage) {
  return stage >= STAGE_DATASET && stage <= STAGE_INFERENCE;
}

int StatusSeverity(GateStatus status) {
  switch (status) {
    case GATE_STATUS_PASS:
      return 1;
    case GATE_STATUS_WARN:
      return 2;
    case GATE_STATUS_REVIEW:
      return 3;
    case GATE_STATUS_FAIL:
      return 4;
    default:
      return 0;
  }
}

int ActionSeverity(EnforcementAction action) {
  switch (action) {
    case ENFORCEMENT_ACTION_ALLOW:
      return 1;
    case ENFORCEMENT_ACTION_WARN:
      return 2;
    case ENFORCEMENT_ACTION_ESCALATE:
      return 3;
    case ENFORCEMENT_ACTION_BLOCK:
      return 4;
    default:
      return 0;
  }
}

GateStatus WorstStatus(GateStatus a, GateStatus b) {
  return StatusSeverity(b) > StatusSeverity(a) ? b : a;
}

EnforcementAction StrictestAction(EnforcementAction a, EnforcementAction b) {
  return ActionSeverity(b) > ActionSeverity(a) ? b : a;
}

}  // namespace provgate::model
