#pragma once

#include <string>

#include "provgate/v1.hpp"

namespace provgate::model {

/*
  Helpers over the lifecycle enums.
*/

using provgate::v1::EnforcementAction;
using provgate::v1::GateStatus;
using provgate::v1::Stage;

std::string StageName(Stage stage);
std::string StatusName(GateStatus status);
std::string ActionName(EnforcementAction action);

// Stage that must be anchored before `stage`; STAGE_UNSPECIFIED for the first stage.
Stage PreviousStage(Stage stage);

bool IsLifecycleStage(Stage stage);

// FAIL > REVIEW > WARN > PASS; SKIPPED and UNSPECIFIED rank below PASS.
int StatusSeverity(GateStatus status);

// BLOCK > ESCALATE > WARN > ALLOW
int ActionSeverity(EnforcementAction action);

GateStatus        WorstStatus(GateStatus a, GateStatus b);
EnforcementAction StrictestAction(EnforcementAction a, EnforcementAction b);

}  // namespace provgate::model
