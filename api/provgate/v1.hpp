#pragma once

#include "provgate/core/v1/types.pb.h"
#include "provgate/core/v1/verdict.pb.h"
#include "provgate/core/v1/receipt.pb.h"
#include "provgate/core/v1/proof.pb.h"

#include "provgate/policy/v1/policy.pb.h"

namespace provgate::v1 {
using namespace ::provgate::core::v1;
using namespace ::provgate::policy::v1;
}
