#include "gate_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/model/stage.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace provgate::gate {

using provgate::observability::StringField;

void GateRegistry::Register(provgate::v1::Stage stage, std::shared_ptr<const Gate> gate) {
  if (!gate) {
    throw util::InvalidArgument("cannot register a null gate");
  }
  if (!model::IsLifecycleStage(stage)) {
    throw util::InvalidArgument("gate " + gate->Name() + " registered for an unknown stage");
  }

  {
    std::unique_lock lock(mutex_);
    auto&            gates = gates_[stage];
    for (const auto& existing : gates) {
      if (existing->Name() == gate->Name()) {
        throw util::AlreadyExists("gate already registered for " + model::StageName(stage) + ": " + gate->Name());
      }
    }
    gates.push_back(gate);
  }

  PROVGATE_LOG_INFO("Registered gate", {StringField("stage", model::StageName(stage)), StringField("gate", gate->Name())});
}

bool GateRegistry::Unregister(provgate::v1::Stage stage, const std::string& name) {
  std::unique_lock lock(mutex_);
  auto             it = gates_.find(stage);
  if (it == gates_.end()) {
    return false;
  }

  auto& gates   = it->second;
  auto  removed = std::remove_if(gates.begin(), gates.end(), [&](const auto& gate) { return gate->Name() == name; });
  if (removed == gates.end()) {
    return false;
  }
  gates.erase(removed, gates.end());
  return true;
}

std::vector<std::shared_ptr<const Gate>> GateRegistry::GatesFor(provgate::v1::Stage stage) const {
  std::shared_lock lock(mutex_);
  auto             it = gates_.find(stage);
  if (it == gates_.end()) {
    return {};
  }
  return it->second;
}

std::shared_ptr<const Gate> GateRegistry::Find(provgate::v1::Stage stage, const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = gates_.find(stage);
  if (it == gates_.end()) {
    return nullptr;
  }
  for (const auto& gate : it->second) {
    if (gate->Name() == name) return gate;
  }
  return nullptr;
}

} // namespace provgate::gate
