#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "gate.hpp"

namespace provgate::gate {

/*
  Stage -> ordered gates. Registration order is evaluation and tie-break
  order. Readers take a snapshot; registering during a run does not affect
  gates already dispatched.
*/
class GateRegistry {
 public:
  // Throws AlreadyExists when the stage already has a gate with this name.
  void Register(provgate::v1::Stage stage, std::shared_ptr<const Gate> gate);

  bool Unregister(provgate::v1::Stage stage, const std::string& name);

  std::vector<std::shared_ptr<const Gate>> GatesFor(provgate::v1::Stage stage) const;

  std::shared_ptr<const Gate> Find(provgate::v1::Stage stage, const std::string& name) const;

  bool Contains(provgate::v1::Stage stage, const std::string& name) const {
    return Find(stage, name) != nullptr;
  }

 private:
  mutable std::shared_mutex                                            mutex_;
  std::map<provgate::v1::Stage, std::vector<std::shared_ptr<const Gate>>> gates_;
};

} // namespace provgate::gate
