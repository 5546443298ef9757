#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "provgate/v1.hpp"

namespace provgate::gate {

// Opaque pointer to evidence held by the collaborator that produced it.
struct EvidenceRef {
  std::string uri;
  std::string digest;
  std::string media_type;
};

/*
  Input for one stage run of one operation. Gates only ever see it through
  a const reference; raw evidence never enters the core.
*/
struct OperationContext {
  std::string                        operation_id;
  std::string                        lifecycle_id;
  provgate::v1::Stage                stage = provgate::v1::STAGE_UNSPECIFIED;
  std::map<std::string, std::string> metadata;
  std::vector<EvidenceRef>           evidence;

  // anchor salt for this stage
  std::string salt;

  // Hex SHA-256 over the evidence references, independent of their order.
  std::string EvidenceDigest() const;
};

using Thresholds = std::map<std::string, double>;

struct GateContext {
  const OperationContext& operation;
  const Thresholds&       thresholds;

  // nullptr when the threshold is not configured
  const double* Threshold(const std::string& key) const {
    auto it = thresholds.find(key);
    return it == thresholds.end() ? nullptr : &it->second;
  }
};

/*
  Gate contract: a single evaluate capability.

  Evaluate must be a pure function of its input and safe to call from any
  thread; the orchestrator may run several gates of one stage at once.
  Throwing is allowed and becomes a REVIEW verdict.
*/
class Gate {
 public:
  virtual ~Gate() = default;

  virtual const std::string& Name() const = 0;

  virtual provgate::v1::GateVerdict Evaluate(const GateContext& ctx) const = 0;
};

// Adapts a callable into a Gate.
class FunctionGate final : public Gate {
 public:
  using EvaluateFn = std::function<provgate::v1::GateVerdict(const GateContext&)>;

  FunctionGate(std::string name, EvaluateFn fn) : name_(std::move(name)), fn_(std::move(fn)) {
  }

  const std::string& Name() const override {
    return name_;
  }

  provgate::v1::GateVerdict Evaluate(const GateContext& ctx) const override {
    return fn_(ctx);
  }

 private:
  std::string name_;
  EvaluateFn  fn_;
};

inline std::shared_ptr<const Gate> MakeGate(std::string name, FunctionGate::EvaluateFn fn) {
  return std::make_shared<const FunctionGate>(std::move(name), std::move(fn));
}

} // namespace provgate::gate
