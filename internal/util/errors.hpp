#pragma once

#include <stdexcept>
#include <string>

namespace provgate::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Anchor derivation misuse. Fatal to that derivation only.
class InvalidParentError : public std::runtime_error {
 public:
  explicit InvalidParentError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient: no authorized signer reachable. Callers retry with backoff.
class SigningUnavailableError : public std::runtime_error {
 public:
  explicit SigningUnavailableError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Never retried with the same entity.
class RevokedEntityError : public std::runtime_error {
 public:
  explicit RevokedEntityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProofVerificationError : public std::runtime_error {
 public:
  explicit ProofVerificationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Expected control-flow outcome of a BLOCK decision, not a system fault.

  Carries what the caller needs to explain the block: the gate and threshold
  that triggered it, the policy version that governed the run and the sealed
  receipt that records the decision (empty when the lifecycle was already halted).
*/
class PolicyViolationError : public std::runtime_error {
 public:
  struct Details {
    std::string operation_id;
    std::string stage;
    std::string gate_name;
    std::string threshold;
    std::string policy_id;
    std::string policy_version;
    std::string receipt_id;
  };

  PolicyViolationError(const std::string& msg, Details details) : std::runtime_error(msg), details_(std::move(details)) {
  }

  const Details& details() const {
    return details_;
  }

 private:
  Details details_;
};

// Terminal ABORTED run. No receipt was sealed.
class StageAbortedError : public std::runtime_error {
 public:
  explicit StageAbortedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace provgate::util
