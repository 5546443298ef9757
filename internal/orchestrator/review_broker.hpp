#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "provgate/v1.hpp"

namespace provgate::orchestrator {

struct ReviewRequest {
  std::string                            review_id;
  std::string                            operation_id;
  std::string                            lifecycle_id;
  provgate::v1::Stage                    stage = provgate::v1::STAGE_UNSPECIFIED;
  // stage receipt the decision will be linked to
  std::string                            receipt_id;
  std::string                            reason;
  std::vector<provgate::v1::GateVerdict> verdicts;
  util::TimePoint                        requested_at{};
};

struct ReviewOutcome {
  enum class Kind { kDecided, kTimedOut, kCancelled };

  Kind                         kind = Kind::kTimedOut;
  provgate::v1::ReviewDecision decision = provgate::v1::REVIEW_DECISION_UNSPECIFIED;
  std::string                  reviewer_id;
  std::string                  rationale;
};

/*
  Human-in-the-loop suspension point.

  The orchestrator files a request and waits on it with a timeout and a stop
  token. Reviewers resolve requests from any thread through Decide or Cancel.
  A request that is never resolved ends as kTimedOut; callers treat every
  outcome other than an APPROVE decision as a block.
*/
class ReviewBroker {
 public:
  using Listener = std::function<void(const ReviewRequest&)>;

  // Called for every new request, outside the broker lock.
  void SetListener(Listener listener);

  // Assigns review_id and requested_at when unset. Returns the review id.
  std::string Open(ReviewRequest request);

  // False when the review is unknown or already resolved.
  bool Decide(const std::string& review_id, provgate::v1::ReviewDecision decision, const std::string& reviewer_id, const std::string& rationale);
  bool Cancel(const std::string& review_id, const std::string& reason);

  // Blocks until resolved, timed out or stopped. The review is closed on return.
  ReviewOutcome Await(const std::string& review_id, std::chrono::milliseconds timeout, std::stop_token stop = {});

  std::vector<ReviewRequest> Pending() const;

 private:
  struct Entry {
    ReviewRequest                request;
    std::optional<ReviewOutcome> outcome;
  };

  mutable std::mutex           mutex_;
  std::condition_variable_any  cv_;
  std::map<std::string, Entry> entries_;
  Listener                     listener_;
};

} // namespace provgate::orchestrator
