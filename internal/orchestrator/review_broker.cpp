#include "review_broker.hpp"

#include "internal/model/stage.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace provgate::orchestrator {

using provgate::observability::IntField;
using provgate::observability::StringField;

void ReviewBroker::SetListener(Listener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

std::string ReviewBroker::Open(ReviewRequest request) {
  if (request.review_id.empty()) {
    request.review_id = util::NewId();
  }
  if (request.requested_at == util::TimePoint{}) {
    request.requested_at = util::Now();
  }

  Listener listener;
  {
    std::lock_guard lock(mutex_);
    if (!entries_.emplace(request.review_id, Entry{request, std::nullopt}).second) {
      throw util::AlreadyExists("review already open: " + request.review_id);
    }
    listener = listener_;
  }

  PROVGATE_LOG_INFO("Review requested", {StringField("review_id", request.review_id), StringField("operation_id", request.operation_id),
                                         StringField("stage", model::StageName(request.stage)), StringField("reason", request.reason)});
  if (listener) {
    listener(request);
  }
  return request.review_id;
}

bool ReviewBroker::Decide(const std::string& review_id, provgate::v1::ReviewDecision decision, const std::string& reviewer_id,
                          const std::string& rationale) {
  if (decision == provgate::v1::REVIEW_DECISION_UNSPECIFIED) {
    throw util::InvalidArgument("review decision must be APPROVE or REJECT");
  }
  if (reviewer_id.empty()) {
    throw util::InvalidArgument("review decision requires a reviewer id");
  }

  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(review_id);
    if (it == entries_.end() || it->second.outcome) {
      return false;
    }
    it->second.outcome = ReviewOutcome{ReviewOutcome::Kind::kDecided, decision, reviewer_id, rationale};
  }
  cv_.notify_all();
  return true;
}

bool ReviewBroker::Cancel(const std::string& review_id, const std::string& reason) {
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(review_id);
    if (it == entries_.end() || it->second.outcome) {
      return false;
    }
    it->second.outcome = ReviewOutcome{ReviewOutcome::Kind::kCancelled, provgate::v1::REVIEW_DECISION_UNSPECIFIED, {}, reason};
  }
  cv_.notify_all();
  return true;
}

ReviewOutcome ReviewBroker::Await(const std::string& review_id, std::chrono::milliseconds timeout, std::stop_token stop) {
  std::unique_lock lock(mutex_);
  auto             it = entries_.find(review_id);
  if (it == entries_.end()) {
    throw util::NotFound("unknown review: " + review_id);
  }

  const bool resolved = cv_.wait_for(lock, stop, timeout, [&] { return it->second.outcome.has_value(); });

  ReviewOutcome outcome;
  if (resolved) {
    outcome = *it->second.outcome;
  } else if (stop.stop_requested()) {
    outcome.kind      = ReviewOutcome::Kind::kCancelled;
    outcome.rationale = "wait cancelled";
  } else {
    outcome.kind = ReviewOutcome::Kind::kTimedOut;
  }
  entries_.erase(it);
  lock.unlock();

  if (outcome.kind == ReviewOutcome::Kind::kTimedOut) {
    PROVGATE_LOG_WARN("Review timed out", {StringField("review_id", review_id), IntField("timeout_ms", timeout.count())});
  }
  return outcome;
}

std::vector<ReviewRequest> ReviewBroker::Pending() const {
  std::vector<ReviewRequest> out;
  std::lock_guard            lock(mutex_);
  for (const auto& [id, entry] : entries_) {
    if (!entry.outcome) out.push_back(entry.request);
  }
  return out;
}

} // namespace provgate::orchestrator
