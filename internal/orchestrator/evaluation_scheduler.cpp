#include "evaluation_scheduler.hpp"

namespace provgate::orchestrator {

bool EvaluationScheduler::Enqueue(EvaluationTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<EvaluationTask> EvaluationScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  EvaluationTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void EvaluationScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void EvaluationScheduler::SetStallHandler(StallHandler handler) {
  std::lock_guard lock(mutex_);
  stall_handler_ = std::move(handler);
}

void EvaluationScheduler::ReportStalled(std::size_t workers) {
  if (workers == 0) return;

  StallHandler handler;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    handler = stall_handler_;
  }
  if (handler) handler(workers);
}

} // namespace provgate::orchestrator
