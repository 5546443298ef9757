#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace provgate::orchestrator {

using EvaluationTask = std::function<void()>;

// Called with the number of workers held by gates that overran their timeout.
using StallHandler = std::function<void(std::size_t)>;

/*
  Thread-safe blocking queue for evaluation workers.
*/
class EvaluationScheduler {
 public:
  // Returns false once shut down.
  bool Enqueue(EvaluationTask task);

  // blocking wait; nullopt after shutdown once the queue drains
  std::optional<EvaluationTask> Dequeue();

  void Shutdown();

  void SetStallHandler(StallHandler handler);

  // Reports workers stuck in overdue gates so the pool can replace them.
  void ReportStalled(std::size_t workers);

 private:
  std::mutex                 mutex_;
  std::condition_variable    cv_;
  std::queue<EvaluationTask> queue_;
  bool                       shutdown_ = false;
  StallHandler               stall_handler_;
};

} // namespace provgate::orchestrator
