#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "evaluation_scheduler.hpp"

namespace provgate::orchestrator {

/*
  Pool of threads running gate evaluations.

  A gate that outlives its timeout keeps its worker until it returns; the
  orchestrator has already moved on with a REVIEW verdict by then and reports
  the stall, and the pool starts a replacement thread. Replacements are capped
  at the configured size, so the pool never exceeds twice its base size.
*/
class EvaluationWorkers {
 public:
  EvaluationWorkers(std::shared_ptr<EvaluationScheduler> scheduler, std::size_t threads);
  ~EvaluationWorkers();

  EvaluationWorkers(const EvaluationWorkers&)            = delete;
  EvaluationWorkers& operator=(const EvaluationWorkers&) = delete;

  void Start();
  void Stop();

  std::size_t ThreadCount() const;

 private:
  void Run();
  void Replace(std::size_t stalled);

  std::shared_ptr<EvaluationScheduler> scheduler_;
  std::size_t                          thread_count_;
  std::size_t                          max_threads_;

  mutable std::mutex       threads_mutex_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace provgate::orchestrator
