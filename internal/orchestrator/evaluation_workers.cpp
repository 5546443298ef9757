#include "evaluation_workers.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace provgate::orchestrator {

EvaluationWorkers::EvaluationWorkers(std::shared_ptr<EvaluationScheduler> scheduler, std::size_t threads)
    : scheduler_(std::move(scheduler)), thread_count_(threads == 0 ? 1 : threads), max_threads_(thread_count_ * 2) {
}

EvaluationWorkers::~EvaluationWorkers() {
  Stop();
}

void EvaluationWorkers::Start() {
  {
    std::lock_guard lock(threads_mutex_);
    if (running_.exchange(true)) return;
    for (std::size_t i = 0; i < thread_count_; ++i) {
      threads_.emplace_back(&EvaluationWorkers::Run, this);
    }
  }
  scheduler_->SetStallHandler([this](std::size_t stalled) { Replace(stalled); });
  PROVGATE_LOG_DEBUG("Evaluation workers started", {observability::IntField("threads", static_cast<std::int64_t>(thread_count_))});
}

void EvaluationWorkers::Stop() {
  scheduler_->Shutdown();
  scheduler_->SetStallHandler({});

  std::vector<std::thread> threads;
  {
    std::lock_guard lock(threads_mutex_);
    running_ = false;
    threads.swap(threads_);
  }
  for (auto& thread : threads) {
    if (thread.joinable()) thread.join();
  }
}

std::size_t EvaluationWorkers::ThreadCount() const {
  std::lock_guard lock(threads_mutex_);
  return threads_.size();
}

void EvaluationWorkers::Replace(std::size_t stalled) {
  std::lock_guard lock(threads_mutex_);
  if (!running_) return;

  const std::size_t room  = max_threads_ > threads_.size() ? max_threads_ - threads_.size() : 0;
  const std::size_t added = std::min(stalled, room);
  for (std::size_t i = 0; i < added; ++i) {
    threads_.emplace_back(&EvaluationWorkers::Run, this);
  }

  if (added < stalled) {
    PROVGATE_LOG_WARN("Evaluation pool at capacity; stalled gates still hold workers",
                      {observability::IntField("stalled", static_cast<std::int64_t>(stalled)),
                       observability::IntField("threads", static_cast<std::int64_t>(threads_.size()))});
  } else {
    PROVGATE_LOG_INFO("Replaced stalled evaluation workers", {observability::IntField("added", static_cast<std::int64_t>(added)),
                                                              observability::IntField("threads", static_cast<std::int64_t>(threads_.size()))});
  }
}

void EvaluationWorkers::Run() {
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      PROVGATE_LOG_ERROR("evaluation task escaped", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace provgate::orchestrator
