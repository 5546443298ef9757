#include "batch_ticker.hpp"

#include <condition_variable>
#include <mutex>

#include "internal/observability/logging.hpp"

namespace provgate::audit {

using provgate::observability::IntField;
using provgate::observability::StringField;

BatchTicker::BatchTicker(std::shared_ptr<AuditTrail> trail, std::chrono::milliseconds interval)
    : trail_(std::move(trail)), interval_(interval) {
}

BatchTicker::~BatchTicker() {
  Stop();
}

void BatchTicker::Start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::jthread([this](std::stop_token stop) { Run(stop); });
}

void BatchTicker::Stop() {
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  thread_.join();
}

void BatchTicker::Run(std::stop_token stop) {
  std::mutex                  mutex;
  std::condition_variable_any cv;

  while (!stop.stop_requested()) {
    {
      std::unique_lock lock(mutex);
      cv.wait_for(lock, stop, interval_, [] { return false; });
    }
    if (stop.stop_requested()) {
      break;
    }

    try {
      if (auto batch = trail_->SealIfDue()) {
        PROVGATE_LOG_DEBUG("Aged batch sealed", {StringField("batch_id", batch->Id()),
                                                 IntField("leaves", static_cast<int64_t>(batch->Record().leaf_count()))});
      }
    } catch (const std::exception& e) {
      PROVGATE_LOG_ERROR("Batch tick failed", {StringField("error", e.what())});
    }
  }
}

} // namespace provgate::audit
