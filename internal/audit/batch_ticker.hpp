#pragma once

#include <chrono>
#include <memory>
#include <thread>

#include "audit_trail.hpp"

namespace provgate::audit {

/*
  Background thread that closes batches whose age limit has passed even
  when no new receipt arrives to trigger the check.
*/
class BatchTicker {
 public:
  BatchTicker(std::shared_ptr<AuditTrail> trail, std::chrono::milliseconds interval);
  ~BatchTicker();

  BatchTicker(const BatchTicker&)            = delete;
  BatchTicker& operator=(const BatchTicker&) = delete;

  void Start();
  void Stop();

 private:
  void Run(std::stop_token stop);

  std::shared_ptr<AuditTrail> trail_;
  std::chrono::milliseconds   interval_;
  std::jthread                thread_;
};

} // namespace provgate::audit
