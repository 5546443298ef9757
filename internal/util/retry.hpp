#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace provgate::util {

struct BackoffPolicy {
  uint32_t                  max_attempts{3};
  std::chrono::milliseconds initial_backoff{50};
  std::chrono::milliseconds max_backoff{1000};
};

/*
  Runs fn until it returns, retrying only on exceptions of type Retryable.

  The delay doubles after each failed attempt and is capped at max_backoff.
  on_retry(attempt, error) is called before each sleep. When the budget is
  spent the last Retryable is rethrown unchanged.
*/
template <typename Retryable, typename Fn>
auto RetryWithBackoff(const BackoffPolicy& policy, Fn&& fn, const std::function<void(uint32_t, const Retryable&)>& on_retry = {}) {
  const uint32_t attempts = std::max<uint32_t>(policy.max_attempts, 1);
  auto           delay    = policy.initial_backoff;

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const Retryable& e) {
      if (attempt >= attempts) {
        throw;
      }
      if (on_retry) {
        on_retry(attempt, e);
      }
      std::this_thread::sleep_for(delay);
      delay = std::min(delay * 2, policy.max_backoff);
    }
  }
}

} // namespace provgate::util
