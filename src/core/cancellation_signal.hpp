#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace stream_core {

// One-shot cancellation latch for a single task.
// Written by the inbound-abort listener, polled by the step executor.
// Transitions false -> true at most once and never resets.
class CancellationSignal {
public:
  CancellationSignal() = default;

  CancellationSignal(const CancellationSignal &) = delete;
  CancellationSignal &operator=(const CancellationSignal &) = delete;

  // Raises the signal. Returns true only for the call that raised it.
  bool request();

  bool is_requested() const {
    return requested_.load(std::memory_order_acquire);
  }

  // Sleeps for up to `timeout`, returning early once the signal is raised.
  // Returns true if the signal is raised on return.
  bool wait_for(std::chrono::milliseconds timeout) const;

private:
  std::atomic<bool> requested_{false};

  // Only used to wake wait_for(); the flag itself is the atomic above.
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

} // namespace stream_core
