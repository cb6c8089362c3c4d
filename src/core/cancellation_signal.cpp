#include "cancellation_signal.hpp"

namespace stream_core {

bool CancellationSignal::request() {
  if (requested_.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }

  // Taking the lock orders the store before a waiter's predicate check,
  // so a waiter cannot miss the notification.
  { std::lock_guard<std::mutex> lock(mutex_); }
  cv_.notify_all();
  return true;
}

bool CancellationSignal::wait_for(std::chrono::milliseconds timeout) const {
  if (is_requested()) {
    return true;
  }
  if (timeout.count() <= 0) {
    return false;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return is_requested(); });
}

} // namespace stream_core
