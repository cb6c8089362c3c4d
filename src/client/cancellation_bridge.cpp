#include "cancellation_bridge.hpp"

#include <utility>

#include "client/errors.hpp"

namespace stream_client {

// -----------------------------
// TaskHandle
// -----------------------------

TaskHandle::TaskHandle(std::uint64_t id, CancelMode mode)
    : id_(id), mode_(mode) {}

TaskHandle::~TaskHandle() { close(); }

bool TaskHandle::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_.exchange(true)) {
    return false;
  }
  apply_cancel_locked();
  return true;
}

void TaskHandle::apply_cancel_locked() {
  if (!conn_) {
    return;
  }
  switch (mode_) {
  case CancelMode::Abort:
    conn_->abort();
    break;
  case CancelMode::Graceful:
    conn_->shutdown_write();
    break;
  }
}

void TaskHandle::attach(std::unique_ptr<transport::Connection> conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_ = std::move(conn);
  if (cancelled_.load()) {
    apply_cancel_locked();
  }
}

transport::Connection *TaskHandle::connection() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return conn_.get();
}

void TaskHandle::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (conn_) {
    conn_->close();
  }
}

// -----------------------------
// CancellationBridge
// -----------------------------

CancellationBridge::CancellationBridge(Dialer dialer, CancelMode mode)
    : dialer_(std::move(dialer)), mode_(mode) {}

std::shared_ptr<TaskHandle> CancellationBridge::begin() {
  std::shared_ptr<TaskHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
      throw AlreadyRunning();
    }
    handle = std::make_shared<TaskHandle>(next_id_++, mode_);
    active_ = handle;
  }

  // Dial outside the lock so cancel() can land while connecting.
  std::string err;
  std::unique_ptr<transport::Connection> conn =
      dialer_ ? dialer_(err) : nullptr;
  if (!conn) {
    finish(handle);
    throw TransportError(err.empty() ? "no connection" : err);
  }

  handle->attach(std::move(conn));
  return handle;
}

bool CancellationBridge::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!active_ || !active_->cancel()) {
    return false;
  }
  ++cancellations_;
  return true;
}

void CancellationBridge::finish(const std::shared_ptr<TaskHandle> &handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_ && active_ == handle) {
    active_.reset();
  }
}

bool CancellationBridge::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ != nullptr;
}

std::shared_ptr<TaskHandle> CancellationBridge::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

void CancellationBridge::set_cancel_mode(CancelMode mode) {
  std::lock_guard<std::mutex> lock(mutex_);
  mode_ = mode;
}

CancelMode CancellationBridge::cancel_mode() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mode_;
}

std::size_t CancellationBridge::cancellations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancellations_;
}

} // namespace stream_client
