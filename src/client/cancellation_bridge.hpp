#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "config.hpp"
#include "transport/socket_stream.hpp"

namespace stream_client {

using cancelstream::CancelMode;

// Opens a fresh connection for a task. Returns nullptr and sets err on
// failure.
using Dialer =
    std::function<std::unique_ptr<transport::Connection>(std::string &err)>;

// Live cancellation handle for one in-flight task. Owns the task's
// connection once attached.
class TaskHandle {
public:
  TaskHandle(std::uint64_t id, CancelMode mode);
  ~TaskHandle();

  TaskHandle(const TaskHandle &) = delete;
  TaskHandle &operator=(const TaskHandle &) = delete;

  std::uint64_t id() const { return id_; }
  CancelMode mode() const { return mode_; }

  // Applies the cancel mode to the connection (or to the connection once
  // it is attached). Returns true only for the first call.
  bool cancel();
  bool cancelled() const { return cancelled_.load(); }

  // Takes ownership of the task's connection. If cancel() already ran the
  // connection is cancelled immediately.
  void attach(std::unique_ptr<transport::Connection> conn);

  // Null until attach(). Stable for the handle's lifetime afterwards.
  transport::Connection *connection() const;

  void close();

private:
  void apply_cancel_locked();

  const std::uint64_t id_;
  const CancelMode mode_;
  std::atomic<bool> cancelled_{false};

  mutable std::mutex mutex_;
  std::unique_ptr<transport::Connection> conn_;
};

// Holds at most one live task handle. A second begin() while one is active
// is rejected with AlreadyRunning.
class CancellationBridge {
public:
  explicit CancellationBridge(Dialer dialer,
                              CancelMode mode = CancelMode::Abort);

  CancellationBridge(const CancellationBridge &) = delete;
  CancellationBridge &operator=(const CancellationBridge &) = delete;

  // Publishes a new handle, then dials and attaches its connection.
  // Throws AlreadyRunning if a task is active, TransportError if the dial
  // fails (the handle is cleared again).
  std::shared_ptr<TaskHandle> begin();

  // Cancels the active task. No-op without one, and on repeated calls.
  // Returns true only when this call triggered the cancellation.
  bool cancel();

  // Clears the active handle once its task reached a terminal state.
  // Ignores handles that are no longer the active one.
  void finish(const std::shared_ptr<TaskHandle> &handle);

  bool active() const;
  std::shared_ptr<TaskHandle> current() const;

  void set_cancel_mode(CancelMode mode);
  CancelMode cancel_mode() const;

  // Cancellations actually applied over this bridge's lifetime.
  std::size_t cancellations() const;

private:
  Dialer dialer_;

  mutable std::mutex mutex_;
  CancelMode mode_;
  std::shared_ptr<TaskHandle> active_;
  std::uint64_t next_id_ = 1;
  std::size_t cancellations_ = 0;
};

} // namespace stream_client
