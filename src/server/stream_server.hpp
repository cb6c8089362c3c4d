#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "config.hpp"
#include "core/cancellation_signal.hpp"
#include "executor/step_executor.hpp"
#include "server/stream_transmitter.hpp"
#include "transport/socket_stream.hpp"

namespace stream_server {

// Called on the task's thread once its run has ended.
using TaskObserver =
    std::function<void(std::uint64_t task_id, const stream_exec::RunResult &)>;

// Accepts connections and runs one independent task per connection.
// Each connection owns its own cancellation signal; nothing else is shared.
class StreamServer {
public:
  explicit StreamServer(const cancelstream::ServerConfig &config);
  ~StreamServer();

  StreamServer(const StreamServer &) = delete;
  StreamServer &operator=(const StreamServer &) = delete;

  // Observers must be installed before start().
  void set_event_observer(EventObserver observer);
  void set_task_observer(TaskObserver observer);

  bool start(std::string &err);

  // Cancels live tasks and joins every thread.
  void stop();

  bool is_running() const { return running_.load(); }
  uint16_t port() const { return listener_.port(); }
  std::size_t active_tasks() const;
  std::uint64_t tasks_served() const { return tasks_served_.load(); }

private:
  struct Session {
    std::uint64_t id = 0;
    std::unique_ptr<transport::SocketConnection> conn;
    stream_core::CancellationSignal signal;
    std::atomic<bool> streaming{false};
    std::atomic<bool> done{false};
    std::thread thread;
  };

  void accept_loop();
  void run_session(Session *session);
  void reject(transport::Connection &conn, int status,
              const std::string &reason);
  void reap_sessions(bool all);

  cancelstream::ServerConfig config_;
  stream_exec::StepExecutor executor_;
  EventObserver event_observer_;
  TaskObserver task_observer_;

  transport::Listener listener_;
  std::thread accept_thread_;
  std::atomic<bool> running_{false};

  mutable std::mutex sessions_mutex_;
  std::list<std::unique_ptr<Session>> sessions_;
  std::uint64_t next_session_id_ = 1;
  std::atomic<std::uint64_t> tasks_served_{0};
};

} // namespace stream_server
