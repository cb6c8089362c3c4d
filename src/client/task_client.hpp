#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "client/cancellation_bridge.hpp"
#include "client/errors.hpp"
#include "client/stream_receiver.hpp"
#include "config.hpp"

namespace stream_client {

enum class LogLevel { Info, Progress, Success, Error, Warning };

const char *level_name(LogLevel level);

// One console line. Appended in order, never modified.
struct LogEntry {
  std::uint64_t id = 0;
  std::string timestamp; // local HH:MM:SS.mmm
  LogLevel level = LogLevel::Info;
  std::string message;
};

// Exactly one per task run.
enum class TaskOutcome {
  None, // no task has finished yet
  Completed,
  LocallyAborted,
  ServerCancelled,
  TransportError
};

const char *outcome_name(TaskOutcome outcome);

using LogObserver = std::function<void(const LogEntry &)>;
using EventObserver = std::function<void(const Event &)>;

// Client-facing surface: start, cancel and clear, plus the console log and
// progress value the UI renders. Each task runs on a worker thread.
class TaskClient {
public:
  explicit TaskClient(const cancelstream::ClientConfig &config);
  TaskClient(const cancelstream::ClientConfig &config, Dialer dialer);
  ~TaskClient();

  TaskClient(const TaskClient &) = delete;
  TaskClient &operator=(const TaskClient &) = delete;

  // Observers run on the worker thread (or the caller's thread for entries
  // logged by start/cancel). Install before start_task().
  void set_log_observer(LogObserver observer);
  void set_event_observer(EventObserver observer);

  // Throws AlreadyRunning while a task is active. A failed connection is
  // not thrown: it ends the task with TaskOutcome::TransportError.
  void start_task();

  // No-op without an active task or when already cancelled.
  void cancel_task();

  // Throws TaskActive while a task is active.
  void clear_log();

  // Blocks until the current task (if any) has finished.
  void wait();
  bool wait_for(std::chrono::milliseconds timeout);

  bool is_running() const;
  double progress() const;
  TaskOutcome outcome() const;
  std::vector<LogEntry> log() const;

  const CancellationBridge &bridge() const { return bridge_; }

private:
  class Dispatch;

  void run_task(std::shared_ptr<TaskHandle> handle);
  void add_log(LogLevel level, const std::string &message);
  void set_progress(double percent);
  // First terminal outcome wins; later ones are ignored.
  void conclude(const std::shared_ptr<TaskHandle> &handle, TaskOutcome outcome,
                LogLevel level, const std::string &message);
  void fail_io(const std::shared_ptr<TaskHandle> &handle,
               const std::string &message);
  void mark_idle();

  cancelstream::ClientConfig config_;
  CancellationBridge bridge_;
  LogObserver log_observer_;
  EventObserver event_observer_;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  bool running_ = false;
  std::vector<LogEntry> log_;
  std::uint64_t next_log_id_ = 0;
  double progress_ = 0.0;
  TaskOutcome outcome_ = TaskOutcome::None;

  std::mutex cancel_mutex_;
  std::uint64_t cancel_claimed_ = 0; // handle id whose cancel is underway
  std::thread worker_;
};

} // namespace stream_client
