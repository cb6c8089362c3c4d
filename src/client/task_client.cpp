#include "task_client.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#include "transport/http_head.hpp"

namespace stream_client {

namespace {

std::string display_time() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

  std::tm local{};
  localtime_r(&t, &local);

  std::ostringstream ss;
  ss << std::put_time(&local, "%H:%M:%S") << "." << std::setfill('0')
     << std::setw(3) << ms.count();
  return ss.str();
}

Dialer tcp_dialer(const cancelstream::ClientConfig &config) {
  const std::string host = config.host;
  const uint16_t port = config.port;
  return [host, port](std::string &err)
             -> std::unique_ptr<transport::Connection> {
    return transport::connect_tcp(host, port, err);
  };
}

} // namespace

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Info:
    return "info";
  case LogLevel::Progress:
    return "progress";
  case LogLevel::Success:
    return "success";
  case LogLevel::Error:
    return "error";
  case LogLevel::Warning:
    return "warning";
  }
  return "unknown";
}

const char *outcome_name(TaskOutcome outcome) {
  switch (outcome) {
  case TaskOutcome::None:
    return "none";
  case TaskOutcome::Completed:
    return "completed";
  case TaskOutcome::LocallyAborted:
    return "locally aborted";
  case TaskOutcome::ServerCancelled:
    return "server acknowledged cancellation";
  case TaskOutcome::TransportError:
    return "transport error";
  }
  return "unknown";
}

// -----------------------------
// Event dispatch into the log model
// -----------------------------

class TaskClient::Dispatch : public EventHandler {
public:
  Dispatch(TaskClient &client, std::shared_ptr<TaskHandle> handle)
      : client_(client), handle_(std::move(handle)) {}

  void on_event(const Event &event) override {
    const auto kind = stream_codec::kind_of(event);
    if (!kind) {
      return;
    }

    switch (*kind) {
    case stream_codec::EventKind::Progress:
      client_.set_progress(100.0 * event.step() / event.total_steps());
      client_.add_log(LogLevel::Progress, event.message());
      break;
    case stream_codec::EventKind::Complete:
      client_.set_progress(100.0);
      client_.conclude(handle_, TaskOutcome::Completed, LogLevel::Success,
                       event.message());
      break;
    case stream_codec::EventKind::Cancelled:
      client_.conclude(handle_, TaskOutcome::ServerCancelled,
                       LogLevel::Warning,
                       "Server acknowledged cancellation at step " +
                           std::to_string(event.step()));
      break;
    }

    if (client_.event_observer_) {
      client_.event_observer_(event);
    }
  }

  void on_stream_end() override {
    client_.add_log(LogLevel::Info, "Stream ended");
    // Only lands when no terminal event arrived (e.g. the server faulted).
    client_.conclude(handle_, TaskOutcome::TransportError, LogLevel::Error,
                     "Error: stream ended before the task finished");
  }

  void on_local_abort() override {
    client_.conclude(handle_, TaskOutcome::LocallyAborted, LogLevel::Warning,
                     "Request was cancelled by user");
  }

  void on_transport_error(const std::string &message) override {
    client_.conclude(handle_, TaskOutcome::TransportError, LogLevel::Error,
                     "Error: " + message);
  }

private:
  TaskClient &client_;
  std::shared_ptr<TaskHandle> handle_;
};

// -----------------------------
// TaskClient
// -----------------------------

TaskClient::TaskClient(const cancelstream::ClientConfig &config)
    : TaskClient(config, tcp_dialer(config)) {}

TaskClient::TaskClient(const cancelstream::ClientConfig &config, Dialer dialer)
    : config_(config), bridge_(std::move(dialer), config.cancel_mode) {}

TaskClient::~TaskClient() {
  bridge_.cancel();
  wait();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void TaskClient::set_log_observer(LogObserver observer) {
  log_observer_ = std::move(observer);
}

void TaskClient::set_event_observer(EventObserver observer) {
  event_observer_ = std::move(observer);
}

void TaskClient::start_task() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      throw AlreadyRunning();
    }
    running_ = true;
    log_.clear();
    next_log_id_ = 0;
    progress_ = 0.0;
    outcome_ = TaskOutcome::None;
  }

  // The previous worker marked itself idle as its last action.
  if (worker_.joinable()) {
    worker_.join();
  }

  add_log(LogLevel::Info, "Starting slow request...");

  std::shared_ptr<TaskHandle> handle;
  try {
    handle = bridge_.begin();
  } catch (const TransportError &e) {
    conclude(nullptr, TaskOutcome::TransportError, LogLevel::Error,
             std::string("Error: ") + e.what());
    mark_idle();
    return;
  } catch (const AlreadyRunning &) {
    mark_idle();
    throw;
  }

  try {
    worker_ = std::thread(&TaskClient::run_task, this, handle);
  } catch (const std::system_error &e) {
    conclude(handle, TaskOutcome::TransportError, LogLevel::Error,
             std::string("Error: failed to start worker: ") + e.what());
    handle->close();
    mark_idle();
  }
}

void TaskClient::cancel_task() {
  {
    std::lock_guard<std::mutex> guard(cancel_mutex_);
    const std::shared_ptr<TaskHandle> handle = bridge_.current();
    if (!handle || handle->cancelled() || handle->id() == cancel_claimed_) {
      return;
    }
    cancel_claimed_ = handle->id();
  }

  // Logged outside the lock: the log observer may call back in.
  add_log(LogLevel::Info, "Cancelling request...");
  if (!bridge_.cancel() && config_.verbose) {
    std::cerr << "[TaskClient] task finished before the cancel landed"
              << std::endl;
  }
}

void TaskClient::clear_log() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    throw TaskActive();
  }
  log_.clear();
  progress_ = 0.0;
}

void TaskClient::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return !running_; });
}

bool TaskClient::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return !running_; });
}

bool TaskClient::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

double TaskClient::progress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return progress_;
}

TaskOutcome TaskClient::outcome() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outcome_;
}

std::vector<LogEntry> TaskClient::log() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return log_;
}

void TaskClient::run_task(std::shared_ptr<TaskHandle> handle) {
  transport::Connection *conn = handle->connection();
  std::string io_err, head, body;
  int status = 0;

  if (!transport::write_request(*conn, config_.host, config_.path, io_err) ||
      !transport::read_head(*conn, head, body, io_err) ||
      !transport::parse_status_code(head, status, io_err)) {
    fail_io(handle, io_err);
  } else if (status != 200) {
    fail_io(handle, "HTTP error! status: " + std::to_string(status));
  } else {
    add_log(LogLevel::Info, "Connection established, receiving stream...");

    Dispatch dispatch(*this, handle);
    StreamReceiver receiver(dispatch);
    receiver.feed(body);
    const ReceiveOutcome received = receiver.run(*conn, *handle);

    if (config_.verbose) {
      std::cerr << "[TaskClient] stream "
                << (received == ReceiveOutcome::StreamEnded      ? "ended"
                    : received == ReceiveOutcome::LocallyAborted ? "aborted"
                                                                 : "failed")
                << ", dropped " << receiver.dropped_frames()
                << " malformed frame(s)" << std::endl;
    }
  }

  bridge_.finish(handle);
  handle->close();
  mark_idle();
}

void TaskClient::fail_io(const std::shared_ptr<TaskHandle> &handle,
                         const std::string &message) {
  if (handle->cancelled()) {
    conclude(handle, TaskOutcome::LocallyAborted, LogLevel::Warning,
             "Request was cancelled by user");
  } else {
    conclude(handle, TaskOutcome::TransportError, LogLevel::Error,
             "Error: " + message);
  }
}

void TaskClient::add_log(LogLevel level, const std::string &message) {
  LogEntry entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entry.id = next_log_id_++;
    entry.timestamp = display_time();
    entry.level = level;
    entry.message = message;
    log_.push_back(entry);
  }
  if (log_observer_) {
    log_observer_(entry);
  }
}

void TaskClient::set_progress(double percent) {
  std::lock_guard<std::mutex> lock(mutex_);
  progress_ = percent;
}

void TaskClient::conclude(const std::shared_ptr<TaskHandle> &handle,
                          TaskOutcome outcome, LogLevel level,
                          const std::string &message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome_ != TaskOutcome::None) {
      return;
    }
    outcome_ = outcome;
  }

  // Cleared before the entry is published, so a cancel triggered from the
  // log observer is already a no-op.
  if (handle) {
    bridge_.finish(handle);
  }
  add_log(level, message);
}

void TaskClient::mark_idle() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  idle_cv_.notify_all();
}

} // namespace stream_client
