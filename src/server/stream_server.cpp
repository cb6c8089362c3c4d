#include "stream_server.hpp"

#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

#include "transport/http_head.hpp"

namespace stream_server {

static stream_exec::StepExecutor
make_executor(const cancelstream::ServerConfig &config) {
  stream_exec::TaskOptions options;
  options.total_steps = config.total_steps;
  options.step_duration = std::chrono::milliseconds(config.step_duration_ms);

  stream_exec::StepWork work = stream_exec::simulated_work(options.step_duration);
  if (config.fail_at_step > 0) {
    std::cerr << "[StreamServer] CHAOS MODE: tasks fault at step "
              << config.fail_at_step << std::endl;
    work = stream_exec::faulting_work(std::move(work), config.fail_at_step);
  }
  return stream_exec::StepExecutor(options, std::move(work));
}

StreamServer::StreamServer(const cancelstream::ServerConfig &config)
    : config_(config), executor_(make_executor(config)) {}

StreamServer::~StreamServer() { stop(); }

void StreamServer::set_event_observer(EventObserver observer) {
  event_observer_ = std::move(observer);
}

void StreamServer::set_task_observer(TaskObserver observer) {
  task_observer_ = std::move(observer);
}

bool StreamServer::start(std::string &err) {
  if (running_.load()) {
    err = "server already running";
    return false;
  }

  if (!listener_.listen(config_.bind_address, config_.port, config_.backlog,
                        err)) {
    return false;
  }

  std::cerr << "[StreamServer] Listening on " << config_.bind_address << ":"
            << listener_.port() << config_.path << " (steps="
            << config_.total_steps << ", step_ms=" << config_.step_duration_ms
            << ")" << std::endl;

  running_.store(true);
  accept_thread_ = std::thread(&StreamServer::accept_loop, this);
  return true;
}

void StreamServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  std::cerr << "[StreamServer] Stopping" << std::endl;

  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  listener_.close();

  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto &session : sessions_) {
      // Streaming tasks get to acknowledge; sessions still waiting on a
      // request head are torn down.
      if (session->streaming.load()) {
        session->signal.request();
      } else {
        session->conn->abort();
      }
    }
  }

  reap_sessions(true);
  std::cerr << "[StreamServer] Stopped after " << tasks_served_.load()
            << " task(s)" << std::endl;
}

std::size_t StreamServer::active_tasks() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  std::size_t n = 0;
  for (const auto &session : sessions_) {
    if (!session->done.load()) {
      ++n;
    }
  }
  return n;
}

void StreamServer::accept_loop() {
  const auto poll_interval = std::chrono::milliseconds(100);

  while (running_.load()) {
    std::string io_err;
    auto conn = listener_.accept(poll_interval, io_err);
    reap_sessions(false);

    if (!conn) {
      if (!io_err.empty()) {
        std::cerr << "[StreamServer] accept error: " << io_err << std::endl;
        std::this_thread::sleep_for(poll_interval);
      }
      continue;
    }

    auto session = std::make_unique<Session>();
    session->conn = std::move(conn);
    Session *raw = session.get();
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      session->id = next_session_id_++;
      sessions_.push_back(std::move(session));
    }
    raw->thread = std::thread(&StreamServer::run_session, this, raw);
  }
}

void StreamServer::reject(transport::Connection &conn, int status,
                          const std::string &reason) {
  std::string io_err;
  if (!transport::write_error_response(conn, status, reason, io_err)) {
    std::cerr << "[StreamServer] failed writing " << status
              << " response: " << io_err << std::endl;
  }
}

void StreamServer::run_session(Session *session) {
  transport::SocketConnection &conn = *session->conn;
  const std::string tag = "[StreamServer] task " + std::to_string(session->id);

  std::string head, body, io_err;
  transport::RequestHead request;

  if (!transport::read_head(conn, head, body, io_err)) {
    std::cerr << tag << ": no request (" << io_err << ")" << std::endl;
  } else if (!transport::parse_request_head(head, request, io_err)) {
    std::cerr << tag << ": bad request (" << io_err << ")" << std::endl;
    reject(conn, 400, "Bad Request");
  } else if (request.method != "GET") {
    reject(conn, 405, "Method Not Allowed");
  } else if (request.path != config_.path) {
    reject(conn, 404, "Not Found");
  } else if (!transport::write_event_stream_head(conn, io_err)) {
    std::cerr << tag << ": failed writing response head (" << io_err << ")"
              << std::endl;
  } else {
    session->streaming.store(true);
    std::cerr << tag << ": streaming " << config_.total_steps << " steps"
              << std::endl;

    const stream_exec::RunResult result = serve_task(
        conn, executor_, session->signal, event_observer_, config_.verbose);
    ++tasks_served_;

    std::cerr << tag << ": " << stream_exec::outcome_name(result.outcome)
              << " at step " << result.step << std::endl;
    if (task_observer_) {
      task_observer_(session->id, result);
    }
  }

  conn.close();
  session->done.store(true);
}

void StreamServer::reap_sessions(bool all) {
  std::vector<std::unique_ptr<Session>> finished;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (all || (*it)->done.load()) {
        finished.push_back(std::move(*it));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto &session : finished) {
    if (session->thread.joinable()) {
      session->thread.join();
    }
  }
}

} // namespace stream_server
