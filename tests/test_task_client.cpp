#include <algorithm>
#include <array>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "client/task_client.hpp"
#include "server/stream_transmitter.hpp"
#include "transport/http_head.hpp"

namespace stream_client {
namespace {

using namespace std::chrono_literals;
using stream_codec::encode;
using stream_codec::make_complete;
using stream_codec::make_progress;

// In-process server: every dial creates a socket pair and runs the script
// against the far end on its own thread.
class FakeServer {
public:
  using Script = std::function<void(transport::Connection &)>;

  explicit FakeServer(Script script) : script_(std::move(script)) {}

  ~FakeServer() { join(); }

  void join() {
    for (auto &t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  Dialer dialer() {
    return [this](std::string &err) -> std::unique_ptr<transport::Connection> {
      std::unique_ptr<transport::SocketConnection> local, remote;
      if (!transport::make_socket_pair(local, remote, err)) {
        return nullptr;
      }
      std::shared_ptr<transport::SocketConnection> peer(std::move(remote));
      threads_.emplace_back([this, peer] { script_(*peer); });
      return local;
    };
  }

private:
  Script script_;
  std::vector<std::thread> threads_;
};

bool open_stream(transport::Connection &conn) {
  std::string head, body, err;
  return transport::read_head(conn, head, body, err) &&
         transport::write_event_stream_head(conn, err);
}

void send(transport::Connection &conn, const std::string &bytes) {
  std::string err;
  (void)conn.write_all(bytes.data(), bytes.size(), err);
}

// Blocks until the client side goes away.
void drain_until_eof(transport::Connection &conn) {
  std::array<char, 64> buf;
  std::string err;
  while (conn.read_some(buf.data(), buf.size(), err) > 0) {
  }
}

cancelstream::ClientConfig test_config(
    CancelMode mode = CancelMode::Abort) {
  cancelstream::ClientConfig config;
  config.host = "localhost";
  config.path = "/api/slow";
  config.cancel_mode = mode;
  return config;
}

std::vector<std::string> messages(const TaskClient &client) {
  std::vector<std::string> out;
  for (const auto &entry : client.log()) {
    out.push_back(entry.message);
  }
  return out;
}

bool contains(const std::vector<std::string> &v, const std::string &s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

TEST(TaskClientTest, CompletedRunFillsLogAndProgress) {
  FakeServer server([](transport::Connection &conn) {
    if (!open_stream(conn)) {
      return;
    }
    const std::string wire = encode(make_progress(1, 2)) +
                             encode(make_progress(2, 2)) +
                             encode(make_complete());
    // Split mid-frame.
    send(conn, wire.substr(0, 30));
    send(conn, wire.substr(30));
    conn.shutdown_write();
    drain_until_eof(conn);
  });

  TaskClient client(test_config(), server.dialer());
  client.start_task();
  ASSERT_TRUE(client.wait_for(5s));

  EXPECT_EQ(client.outcome(), TaskOutcome::Completed);
  EXPECT_DOUBLE_EQ(client.progress(), 100.0);
  EXPECT_FALSE(client.is_running());
  EXPECT_FALSE(client.bridge().active());

  const std::vector<std::string> expected = {
      "Starting slow request...",
      "Connection established, receiving stream...",
      "Processing step 1 of 2...",
      "Processing step 2 of 2...",
      "All steps completed successfully!",
      "Stream ended"};
  EXPECT_EQ(messages(client), expected);

  const auto log = client.log();
  for (std::size_t i = 0; i < log.size(); ++i) {
    EXPECT_EQ(log[i].id, i);
    ASSERT_EQ(log[i].timestamp.size(), 12u);
    EXPECT_EQ(log[i].timestamp[2], ':');
    EXPECT_EQ(log[i].timestamp[5], ':');
    EXPECT_EQ(log[i].timestamp[8], '.');
  }
  EXPECT_EQ(log[2].level, LogLevel::Progress);
  EXPECT_EQ(log[4].level, LogLevel::Success);
}

TEST(TaskClientTest, ProgressTracksLatestStep) {
  FakeServer server([](transport::Connection &conn) {
    if (!open_stream(conn)) {
      return;
    }
    send(conn, encode(make_progress(1, 4)));
    drain_until_eof(conn);
  });

  TaskClient client(test_config(), server.dialer());
  std::mutex mutex;
  std::condition_variable cv;
  bool got_progress = false;
  client.set_event_observer([&](const Event &) {
    std::lock_guard<std::mutex> lock(mutex);
    got_progress = true;
    cv.notify_all();
  });

  client.start_task();
  {
    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, 5s, [&] { return got_progress; }));
  }
  EXPECT_DOUBLE_EQ(client.progress(), 25.0);
  EXPECT_TRUE(client.is_running());

  EXPECT_THROW(client.start_task(), AlreadyRunning);
  EXPECT_THROW(client.clear_log(), TaskActive);

  client.cancel_task();
  ASSERT_TRUE(client.wait_for(5s));
  EXPECT_EQ(client.outcome(), TaskOutcome::LocallyAborted);
}

TEST(TaskClientTest, AbortCancelStopsServerTask) {
  stream_exec::TaskOptions options;
  options.total_steps = 10;
  options.step_duration = 100ms;
  const stream_exec::StepExecutor executor(options);
  stream_exec::RunResult server_result;

  FakeServer server([&](transport::Connection &conn) {
    if (!open_stream(conn)) {
      return;
    }
    stream_core::CancellationSignal signal;
    server_result = stream_server::serve_task(conn, executor, signal);
  });

  {
    TaskClient client(test_config(), server.dialer());
    client.set_event_observer([&client](const Event &event) {
      if (event.type() == "progress" && event.step() == 2) {
        client.cancel_task();
      }
    });

    client.start_task();
    ASSERT_TRUE(client.wait_for(5s));

    EXPECT_EQ(client.outcome(), TaskOutcome::LocallyAborted);
    EXPECT_LT(client.progress(), 100.0);
    const auto log = messages(client);
    EXPECT_TRUE(contains(log, "Cancelling request..."));
    EXPECT_EQ(log.back(), "Request was cancelled by user");
    EXPECT_FALSE(contains(log, "All steps completed successfully!"));
    EXPECT_EQ(client.bridge().cancellations(), 1u);
  }

  server.join();
  EXPECT_EQ(server_result.outcome, stream_exec::RunOutcome::Cancelled);
  EXPECT_EQ(server_result.step, 3);
}

TEST(TaskClientTest, GracefulCancelIsAcknowledgedByServer) {
  stream_exec::TaskOptions options;
  options.total_steps = 10;
  options.step_duration = 200ms;
  const stream_exec::StepExecutor executor(options);

  FakeServer server([&executor](transport::Connection &conn) {
    if (!open_stream(conn)) {
      return;
    }
    stream_core::CancellationSignal signal;
    (void)stream_server::serve_task(conn, executor, signal);
  });

  TaskClient client(test_config(CancelMode::Graceful), server.dialer());
  client.set_event_observer([&client](const Event &event) {
    if (event.type() == "progress" && event.step() == 2) {
      client.cancel_task();
    }
  });

  client.start_task();
  ASSERT_TRUE(client.wait_for(5s));

  EXPECT_EQ(client.outcome(), TaskOutcome::ServerCancelled);
  EXPECT_DOUBLE_EQ(client.progress(), 20.0);
  const auto log = client.log();
  const auto ack = std::find_if(log.begin(), log.end(), [](const LogEntry &e) {
    return e.level == LogLevel::Warning;
  });
  ASSERT_NE(ack, log.end());
  EXPECT_EQ(ack->message, "Server acknowledged cancellation at step 3");
}

TEST(TaskClientTest, LogObserverMayCancelFromWithinCallback) {
  FakeServer server([](transport::Connection &conn) {
    if (!open_stream(conn)) {
      return;
    }
    drain_until_eof(conn);
  });

  TaskClient client(test_config(), server.dialer());
  // Every entry triggers a cancel, including "Cancelling request..."
  // itself, which re-enters cancel_task on the same thread.
  client.set_log_observer([&client](const LogEntry &) { client.cancel_task(); });

  client.start_task();
  ASSERT_TRUE(client.wait_for(5s));

  EXPECT_EQ(client.outcome(), TaskOutcome::LocallyAborted);
  const auto log = messages(client);
  EXPECT_EQ(std::count(log.begin(), log.end(), "Cancelling request..."), 1);
  EXPECT_EQ(log.back(), "Request was cancelled by user");
  EXPECT_EQ(client.bridge().cancellations(), 1u);
}

TEST(TaskClientTest, StreamEndingWithoutTerminalIsTransportError) {
  FakeServer server([](transport::Connection &conn) {
    if (!open_stream(conn)) {
      return;
    }
    send(conn, encode(make_progress(1, 3)));
    conn.shutdown_write();
    drain_until_eof(conn);
  });

  TaskClient client(test_config(), server.dialer());
  client.start_task();
  ASSERT_TRUE(client.wait_for(5s));

  EXPECT_EQ(client.outcome(), TaskOutcome::TransportError);
  const auto log = messages(client);
  EXPECT_TRUE(contains(log, "Stream ended"));
  EXPECT_EQ(log.back(), "Error: stream ended before the task finished");
}

TEST(TaskClientTest, NonSuccessStatusIsReported) {
  FakeServer server([](transport::Connection &conn) {
    std::string head, body, err;
    if (transport::read_head(conn, head, body, err)) {
      (void)transport::write_error_response(conn, 404, "Not Found", err);
    }
    conn.shutdown_write();
    drain_until_eof(conn);
  });

  TaskClient client(test_config(), server.dialer());
  client.start_task();
  ASSERT_TRUE(client.wait_for(5s));

  EXPECT_EQ(client.outcome(), TaskOutcome::TransportError);
  EXPECT_EQ(messages(client).back(), "Error: HTTP error! status: 404");
  EXPECT_DOUBLE_EQ(client.progress(), 0.0);
}

TEST(TaskClientTest, FailedConnectEndsTaskWithoutThrowing) {
  TaskClient client(test_config(), [](std::string &err) {
    err = "connect failed: Connection refused";
    return std::unique_ptr<transport::Connection>();
  });

  EXPECT_NO_THROW(client.start_task());
  EXPECT_FALSE(client.is_running());
  EXPECT_EQ(client.outcome(), TaskOutcome::TransportError);
  EXPECT_EQ(messages(client),
            (std::vector<std::string>{"Starting slow request...",
                                      "Error: connect failed: Connection "
                                      "refused"}));
}

TEST(TaskClientTest, CancelWithoutTaskDoesNothing) {
  TaskClient client(test_config(), [](std::string &err) {
    err = "unused";
    return std::unique_ptr<transport::Connection>();
  });

  client.cancel_task();
  EXPECT_TRUE(client.log().empty());
  EXPECT_EQ(client.outcome(), TaskOutcome::None);
}

TEST(TaskClientTest, ClearLogAndRestartAfterCompletion) {
  FakeServer server([](transport::Connection &conn) {
    if (!open_stream(conn)) {
      return;
    }
    send(conn, encode(make_progress(1, 1)) + encode(make_complete()));
    conn.shutdown_write();
    drain_until_eof(conn);
  });

  TaskClient client(test_config(), server.dialer());
  std::vector<std::string> observed;
  client.set_log_observer(
      [&observed](const LogEntry &entry) { observed.push_back(entry.message); });

  client.start_task();
  ASSERT_TRUE(client.wait_for(5s));
  ASSERT_EQ(client.outcome(), TaskOutcome::Completed);

  client.clear_log();
  EXPECT_TRUE(client.log().empty());
  EXPECT_DOUBLE_EQ(client.progress(), 0.0);

  // Cancel after the task ended is a no-op.
  client.cancel_task();
  EXPECT_TRUE(client.log().empty());

  client.start_task();
  ASSERT_TRUE(client.wait_for(5s));
  EXPECT_EQ(client.outcome(), TaskOutcome::Completed);
  EXPECT_EQ(client.log().front().id, 0u);
  EXPECT_EQ(client.log().front().message, "Starting slow request...");
  EXPECT_EQ(observed.size(), 2 * client.log().size());
}

TEST(TaskClientNamesTest, OutcomeAndLevelNames) {
  EXPECT_STREQ(outcome_name(TaskOutcome::Completed), "completed");
  EXPECT_STREQ(outcome_name(TaskOutcome::LocallyAborted), "locally aborted");
  EXPECT_STREQ(level_name(LogLevel::Warning), "warning");
  EXPECT_STREQ(level_name(LogLevel::Progress), "progress");
}

} // namespace
} // namespace stream_client
