#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "client/task_client.hpp"
#include "config.hpp"

static std::atomic<bool> g_interrupted{false};

static void handle_interrupt(int) { g_interrupted.store(true); }

static void log_err(const std::string &msg) {
  std::cerr << "cancelstream-client: " << msg << "\n";
}

static void print_usage() {
  log_err("Usage: cancelstream-client --config <path/to/client.yaml> "
          "[--cancel-after-step N] [--graceful]");
}

static const char *level_icon(stream_client::LogLevel level) {
  switch (level) {
  case stream_client::LogLevel::Info:
    return "i";
  case stream_client::LogLevel::Progress:
    return ">";
  case stream_client::LogLevel::Success:
    return "+";
  case stream_client::LogLevel::Error:
    return "x";
  case stream_client::LogLevel::Warning:
    return "!";
  }
  return "*";
}

int main(int argc, char **argv) {
  std::optional<std::string> config_path;
  std::optional<int> cancel_after_step;
  bool graceful = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--cancel-after-step" && i + 1 < argc) {
      try {
        cancel_after_step = std::stoi(argv[++i]);
      } catch (const std::exception &) {
        log_err("invalid --cancel-after-step value");
        return 2;
      }
    } else if (arg == "--graceful") {
      graceful = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else {
      log_err("unknown argument: " + arg);
      print_usage();
      return 2;
    }
  }

  if (!config_path) {
    log_err("FATAL: --config argument is required");
    print_usage();
    return 2;
  }

  cancelstream::ClientConfig config;
  try {
    config = cancelstream::load_client_config(*config_path);
  } catch (const std::exception &e) {
    log_err("FATAL: " + std::string(e.what()));
    return 2;
  }
  if (graceful) {
    config.cancel_mode = cancelstream::CancelMode::Graceful;
  }

  stream_client::TaskClient client(config);

  client.set_log_observer([](const stream_client::LogEntry &entry) {
    std::cout << entry.timestamp << " " << level_icon(entry.level) << " "
              << entry.message << std::endl;
  });

  if (cancel_after_step) {
    const int threshold = *cancel_after_step;
    client.set_event_observer(
        [&client, threshold](const stream_client::Event &event) {
          if (event.type() == "progress" && event.step() >= threshold) {
            client.cancel_task();
          }
        });
  }

  std::signal(SIGINT, handle_interrupt);

  try {
    client.start_task();
  } catch (const std::exception &e) {
    log_err("FATAL: " + std::string(e.what()));
    return 1;
  }

  while (!client.wait_for(std::chrono::milliseconds(100))) {
    if (g_interrupted.exchange(false)) {
      client.cancel_task();
    }
  }

  const stream_client::TaskOutcome outcome = client.outcome();
  std::cout << "Progress: " << std::lround(client.progress()) << "% ("
            << stream_client::outcome_name(outcome) << ")" << std::endl;

  return outcome == stream_client::TaskOutcome::TransportError ? 1 : 0;
}
