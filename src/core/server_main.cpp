#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "config.hpp"
#include "server/stream_server.hpp"

static std::atomic<bool> g_stop{false};

static void handle_stop_signal(int) { g_stop.store(true); }

static void log_err(const std::string &msg) {
  std::cerr << "cancelstream-server: " << msg << "\n";
}

static void print_usage() {
  log_err("Usage: cancelstream-server --config <path/to/server.yaml> "
          "[--port N] [--steps N] [--step-ms N]");
}

static int parse_int_arg(const std::string &flag, const char *value) {
  try {
    std::size_t used = 0;
    const int parsed = std::stoi(value, &used);
    if (used != std::string(value).size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception &) {
    throw std::runtime_error("invalid " + flag + " value: '" +
                             std::string(value) + "'");
  }
}

int main(int argc, char **argv) {
  std::optional<std::string> config_path;
  std::optional<int> port_override;
  std::optional<int> steps_override;
  std::optional<int> step_ms_override;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--port" && i + 1 < argc) {
        port_override = parse_int_arg(arg, argv[++i]);
      } else if (arg == "--steps" && i + 1 < argc) {
        steps_override = parse_int_arg(arg, argv[++i]);
      } else if (arg == "--step-ms" && i + 1 < argc) {
        step_ms_override = parse_int_arg(arg, argv[++i]);
      } else if (arg == "-h" || arg == "--help") {
        print_usage();
        return 0;
      } else {
        log_err("unknown argument: " + arg);
        print_usage();
        return 2;
      }
    }
  } catch (const std::exception &e) {
    log_err(e.what());
    return 2;
  }

  if (!config_path) {
    log_err("FATAL: --config argument is required");
    print_usage();
    return 2;
  }

  cancelstream::ServerConfig config;
  try {
    log_err("loading configuration from: " + *config_path);
    config = cancelstream::load_server_config(*config_path);

    if (port_override) {
      if (*port_override < 0 || *port_override > 65535) {
        throw std::runtime_error("--port must be in range [0, 65535]");
      }
      config.port = static_cast<uint16_t>(*port_override);
    }
    if (steps_override) {
      if (*steps_override < 1 || *steps_override > 10000) {
        throw std::runtime_error("--steps must be in range [1, 10000]");
      }
      config.total_steps = *steps_override;
    }
    if (step_ms_override) {
      if (*step_ms_override < 0 || *step_ms_override > 600000) {
        throw std::runtime_error("--step-ms must be in range [0, 600000]");
      }
      config.step_duration_ms = *step_ms_override;
    }
    if (config.fail_at_step > config.total_steps) {
      throw std::runtime_error("chaos.fail_at_step exceeds total_steps");
    }
  } catch (const std::exception &e) {
    log_err("FATAL: " + std::string(e.what()));
    return 2;
  }

  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  stream_server::StreamServer server(config);
  std::string err;
  if (!server.start(err)) {
    log_err("FATAL: failed to start: " + err);
    return 1;
  }

  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  log_err("signal received; shutting down");
  server.stop();
  return 0;
}
