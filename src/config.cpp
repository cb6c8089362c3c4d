#include "config.hpp"
#include <filesystem>
#include <stdexcept>

namespace cancelstream {

namespace fs = std::filesystem;

CancelMode parse_cancel_mode(const std::string &mode_str) {
  if (mode_str == "abort") {
    return CancelMode::Abort;
  } else if (mode_str == "graceful") {
    return CancelMode::Graceful;
  } else {
    throw std::runtime_error("Invalid client.cancel_mode: '" + mode_str +
                             "'. Valid values: abort, graceful");
  }
}

const char *cancel_mode_name(CancelMode mode) {
  switch (mode) {
  case CancelMode::Abort:
    return "abort";
  case CancelMode::Graceful:
    return "graceful";
  }
  return "unknown";
}

static YAML::Node load_yaml(const std::string &path) {
  try {
    return YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }
}

static YAML::Node require_map(const YAML::Node &root,
                             const std::string &section) {
  if (!root[section]) {
    throw std::runtime_error("[CONFIG] Missing required '" + section +
                             "' section");
  }
  if (!root[section].IsMap()) {
    throw std::runtime_error("[CONFIG] '" + section +
                             "' section must be a map");
  }
  return root[section];
}

template <typename T>
static T read_field(const YAML::Node &section, const std::string &qualified,
                    const std::string &key, const T &fallback) {
  if (!section[key]) {
    return fallback;
  }
  try {
    return section[key].as<T>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] Invalid " + qualified + "." + key +
                             ": " + e.what());
  }
}

static int read_bounded(const YAML::Node &section,
                        const std::string &qualified, const std::string &key,
                        int fallback, int lo, int hi) {
  const int value = read_field<int>(section, qualified, key, fallback);
  if (value < lo || value > hi) {
    throw std::runtime_error("[CONFIG] " + qualified + "." + key +
                             " must be in range [" + std::to_string(lo) +
                             ", " + std::to_string(hi) + "]");
  }
  return value;
}

static std::string read_path(const YAML::Node &section,
                             const std::string &qualified,
                             const std::string &fallback) {
  std::string path = read_field<std::string>(section, qualified, "path",
                                             fallback);
  if (path.empty() || path.front() != '/') {
    throw std::runtime_error("[CONFIG] " + qualified +
                             ".path must start with '/'");
  }
  return path;
}

static bool read_verbose(const YAML::Node &root) {
  if (!root["logging"]) {
    return false;
  }
  if (!root["logging"].IsMap()) {
    throw std::runtime_error("[CONFIG] 'logging' section must be a map");
  }
  return read_field<bool>(root["logging"], "logging", "verbose", false);
}

ServerConfig parse_server_config(const YAML::Node &root) {
  if (!root.IsMap()) {
    throw std::runtime_error("[CONFIG] Top-level document must be a map");
  }

  ServerConfig config;

  const YAML::Node server = require_map(root, "server");
  config.bind_address = read_field<std::string>(server, "server",
                                                "bind_address",
                                                config.bind_address);
  if (config.bind_address.empty()) {
    throw std::runtime_error("[CONFIG] server.bind_address must not be empty");
  }
  // Port 0 is accepted on the server: the OS assigns one.
  config.port = static_cast<uint16_t>(
      read_bounded(server, "server", "port", config.port, 0, 65535));
  config.path = read_path(server, "server", config.path);
  config.backlog =
      read_bounded(server, "server", "backlog", config.backlog, 1, 4096);

  const YAML::Node task = require_map(root, "task");
  config.total_steps =
      read_bounded(task, "task", "total_steps", config.total_steps, 1, 10000);
  config.step_duration_ms = read_bounded(task, "task", "step_duration_ms",
                                         config.step_duration_ms, 0, 600000);

  if (root["chaos"]) {
    if (!root["chaos"].IsMap()) {
      throw std::runtime_error("[CONFIG] 'chaos' section must be a map");
    }
    config.fail_at_step = read_bounded(root["chaos"], "chaos", "fail_at_step",
                                       0, 0, config.total_steps);
  }

  config.verbose = read_verbose(root);
  return config;
}

ClientConfig parse_client_config(const YAML::Node &root) {
  if (!root.IsMap()) {
    throw std::runtime_error("[CONFIG] Top-level document must be a map");
  }

  ClientConfig config;

  const YAML::Node client = require_map(root, "client");
  config.host = read_field<std::string>(client, "client", "host", config.host);
  if (config.host.empty()) {
    throw std::runtime_error("[CONFIG] client.host must not be empty");
  }
  config.port = static_cast<uint16_t>(
      read_bounded(client, "client", "port", config.port, 1, 65535));
  config.path = read_path(client, "client", config.path);

  if (client["cancel_mode"]) {
    try {
      config.cancel_mode =
          parse_cancel_mode(client["cancel_mode"].as<std::string>());
    } catch (const std::exception &e) {
      throw std::runtime_error("[CONFIG] " + std::string(e.what()));
    }
  }

  config.verbose = read_verbose(root);
  return config;
}

ServerConfig load_server_config(const std::string &path) {
  ServerConfig config = parse_server_config(load_yaml(path));
  config.config_file_path = fs::absolute(path).string();
  return config;
}

ClientConfig load_client_config(const std::string &path) {
  ClientConfig config = parse_client_config(load_yaml(path));
  config.config_file_path = fs::absolute(path).string();
  return config;
}

} // namespace cancelstream
