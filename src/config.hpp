#pragma once

#include <cstdint>
#include <string>
#include <yaml-cpp/yaml.h>

namespace cancelstream {

// How the client side stops a running task
enum class CancelMode {
  Abort,   // Tear the connection down; the task ends as a local abort
  Graceful // Half-close and wait for the server's cancelled acknowledgment
};

// Server process configuration
struct ServerConfig {
  std::string config_file_path; // Path to config file (empty when parsed inline)

  // server section
  std::string bind_address = "127.0.0.1";
  uint16_t port = 8080; // 0 picks an ephemeral port
  std::string path = "/api/slow";
  int backlog = 16;

  // task section
  int total_steps = 10;
  int step_duration_ms = 1000;

  // chaos section: executor throws before this step's work (0 = off)
  int fail_at_step = 0;

  bool verbose = false;
};

// Client process configuration
struct ClientConfig {
  std::string config_file_path;

  std::string host = "127.0.0.1";
  uint16_t port = 8080;
  std::string path = "/api/slow";
  CancelMode cancel_mode = CancelMode::Abort;

  bool verbose = false;
};

// Load server configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
ServerConfig load_server_config(const std::string &path);

// Load client configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
ClientConfig load_client_config(const std::string &path);

// Same validation as the loaders, for an already-parsed document
ServerConfig parse_server_config(const YAML::Node &root);
ClientConfig parse_client_config(const YAML::Node &root);

// Throws std::runtime_error if mode is invalid
CancelMode parse_cancel_mode(const std::string &mode_str);
const char *cancel_mode_name(CancelMode mode);

} // namespace cancelstream
