#pragma once

#include <stdexcept>
#include <string>

namespace stream_client {

// start_task()/begin() while a task is already active.
class AlreadyRunning : public std::logic_error {
public:
  AlreadyRunning() : std::logic_error("a task is already running") {}
};

// clear_log() while a task is active.
class TaskActive : public std::logic_error {
public:
  TaskActive()
      : std::logic_error("cannot clear the log while a task is running") {}
};

// Connection-level failure (dial, request, response head).
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace stream_client
