#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "client/cancellation_bridge.hpp"
#include "codec/event_codec.hpp"
#include "transport/socket_stream.hpp"

namespace stream_client {

using stream_codec::Event;

// Receives decoded events and the single end-of-stream notification.
// All calls come from the receiving thread, in wire order.
class EventHandler {
public:
  virtual ~EventHandler() = default;

  virtual void on_event(const Event &event) = 0;

  // The server closed the stream.
  virtual void on_stream_end() = 0;

  // The stream ended because this client cancelled the task.
  virtual void on_local_abort() = 0;

  // The stream failed for any other reason.
  virtual void on_transport_error(const std::string &message) = 0;
};

enum class ReceiveOutcome { StreamEnded, LocallyAborted, TransportFailed };

// Incremental frame reassembly over arbitrary chunk boundaries.
class StreamReceiver {
public:
  explicit StreamReceiver(EventHandler &handler);

  StreamReceiver(const StreamReceiver &) = delete;
  StreamReceiver &operator=(const StreamReceiver &) = delete;

  // Appends a chunk and dispatches every complete frame now available.
  // Returns the number of events dispatched. Events after a terminal
  // event are dropped.
  std::size_t feed(std::string_view chunk);

  // Reads the connection until it ends, then dispatches exactly one of
  // on_stream_end / on_local_abort / on_transport_error.
  ReceiveOutcome run(transport::Connection &conn, const TaskHandle &handle);

  std::size_t buffered() const { return buffer_.size(); }
  std::size_t dropped_frames() const { return dropped_frames_; }
  bool saw_terminal() const { return saw_terminal_; }

private:
  EventHandler &handler_;
  std::string buffer_;
  std::size_t dropped_frames_ = 0;
  bool saw_terminal_ = false;
};

} // namespace stream_client
