#pragma once

#include <cstddef>
#include <functional>

#include "codec/event_codec.hpp"
#include "core/cancellation_signal.hpp"
#include "executor/step_executor.hpp"
#include "transport/socket_stream.hpp"

namespace stream_server {

using stream_codec::Event;

// Sees every event the executor emits, before it is written.
using EventObserver = std::function<void(const Event &)>;

// Writes encoded events to one connection in emission order.
// Used from a single thread (the task's executor).
class StreamTransmitter {
public:
  explicit StreamTransmitter(transport::Connection &conn,
                             EventObserver observer = {});

  StreamTransmitter(const StreamTransmitter &) = delete;
  StreamTransmitter &operator=(const StreamTransmitter &) = delete;

  // Encodes and writes one event, closing the output after a terminal
  // event. Returns false when the event could not be delivered; the caller
  // stops producing. Throws if the event cannot be encoded.
  bool transmit(const Event &event);

  // Half-closes the output; idempotent.
  void close();

  bool closed() const { return closed_; }
  std::size_t frames_written() const { return frames_written_; }

  void set_verbose(bool verbose) { verbose_ = verbose; }

private:
  transport::Connection &conn_;
  EventObserver observer_;
  bool closed_ = false;
  bool verbose_ = false;
  std::size_t frames_written_ = 0;
};

// Runs one task over an already-opened event stream: starts the
// inbound-abort listener, drives the executor into a transmitter, closes
// the output on a terminal event or fault, then stops the listener.
stream_exec::RunResult serve_task(transport::Connection &conn,
                                  const stream_exec::StepExecutor &executor,
                                  stream_core::CancellationSignal &signal,
                                  const EventObserver &observer = {},
                                  bool verbose = false);

} // namespace stream_server
