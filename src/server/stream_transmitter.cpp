#include "stream_transmitter.hpp"

#include <array>
#include <atomic>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace stream_server {

StreamTransmitter::StreamTransmitter(transport::Connection &conn,
                                     EventObserver observer)
    : conn_(conn), observer_(std::move(observer)) {}

bool StreamTransmitter::transmit(const Event &event) {
  if (closed_) {
    return false;
  }

  const std::string frame = stream_codec::encode(event);
  if (observer_) {
    observer_(event);
  }

  std::string io_err;
  if (!conn_.write_all(frame.data(), frame.size(), io_err)) {
    // Peer went away mid-stream: stop producing, nothing to report.
    if (verbose_) {
      std::cerr << "[StreamTransmitter] write stopped: " << io_err
                << std::endl;
    }
    close();
    return false;
  }

  ++frames_written_;
  if (verbose_) {
    std::cerr << "[StreamTransmitter] frame " << frames_written_ << ": "
              << event.type() << std::endl;
  }

  if (stream_codec::is_terminal(event)) {
    close();
  }
  return true;
}

void StreamTransmitter::close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  conn_.shutdown_write();
}

// Reads (and discards) whatever the client sends until its side closes.
// EOF or a read error before the task finished means the client is gone.
static void watch_for_disconnect(transport::Connection &conn,
                                 stream_core::CancellationSignal &signal,
                                 const std::atomic<bool> &finished) {
  std::array<char, 256> buf;
  std::string io_err;

  while (true) {
    const long r = conn.read_some(buf.data(), buf.size(), io_err);
    if (r > 0) {
      continue;
    }
    if (!finished.load() && signal.request()) {
      std::cerr << "[StreamTransmitter] Request was cancelled by client"
                << (io_err.empty() ? "" : " (" + io_err + ")") << std::endl;
    }
    return;
  }
}

stream_exec::RunResult serve_task(transport::Connection &conn,
                                  const stream_exec::StepExecutor &executor,
                                  stream_core::CancellationSignal &signal,
                                  const EventObserver &observer,
                                  bool verbose) {
  StreamTransmitter transmitter(conn, observer);
  transmitter.set_verbose(verbose);

  std::atomic<bool> finished{false};
  std::thread listener(watch_for_disconnect, std::ref(conn), std::ref(signal),
                       std::cref(finished));

  const stream_exec::RunResult result = executor.run(
      signal, [&transmitter, &finished](const Event &event) {
        // Set before the write: a client closing right after the terminal
        // event is a normal close, not a cancel.
        if (stream_codec::is_terminal(event)) {
          finished.store(true);
        }
        return transmitter.transmit(event);
      });

  finished.store(true);

  // Terminal events already closed the output; a fault or disconnect
  // closes it here without writing anything further.
  transmitter.close();
  if (result.outcome == stream_exec::RunOutcome::Faulted) {
    std::cerr << "[StreamTransmitter] Executor fault, closing stream: "
              << result.error << std::endl;
  }

  // Unblocks the listener's pending read.
  conn.abort();
  listener.join();

  return result;
}

} // namespace stream_server
