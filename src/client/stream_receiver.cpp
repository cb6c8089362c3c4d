#include "stream_receiver.hpp"

#include <array>

namespace stream_client {

StreamReceiver::StreamReceiver(EventHandler &handler) : handler_(handler) {}

std::size_t StreamReceiver::feed(std::string_view chunk) {
  buffer_.append(chunk.data(), chunk.size());

  std::size_t dispatched = 0;
  std::size_t offset = 0;
  while (offset < buffer_.size()) {
    const stream_codec::DecodeResult r =
        stream_codec::decode(std::string_view(buffer_).substr(offset));
    if (r.consumed == 0) {
      break;
    }
    offset += r.consumed;

    if (!r.event) {
      ++dropped_frames_;
      continue;
    }
    if (saw_terminal_) {
      continue;
    }

    saw_terminal_ = stream_codec::is_terminal(*r.event);
    handler_.on_event(*r.event);
    ++dispatched;
  }

  buffer_.erase(0, offset);
  return dispatched;
}

ReceiveOutcome StreamReceiver::run(transport::Connection &conn,
                                   const TaskHandle &handle) {
  std::array<char, 4096> buf;
  std::string io_err;

  while (true) {
    const long r = conn.read_some(buf.data(), buf.size(), io_err);
    if (r > 0) {
      feed(std::string_view(buf.data(), static_cast<std::size_t>(r)));
      continue;
    }

    // A trailing partial frame is never surfaced.
    buffer_.clear();

    // After a terminal event the close is the server's normal close, even
    // if a graceful cancel half-closed our side first.
    if (!saw_terminal_ && handle.cancelled()) {
      handler_.on_local_abort();
      return ReceiveOutcome::LocallyAborted;
    }
    if (r == 0 || saw_terminal_) {
      handler_.on_stream_end();
      return ReceiveOutcome::StreamEnded;
    }
    handler_.on_transport_error(io_err);
    return ReceiveOutcome::TransportFailed;
  }
}

} // namespace stream_client
