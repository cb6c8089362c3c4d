#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "events.pb.h"

namespace stream_codec {

using cancelstream::v1::Event;

// Upper bound for a single frame; a larger unterminated run is discarded.
constexpr std::size_t kMaxFrameBytes = 1024u * 1024u;

constexpr std::string_view kDataPrefix = "data: ";
constexpr std::string_view kFrameTerminator = "\n\n";

enum class EventKind { Progress, Complete, Cancelled };

const char *kind_name(EventKind kind);

// Kind of a well-formed event; std::nullopt for an unknown type string.
std::optional<EventKind> kind_of(const Event &event);

// complete and cancelled end a task's event sequence.
bool is_terminal(const Event &event);

Event make_progress(int step, int total_steps);
Event make_complete();
Event make_cancelled(int step);

// Serializes one event as `data: <compact json>\n\n`.
// Throws std::runtime_error if the message cannot be serialized.
std::string encode(const Event &event);

struct DecodeResult {
  std::optional<Event> event;
  // Bytes to drop from the front of the buffer. 0 means no complete frame
  // is present yet; nonzero with no event means the frame was dropped.
  std::size_t consumed = 0;
};

// Extracts at most one frame from the front of `buffer`. Never throws and
// never reports malformed data as an error: such frames are dropped.
DecodeResult decode(std::string_view buffer);

} // namespace stream_codec
