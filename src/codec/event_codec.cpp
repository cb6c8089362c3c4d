#include "event_codec.hpp"

#include <stdexcept>

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

namespace stream_codec {

namespace {

constexpr const char *kTypeProgress = "progress";
constexpr const char *kTypeComplete = "complete";
constexpr const char *kTypeCancelled = "cancelled";

google::protobuf::Timestamp now_ts() {
  return google::protobuf::util::TimeUtil::GetCurrentTime();
}

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool is_well_formed(const Event &event) {
  const auto kind = kind_of(event);
  if (!kind) {
    return false;
  }
  switch (*kind) {
  case EventKind::Progress:
    return event.step() >= 1 && event.total_steps() >= event.step();
  case EventKind::Cancelled:
    return event.step() >= 1;
  case EventKind::Complete:
    return true;
  }
  return false;
}

std::optional<Event> parse_payload(const std::string &json) {
  Event event;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  const auto status =
      google::protobuf::util::JsonStringToMessage(json, &event, options);
  if (!status.ok() || !is_well_formed(event)) {
    return std::nullopt;
  }
  return event;
}

// Parses one frame body (terminator already stripped). Only `data:` lines
// carry payload; SSE comment, event, id and retry lines are skipped.
std::optional<Event> parse_frame(std::string_view frame) {
  std::string payload;
  bool has_data = false;

  std::size_t pos = 0;
  while (pos <= frame.size()) {
    std::size_t eol = frame.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = frame.size();
    }
    std::string_view line = frame.substr(pos, eol - pos);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    if (starts_with(line, "data:")) {
      line.remove_prefix(5);
      if (!line.empty() && line.front() == ' ') {
        line.remove_prefix(1);
      }
      if (has_data) {
        payload.push_back('\n');
      }
      payload.append(line.data(), line.size());
      has_data = true;
    }
    pos = eol + 1;
  }

  if (has_data) {
    if (auto event = parse_payload(payload)) {
      return event;
    }
  }

  // A truncated or damaged frame can run straight into the next one.
  // Retry from the last data marker so the intact trailing frame is not
  // lost with it. A marker at offset 0 is the line that already failed.
  const std::size_t marker = frame.rfind(kDataPrefix);
  if (marker == std::string_view::npos || marker == 0) {
    return std::nullopt;
  }
  std::string_view tail = frame.substr(marker + kDataPrefix.size());
  tail = tail.substr(0, tail.find('\n'));
  return parse_payload(std::string(tail));
}

} // namespace

const char *kind_name(EventKind kind) {
  switch (kind) {
  case EventKind::Progress:
    return kTypeProgress;
  case EventKind::Complete:
    return kTypeComplete;
  case EventKind::Cancelled:
    return kTypeCancelled;
  }
  return "unknown";
}

std::optional<EventKind> kind_of(const Event &event) {
  const std::string &type = event.type();
  if (type == kTypeProgress) {
    return EventKind::Progress;
  }
  if (type == kTypeComplete) {
    return EventKind::Complete;
  }
  if (type == kTypeCancelled) {
    return EventKind::Cancelled;
  }
  return std::nullopt;
}

bool is_terminal(const Event &event) {
  const auto kind = kind_of(event);
  return kind && (*kind == EventKind::Complete || *kind == EventKind::Cancelled);
}

Event make_progress(int step, int total_steps) {
  Event event;
  event.set_type(kTypeProgress);
  event.set_step(step);
  event.set_total_steps(total_steps);
  event.set_message("Processing step " + std::to_string(step) + " of " +
                    std::to_string(total_steps) + "...");
  *event.mutable_timestamp() = now_ts();
  return event;
}

Event make_complete() {
  Event event;
  event.set_type(kTypeComplete);
  event.set_message("All steps completed successfully!");
  *event.mutable_timestamp() = now_ts();
  return event;
}

Event make_cancelled(int step) {
  Event event;
  event.set_type(kTypeCancelled);
  event.set_step(step);
  return event;
}

std::string encode(const Event &event) {
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = false;

  const auto status =
      google::protobuf::util::MessageToJsonString(event, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize event: " +
                             status.ToString());
  }

  std::string frame;
  frame.reserve(kDataPrefix.size() + json.size() + kFrameTerminator.size());
  frame.append(kDataPrefix.data(), kDataPrefix.size());
  frame.append(json);
  frame.append(kFrameTerminator.data(), kFrameTerminator.size());
  return frame;
}

DecodeResult decode(std::string_view buffer) {
  DecodeResult result;

  const std::size_t end = buffer.find(kFrameTerminator);
  if (end == std::string_view::npos) {
    if (buffer.size() > kMaxFrameBytes) {
      // Drop the unterminated run, but keep a frame that has started at
      // its tail.
      const std::size_t marker = buffer.rfind(kDataPrefix);
      if (marker != std::string_view::npos && marker > 0 &&
          buffer.size() - marker <= kMaxFrameBytes) {
        result.consumed = marker;
      } else {
        result.consumed = buffer.size();
      }
    }
    return result;
  }

  result.consumed = end + kFrameTerminator.size();
  if (end <= kMaxFrameBytes) {
    result.event = parse_frame(buffer.substr(0, end));
  }
  return result;
}

} // namespace stream_codec
