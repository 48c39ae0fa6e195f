#include "net/sse_parser.hpp"

namespace streamagent::net {

std::vector<SseEvent> SseParser::feed(std::string_view bytes) {
  std::vector<SseEvent> events;
  buffer_.append(bytes.data(), bytes.size());

  size_t start = 0;
  size_t pos;
  while ((pos = buffer_.find('\n', start)) != std::string::npos) {
    std::string_view line(buffer_.data() + start, pos - start);
    // Remove \r if present
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    process_line(line, events);
    start = pos + 1;
  }
  buffer_.erase(0, start);

  return events;
}

void SseParser::process_line(std::string_view line, std::vector<SseEvent>& out) {
  // Blank line dispatches the pending event
  if (line.empty()) {
    if (has_data_) {
      out.push_back(std::move(current_));
    }
    current_ = SseEvent{};
    has_data_ = false;
    return;
  }

  // Comment
  if (line.front() == ':') {
    return;
  }

  std::string_view field = line;
  std::string_view value;
  auto colon = line.find(':');
  if (colon != std::string_view::npos) {
    field = line.substr(0, colon);
    value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
  }

  if (field == "data") {
    if (has_data_) {
      current_.data += '\n';
    }
    current_.data.append(value.data(), value.size());
    has_data_ = true;
  } else if (field == "event") {
    current_.event = std::string(value);
  } else if (field == "id") {
    current_.id = std::string(value);
  }
}

void SseParser::reset() {
  buffer_.clear();
  current_ = SseEvent{};
  has_data_ = false;
}

}  // namespace streamagent::net
