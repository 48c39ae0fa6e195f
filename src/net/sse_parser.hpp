#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace streamagent::net {

// SSE event
struct SseEvent {
  std::string event;  // Event type (empty for default "message")
  std::string data;   // Event data, multi-line payloads joined with '\n'
  std::string id;     // Event ID (optional)
};

// Incremental text/event-stream framer. Bytes may be split anywhere.
class SseParser {
 public:
  // Consume bytes and return the events they completed
  std::vector<SseEvent> feed(std::string_view bytes);

  // Drop buffered partial input
  void reset();

 private:
  void process_line(std::string_view line, std::vector<SseEvent>& out);

  std::string buffer_;
  SseEvent current_;
  bool has_data_ = false;
};

}  // namespace streamagent::net
