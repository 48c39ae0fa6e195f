#include "streamagent/core/types.hpp"

namespace streamagent {

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::ToolCalls:
      return "tool_calls";
    case FinishReason::Length:
      return "length";
    case FinishReason::ContentFilter:
      return "content_filter";
    case FinishReason::Error:
      return "error";
    case FinishReason::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

FinishReason finish_reason_from_string(const std::string &str) {
  if (str == "stop" || str == "end_turn") return FinishReason::Stop;
  if (str == "tool_calls" || str == "tool_use" || str == "function_call") return FinishReason::ToolCalls;
  if (str == "length" || str == "max_tokens") return FinishReason::Length;
  if (str == "content_filter") return FinishReason::ContentFilter;
  if (str == "error") return FinishReason::Error;
  if (str == "cancelled") return FinishReason::Cancelled;
  return FinishReason::Stop;
}

namespace {

constexpr const char *kReplacementChar = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

// Length of the valid UTF-8 sequence starting at input[i], or 0 if invalid
size_t valid_sequence_length(const std::string &input, size_t i) {
  auto byte = [&](size_t k) { return static_cast<unsigned char>(input[k]); };
  unsigned char c = byte(i);

  if (c <= 0x7F) return 1;

  if ((c & 0xE0) == 0xC0) {
    if (i + 1 >= input.size() || !is_continuation(byte(i + 1))) return 0;
    uint32_t cp = ((c & 0x1F) << 6) | (byte(i + 1) & 0x3F);
    return cp >= 0x80 ? 2 : 0;
  }

  if ((c & 0xF0) == 0xE0) {
    if (i + 2 >= input.size() || !is_continuation(byte(i + 1)) || !is_continuation(byte(i + 2))) return 0;
    uint32_t cp = ((c & 0x0F) << 12) | ((byte(i + 1) & 0x3F) << 6) | (byte(i + 2) & 0x3F);
    return (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) ? 3 : 0;
  }

  if ((c & 0xF8) == 0xF0) {
    if (i + 3 >= input.size() || !is_continuation(byte(i + 1)) || !is_continuation(byte(i + 2)) || !is_continuation(byte(i + 3))) return 0;
    uint32_t cp = ((c & 0x07) << 18) | ((byte(i + 1) & 0x3F) << 12) | ((byte(i + 2) & 0x3F) << 6) | (byte(i + 3) & 0x3F);
    return (cp >= 0x10000 && cp <= 0x10FFFF) ? 4 : 0;
  }

  return 0;
}

}  // namespace

std::string sanitize_utf8(const std::string &input) {
  std::string output;
  output.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    size_t len = valid_sequence_length(input, i);
    if (len == 0) {
      output.append(kReplacementChar);
      i++;
    } else {
      output.append(input, i, len);
      i += len;
    }
  }

  return output;
}

bool is_valid_utf8(const std::string &input) {
  size_t i = 0;
  while (i < input.size()) {
    size_t len = valid_sequence_length(input, i);
    if (len == 0) return false;
    i += len;
  }
  return true;
}

}  // namespace streamagent
