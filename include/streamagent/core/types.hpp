#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace streamagent {

using json = nlohmann::json;

using ToolCallId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Token accounting reported by the backend
struct TokenUsage {
  int64_t prompt_tokens = 0;
  int64_t completion_tokens = 0;
  int64_t total_tokens = 0;
  int64_t cached_tokens = 0;

  TokenUsage &operator+=(const TokenUsage &other) {
    prompt_tokens += other.prompt_tokens;
    completion_tokens += other.completion_tokens;
    total_tokens += other.total_tokens;
    cached_tokens += other.cached_tokens;
    return *this;
  }

  friend TokenUsage operator+(TokenUsage lhs, const TokenUsage &rhs) {
    lhs += rhs;
    return lhs;
  }

  bool operator==(const TokenUsage &) const = default;
};

// Finish reason for LLM responses
enum class FinishReason {
  Stop,           // Natural completion
  ToolCalls,      // Needs tool execution
  Length,         // Token limit reached
  ContentFilter,  // Blocked by the backend
  Error,          // Error occurred
  Cancelled       // User cancelled
};

std::string to_string(FinishReason reason);

FinishReason finish_reason_from_string(const std::string &str);

// A fully assembled tool invocation requested by the model
struct ToolCallRequest {
  ToolCallId call_id;
  std::string name;
  json arguments = json::object();

  bool operator==(const ToolCallRequest &) const = default;
};

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string &input);

bool is_valid_utf8(const std::string &input);

}  // namespace streamagent
