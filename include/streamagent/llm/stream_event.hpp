#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "streamagent/core/types.hpp"

namespace streamagent::llm {

// ---------------------------------------------------------------------------
// Decoder input: one backend fragment, normalized by a wire adapter
// ---------------------------------------------------------------------------

// Piece of one tool call. `index` identifies the call within the response.
struct ToolCallChunk {
  int index = 0;
  std::optional<std::string> id;
  std::string name;
  std::string arguments;
};

struct RawChunk {
  std::string text;
  std::vector<ToolCallChunk> tool_calls;
  std::optional<FinishReason> finish_reason;
  std::optional<TokenUsage> usage;
};

// ---------------------------------------------------------------------------
// Decoder output
// ---------------------------------------------------------------------------

struct TextFragment {
  std::string text;
};

struct ToolCallStarted {
  ToolCallId call_id;
  std::string name;
};

struct ToolCallArgumentsDelta {
  ToolCallId call_id;
  std::string name;
  std::string delta;
};

struct ToolCallFinished {
  ToolCallRequest call;
};

struct MessageFinished {
  std::optional<FinishReason> reason;
  std::optional<TokenUsage> usage;
  // Full response text; only set on the non-streaming path
  std::optional<std::string> text;
};

// Classification of a failed completion attempt
enum class TransportErrorKind {
  RateLimited,   // retryable
  Connectivity,  // retryable
  Fatal          // protocol, auth, validation
};

std::string to_string(TransportErrorKind kind);

struct TransportError {
  std::string message;
  TransportErrorKind kind = TransportErrorKind::Fatal;
};

using StreamEvent = std::variant<TextFragment, ToolCallStarted, ToolCallArgumentsDelta, ToolCallFinished, MessageFinished, TransportError>;

using StreamCallback = std::function<void(const StreamEvent&)>;

}  // namespace streamagent::llm
