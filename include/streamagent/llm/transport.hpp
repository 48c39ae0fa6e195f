#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "streamagent/core/message.hpp"
#include "streamagent/core/types.hpp"
#include "streamagent/llm/stream_event.hpp"

namespace streamagent::llm {

// One completion request
struct ChatRequest {
  std::string model;
  std::vector<Message> messages;

  // Tool schemas {name, description, parameters}; empty means no tools capability
  std::vector<json> tools;

  bool stream = true;
  std::optional<double> temperature;
  std::optional<int> max_tokens;

  // Chat-completions request body
  json to_openai_format() const;
};

// A complete (non-streamed) response
struct ChatCompletion {
  std::string text;
  std::vector<ToolCallRequest> tool_calls;
  std::optional<FinishReason> finish_reason;
  std::optional<TokenUsage> usage;
};

// Classified failure of one attempt
struct TransportFailure {
  TransportErrorKind kind = TransportErrorKind::Fatal;
  std::string message;
  int status_code = 0;

  bool retryable() const {
    return kind != TransportErrorKind::Fatal;
  }
};

struct CompletionResponse {
  ChatCompletion completion;
  std::optional<TransportFailure> failure;

  bool ok() const {
    return !failure.has_value();
  }
};

using ChunkCallback = std::function<void(const RawChunk&)>;

// Backend connection. Implementations normalize their wire format into
// RawChunk / ChatCompletion and classify every failure exactly once.
class Transport {
 public:
  virtual ~Transport() = default;

  virtual std::string name() const = 0;

  // Run one streaming attempt, calling on_chunk per fragment in arrival
  // order. Blocks until the response ends; returns the failure, if any.
  virtual std::optional<TransportFailure> stream(const ChatRequest& request, const ChunkCallback& on_chunk) = 0;

  // Run one non-streaming attempt
  virtual CompletionResponse complete(const ChatRequest& request) = 0;

  // Abort the in-flight attempt, if any
  virtual void cancel() = 0;

  // Release the connection; the transport may be reopened by a later request
  virtual void close() {}
};

}  // namespace streamagent::llm
