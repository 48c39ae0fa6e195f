#pragma once

#include <map>
#include <optional>
#include <string>

#include "streamagent/llm/stream_event.hpp"
#include "streamagent/llm/transport.hpp"

namespace streamagent::llm {

// Parse the concatenated argument text of a tool call.
// Empty text yields {}; anything that is not a JSON object yields
// {"raw_arguments": text}. Never throws.
json parse_tool_arguments(const std::string& text);

// Turns the raw fragments of one completion into StreamEvents.
//
// A decoder serves exactly one decoding pass: feed() every fragment in
// arrival order, then call finish() (or fail()) once. Tool-call pieces are
// assembled per backend index and finalized in ascending index order.
class ChunkDecoder {
 public:
  void feed(const RawChunk& chunk, const StreamCallback& emit);

  // Finalize open tool calls, then emit MessageFinished
  void finish(const StreamCallback& emit);

  // Terminate the pass with a TransportError instead of MessageFinished
  void fail(const TransportError& error, const StreamCallback& emit);

  bool finished() const {
    return finished_;
  }

  // Non-streaming path: emit the equivalent end state of a complete response
  static void replay(const ChatCompletion& completion, const StreamCallback& emit);

 private:
  // Tool-call assembly slot, keyed by backend index
  struct ToolCallFragment {
    std::optional<std::string> call_id;
    std::string name;
    std::string arguments;
  };

  void assemble(const ToolCallChunk& piece, const StreamCallback& emit);

  std::map<int, ToolCallFragment> fragments_;
  std::optional<FinishReason> finish_reason_;
  std::optional<TokenUsage> usage_;
  bool finished_ = false;
};

}  // namespace streamagent::llm
