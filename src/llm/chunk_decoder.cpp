#include "streamagent/llm/chunk_decoder.hpp"

#include <spdlog/spdlog.h>

namespace streamagent::llm {

json parse_tool_arguments(const std::string& text) {
  if (text.empty()) {
    return json::object();
  }

  auto parsed = json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    spdlog::debug("Tool arguments are not a JSON object, keeping raw text ({} bytes)", text.size());
    return json{{"raw_arguments", text}};
  }
  return parsed;
}

void ChunkDecoder::feed(const RawChunk& chunk, const StreamCallback& emit) {
  if (finished_) {
    spdlog::warn("ChunkDecoder: fragment after end of stream ignored");
    return;
  }

  if (chunk.usage) {
    if (usage_) {
      *usage_ += *chunk.usage;
    } else {
      usage_ = chunk.usage;
    }
  }

  // The last reported reason wins
  if (chunk.finish_reason) {
    finish_reason_ = chunk.finish_reason;
  }

  if (!chunk.text.empty()) {
    emit(TextFragment{chunk.text});
  }

  for (const auto& piece : chunk.tool_calls) {
    assemble(piece, emit);
  }
}

void ChunkDecoder::assemble(const ToolCallChunk& piece, const StreamCallback& emit) {
  auto& slot = fragments_[piece.index];

  if (piece.id && !piece.id->empty() && !slot.call_id) {
    slot.call_id = piece.id;
  }

  if (!piece.name.empty()) {
    if (slot.name.empty()) {
      slot.name = piece.name;
      emit(ToolCallStarted{slot.call_id.value_or(""), slot.name});
    } else if (piece.name != slot.name) {
      spdlog::debug("ChunkDecoder: tool call {} renamed '{}' -> '{}', keeping the first name", piece.index, slot.name, piece.name);
    }
  }

  if (!piece.arguments.empty()) {
    slot.arguments += piece.arguments;
    emit(ToolCallArgumentsDelta{slot.call_id.value_or(""), slot.name, piece.arguments});
  }
}

void ChunkDecoder::finish(const StreamCallback& emit) {
  if (finished_) {
    return;
  }
  finished_ = true;

  // std::map iterates in ascending index order
  for (auto& [index, slot] : fragments_) {
    ToolCallRequest call;
    call.call_id = slot.call_id.value_or("call_" + std::to_string(index));
    call.name = slot.name;
    call.arguments = parse_tool_arguments(slot.arguments);
    emit(ToolCallFinished{std::move(call)});
  }
  fragments_.clear();

  emit(MessageFinished{finish_reason_, usage_, std::nullopt});
}

void ChunkDecoder::fail(const TransportError& error, const StreamCallback& emit) {
  if (finished_) {
    return;
  }
  finished_ = true;
  fragments_.clear();
  emit(error);
}

void ChunkDecoder::replay(const ChatCompletion& completion, const StreamCallback& emit) {
  for (const auto& call : completion.tool_calls) {
    emit(ToolCallFinished{call});
  }
  emit(MessageFinished{completion.finish_reason, completion.usage, completion.text});
}

}  // namespace streamagent::llm
