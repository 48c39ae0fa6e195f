#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "streamagent/core/types.hpp"
#include "streamagent/tool/tool.hpp"

namespace streamagent {

// Lifecycle events of one turn, in emission order

struct TurnStarted {
  std::string input;
};

struct TextDelta {
  std::string text;
};

// Full response text, emitted once when the response ends with text
struct TextFinished {
  std::string text;
};

struct ToolInvocationStarted {
  ToolCallId call_id;
  std::string name;
  json arguments;
};

struct ToolInvocationFinished {
  ToolCallId call_id;
  std::string name;
  ToolResult result;
};

// Terminal: the turn failed
struct TurnError {
  std::string message;
};

// Terminal: the turn completed
struct TurnFinished {
  std::optional<std::string> text;
  std::optional<TokenUsage> usage;
};

using AgentEvent = std::variant<TurnStarted, TextDelta, TextFinished, ToolInvocationStarted, ToolInvocationFinished, TurnError, TurnFinished>;

using EventCallback = std::function<void(const AgentEvent&)>;

std::string event_name(const AgentEvent& event);

bool is_terminal(const AgentEvent& event);

}  // namespace streamagent
