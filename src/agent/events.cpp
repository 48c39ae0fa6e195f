#include "streamagent/agent/events.hpp"

#include <type_traits>

namespace streamagent {

std::string event_name(const AgentEvent& event) {
  return std::visit(
      [](auto&& e) -> std::string {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, TurnStarted>) {
          return "turn_started";
        } else if constexpr (std::is_same_v<T, TextDelta>) {
          return "text_delta";
        } else if constexpr (std::is_same_v<T, TextFinished>) {
          return "text_finished";
        } else if constexpr (std::is_same_v<T, ToolInvocationStarted>) {
          return "tool_invocation_started";
        } else if constexpr (std::is_same_v<T, ToolInvocationFinished>) {
          return "tool_invocation_finished";
        } else if constexpr (std::is_same_v<T, TurnError>) {
          return "turn_error";
        } else {
          return "turn_finished";
        }
      },
      event);
}

bool is_terminal(const AgentEvent& event) {
  return std::holds_alternative<TurnError>(event) || std::holds_alternative<TurnFinished>(event);
}

}  // namespace streamagent
