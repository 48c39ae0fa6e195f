#pragma once

#include <optional>
#include <string>
#include <vector>

#include "streamagent/core/types.hpp"

namespace streamagent {

// Message role
enum class Role { System, User, Assistant, Tool };

std::string to_string(Role role);
Role role_from_string(const std::string& str);

// One entry of the conversation log. Messages are immutable once built.
class Message {
 public:
  Message() = default;
  Message(Role role, std::string content);

  // Factory methods
  static Message system(const std::string& content);
  static Message user(const std::string& content);
  static Message assistant(const std::string& content, std::vector<ToolCallRequest> tool_calls = {});
  static Message tool(const ToolCallId& call_id, const std::string& content);

  Role role() const {
    return role_;
  }

  const std::string& content() const {
    return content_;
  }

  // Set for tool-role messages only
  const std::optional<ToolCallId>& tool_call_id() const {
    return tool_call_id_;
  }

  // Tool calls requested by an assistant message
  const std::vector<ToolCallRequest>& tool_calls() const {
    return tool_calls_;
  }

  Timestamp created_at() const {
    return created_at_;
  }

  // Serialization
  json to_json() const;
  static Message from_json(const json& j);

  // Chat-completions wire shape
  json to_api_format() const;

 private:
  Role role_ = Role::User;
  std::string content_;
  std::optional<ToolCallId> tool_call_id_;
  std::vector<ToolCallRequest> tool_calls_;

  Timestamp created_at_ = std::chrono::system_clock::now();
};

}  // namespace streamagent
