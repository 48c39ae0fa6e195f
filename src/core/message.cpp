#include "streamagent/core/message.hpp"

namespace streamagent {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::Tool:
      return "tool";
  }
  return "user";
}

Role role_from_string(const std::string& str) {
  if (str == "system") return Role::System;
  if (str == "user") return Role::User;
  if (str == "assistant") return Role::Assistant;
  if (str == "tool") return Role::Tool;
  return Role::User;
}

Message::Message(Role role, std::string content) : role_(role), content_(std::move(content)) {}

Message Message::system(const std::string& content) {
  return Message(Role::System, content);
}

Message Message::user(const std::string& content) {
  return Message(Role::User, content);
}

Message Message::assistant(const std::string& content, std::vector<ToolCallRequest> tool_calls) {
  Message msg(Role::Assistant, content);
  msg.tool_calls_ = std::move(tool_calls);
  return msg;
}

Message Message::tool(const ToolCallId& call_id, const std::string& content) {
  Message msg(Role::Tool, content);
  msg.tool_call_id_ = call_id;
  return msg;
}

json Message::to_json() const {
  json j;
  j["role"] = to_string(role_);
  j["content"] = content_;
  j["created_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(created_at_.time_since_epoch()).count();

  if (tool_call_id_) {
    j["tool_call_id"] = *tool_call_id_;
  }

  if (!tool_calls_.empty()) {
    json calls = json::array();
    for (const auto& call : tool_calls_) {
      calls.push_back({{"id", call.call_id}, {"name", call.name}, {"arguments", call.arguments}});
    }
    j["tool_calls"] = calls;
  }

  return j;
}

Message Message::from_json(const json& j) {
  Message msg(role_from_string(j.value("role", "user")), j.value("content", ""));

  if (j.contains("tool_call_id") && j["tool_call_id"].is_string()) {
    msg.tool_call_id_ = j["tool_call_id"].get<std::string>();
  }

  if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
    for (const auto& call : j["tool_calls"]) {
      msg.tool_calls_.push_back({call.value("id", ""), call.value("name", ""), call.value("arguments", json::object())});
    }
  }

  if (j.contains("created_at") && j["created_at"].is_number_integer()) {
    msg.created_at_ = Timestamp(std::chrono::milliseconds(j["created_at"].get<int64_t>()));
  }

  return msg;
}

json Message::to_api_format() const {
  json j;
  j["role"] = to_string(role_);

  switch (role_) {
    case Role::Tool:
      j["tool_call_id"] = tool_call_id_.value_or("");
      j["content"] = content_;
      break;

    case Role::Assistant:
      if (tool_calls_.empty()) {
        j["content"] = content_;
        break;
      }
      // Assistant turns that only call tools carry a null content
      j["content"] = content_.empty() ? json(nullptr) : json(content_);
      j["tool_calls"] = json::array();
      for (const auto& call : tool_calls_) {
        j["tool_calls"].push_back({{"id", call.call_id},
                                   {"type", "function"},
                                   {"function", {{"name", call.name}, {"arguments", call.arguments.dump()}}}});
      }
      break;

    case Role::System:
    case Role::User:
      j["content"] = content_;
      break;
  }

  return j;
}

}  // namespace streamagent
