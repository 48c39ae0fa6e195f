#include "streamagent/llm/transport.hpp"

namespace streamagent::llm {

std::string to_string(TransportErrorKind kind) {
  switch (kind) {
    case TransportErrorKind::RateLimited:
      return "rate_limited";
    case TransportErrorKind::Connectivity:
      return "connectivity";
    case TransportErrorKind::Fatal:
      return "fatal";
  }
  return "fatal";
}

json ChatRequest::to_openai_format() const {
  json request;
  request["model"] = model;

  json msgs = json::array();
  for (const auto& msg : messages) {
    msgs.push_back(msg.to_api_format());
  }
  request["messages"] = msgs;

  request["stream"] = stream;
  if (stream) {
    request["stream_options"] = {{"include_usage", true}};
  }

  if (temperature) {
    request["temperature"] = *temperature;
  }

  if (max_tokens) {
    request["max_tokens"] = *max_tokens;
  }

  // The backend must not receive an empty tools list
  if (!tools.empty()) {
    json tools_json = json::array();
    for (const auto& schema : tools) {
      json func = {{"name", schema.value("name", "")}, {"description", schema.value("description", "")}};
      if (schema.contains("parameters")) {
        func["parameters"] = schema["parameters"];
      } else {
        func["parameters"] = {{"type", "object"}, {"properties", json::object()}};
      }
      tools_json.push_back({{"type", "function"}, {"function", func}});
    }
    request["tools"] = tools_json;
    request["tool_choice"] = "auto";
  }

  return request;
}

}  // namespace streamagent::llm
