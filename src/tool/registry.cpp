#include <spdlog/spdlog.h>

#include "streamagent/tool/tool.hpp"

namespace streamagent {

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  std::lock_guard lock(mutex_);
  auto name = tool->name();
  if (tools_.count(name)) {
    spdlog::warn("[ToolRegistry] Overwriting existing tool: {}", name);
  }
  tools_[name] = std::move(tool);
  spdlog::debug("[ToolRegistry] Registered tool: {}", name);
}

bool ToolRegistry::unregister_tool(const std::string &name) {
  std::lock_guard lock(mutex_);
  return tools_.erase(name) > 0;
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string &name) const {
  std::lock_guard lock(mutex_);
  auto it = tools_.find(name);
  if (it != tools_.end()) {
    return it->second;
  }
  return nullptr;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::all() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Tool>> result;
  result.reserve(tools_.size());
  for (const auto &[name, tool] : tools_) {
    result.push_back(tool);
  }
  return result;
}

size_t ToolRegistry::size() const {
  std::lock_guard lock(mutex_);
  return tools_.size();
}

std::vector<json> ToolRegistry::schemas() const {
  std::vector<json> result;
  for (const auto &tool : all()) {
    result.push_back(tool->to_json_schema());
  }
  return result;
}

void ToolRegistry::set_truncate_limits(size_t max_lines, size_t max_bytes) {
  std::lock_guard lock(mutex_);
  max_lines_ = max_lines;
  max_bytes_ = max_bytes;
}

ToolResult ToolRegistry::invoke(const std::string &name, const json &arguments, const ToolContext &ctx) {
  auto tool = get(name);
  if (!tool) {
    spdlog::warn("[ToolRegistry] Unknown tool: {}", name);
    return ToolResult::failure("Unknown tool: " + name, "", {{"tool_name", name}});
  }

  auto errors = tool->validate_args(arguments);
  if (!errors.empty()) {
    std::string joined;
    for (const auto &error : errors) {
      if (!joined.empty()) joined += "; ";
      joined += error;
    }
    spdlog::warn("[ToolRegistry] Invalid parameters for tool {}: {}", name, joined);
    return ToolResult::failure("Invalid parameters for tool " + name + ": " + joined, "", {{"tool_name", name}, {"validation_errors", errors}});
  }

  ToolResult result;
  try {
    result = tool->execute(arguments, ctx).get();
  } catch (const std::exception &e) {
    spdlog::error("[ToolRegistry] Error invoking tool {}: {}", name, e.what());
    return ToolResult::failure("Error invoking tool " + name + ": " + e.what(), "", {{"tool_name", name}});
  }

  size_t max_lines, max_bytes;
  {
    std::lock_guard lock(mutex_);
    max_lines = max_lines_;
    max_bytes = max_bytes_;
  }

  auto truncated = Truncate::output(result.output, max_lines, max_bytes);
  result.output = std::move(truncated.content);
  result.truncated = result.truncated || truncated.truncated;

  return result;
}

}  // namespace streamagent
