#pragma once

#include <atomic>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "streamagent/core/types.hpp"

namespace streamagent {

// Tool execution result
struct ToolResult {
  bool success = true;
  std::string output;
  std::optional<std::string> error;
  json metadata = json::object();
  bool truncated = false;

  // Factory methods
  static ToolResult ok(std::string output, json metadata = json::object()) {
    return ToolResult{true, std::move(output), std::nullopt, std::move(metadata), false};
  }

  static ToolResult failure(std::string error, std::string output = "", json metadata = json::object()) {
    return ToolResult{false, std::move(output), std::move(error), std::move(metadata), false};
  }

  // Text handed back to the model as the tool message content
  std::string to_model_output() const;

  json to_json() const;
};

// Tool execution context
struct ToolContext {
  std::filesystem::path working_dir;

  // Abort signal
  std::shared_ptr<std::atomic<bool>> abort_signal;

  bool aborted() const {
    return abort_signal && abort_signal->load();
  }
};

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "integer", "number", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;
  std::optional<double> minimum;

  json to_json_schema() const;
};

// Tool definition
class Tool {
 public:
  virtual ~Tool() = default;

  virtual std::string name() const = 0;

  virtual std::string description() const = 0;

  // Parameter schema
  virtual std::vector<ParameterSchema> parameters() const = 0;

  // Execution
  virtual std::future<ToolResult> execute(const json& args, const ToolContext& ctx) = 0;

  // {name, description, parameters}
  json to_json_schema() const;

  // Check required parameters, JSON types, enums and minimums.
  // Returns one message per invalid parameter; empty means valid.
  std::vector<std::string> validate_args(const json& args) const;
};

// Base class for simpler tool implementation
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string name, std::string description);

  std::string name() const override {
    return name_;
  }

  std::string description() const override {
    return description_;
  }

 protected:
  std::string name_;
  std::string description_;
};

// Executes tool calls on behalf of the agent loop. invoke() reports
// ordinary failures (unknown tool, bad arguments, execution errors) as a
// failed ToolResult instead of throwing.
class ToolExecutor {
 public:
  virtual ~ToolExecutor() = default;

  // One {name, description, parameters} object per tool
  virtual std::vector<json> schemas() const = 0;

  // ctx carries the working directory and the turn's abort signal
  virtual ToolResult invoke(const std::string& name, const json& arguments, const ToolContext& ctx) = 0;
};

// Tool registry
class ToolRegistry : public ToolExecutor {
 public:
  ToolRegistry() = default;

  // Register a tool, replacing any tool of the same name
  void register_tool(std::shared_ptr<Tool> tool);

  // Returns false when no such tool was registered
  bool unregister_tool(const std::string& name);

  // Get a tool by name
  std::shared_ptr<Tool> get(const std::string& name) const;

  // Get all tools, ordered by name
  std::vector<std::shared_ptr<Tool>> all() const;

  size_t size() const;

  std::vector<json> schemas() const override;

  ToolResult invoke(const std::string& name, const json& arguments, const ToolContext& ctx) override;

  // Output limits applied to every result
  void set_truncate_limits(size_t max_lines, size_t max_bytes);

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;
  size_t max_lines_ = 2000;
  size_t max_bytes_ = 51200;
};

// Truncation helper
namespace Truncate {
struct TruncateResult {
  std::string content;
  bool truncated;
};

// Truncate output if too large
TruncateResult output(const std::string& text, size_t max_lines = 2000, size_t max_bytes = 51200);
}  // namespace Truncate

}  // namespace streamagent
