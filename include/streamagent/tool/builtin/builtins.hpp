#pragma once

#include "streamagent/tool/tool.hpp"

namespace streamagent::tools {

// Read tool - read text file contents with line numbers
class ReadFileTool : public SimpleTool {
 public:
  ReadFileTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;

  static constexpr uintmax_t MAX_FILE_SIZE = 10 * 1024 * 1024;
};

// Register all builtin tools
void register_builtins(ToolRegistry& registry);

}  // namespace streamagent::tools
