#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>

#include "streamagent/tool/builtin/builtins.hpp"

namespace streamagent::tools {

namespace fs = std::filesystem;

namespace {

// Files with a NUL byte in their first 8KB are treated as binary
bool is_binary(const std::string& content) {
  return content.find('\0', 0) < std::min<size_t>(content.size(), 8192);
}

std::vector<std::string> split_lines(const std::string& content) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < content.size()) {
    auto end = content.find('\n', start);
    if (end == std::string::npos) {
      end = content.size();
    }
    std::string line = content.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

std::string format_size_mb(uintmax_t bytes) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f MB", static_cast<double>(bytes) / 1024.0 / 1024.0);
  return buf;
}

}  // namespace

// ============================================================================
// ReadFileTool
// ============================================================================

ReadFileTool::ReadFileTool()
    : SimpleTool("read_file",
                 "Read the contents of a text file. Return the file content with line numbers. "
                 "For large files, use offset and limit to read only a portion of the file. "
                 "Cannot read binary files (images, executables, etc.).") {}

std::vector<ParameterSchema> ReadFileTool::parameters() const {
  return {{"path", "string", "The path to the file to read (relative to working directory or absolute path)", true, std::nullopt, std::nullopt,
           std::nullopt},
          {"offset", "integer", "Line number to start reading from (1-based). Defaults to 1.", false, json(1), std::nullopt, 1.0},
          {"limit", "integer", "Maximum number of lines to read. If not provided, all lines from the offset will be read.", false, std::nullopt,
           std::nullopt, 1.0}};
}

std::future<ToolResult> ReadFileTool::execute(const json& args, const ToolContext& ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    fs::path path = args.value("path", "");
    int64_t offset = args.contains("offset") && args["offset"].is_number_integer() ? args["offset"].get<int64_t>() : 1;
    std::optional<int64_t> limit;
    if (args.contains("limit") && args["limit"].is_number_integer()) {
      limit = args["limit"].get<int64_t>();
    }

    if (path.is_relative()) {
      path = ctx.working_dir / path;
    }
    path = path.lexically_normal();

    spdlog::debug("[ReadFileTool] Reading: path=\"{}\", offset={}, limit={}", path.string(), offset, limit ? std::to_string(*limit) : "none");

    if (ctx.aborted()) {
      return ToolResult::failure("Cancelled");
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
      return ToolResult::failure("File not found: " + path.string());
    }

    if (!fs::is_regular_file(path, ec)) {
      return ToolResult::failure("Not a file: " + path.string());
    }

    auto file_size = fs::file_size(path, ec);
    if (ec) {
      return ToolResult::failure("Failed to read file: " + ec.message());
    }
    if (file_size > MAX_FILE_SIZE) {
      return ToolResult::failure("File too large (" + format_size_mb(file_size) + "): " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
      return ToolResult::failure("Failed to open file: " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (is_binary(content)) {
      return ToolResult::failure("Cannot read binary files: " + path.string());
    }

    if (!is_valid_utf8(content)) {
      return ToolResult::failure("File contains invalid UTF-8 characters: " + path.string());
    }

    auto lines = split_lines(content);
    int64_t total = static_cast<int64_t>(lines.size());
    if (lines.empty()) {
      return ToolResult::ok("File is empty", {{"total_lines", 0}, {"path", path.string()}});
    }

    if (offset > total) {
      return ToolResult::failure("Offset " + std::to_string(offset) + " is beyond end of file (" + std::to_string(total) + " lines)");
    }

    // offset <= total here, so total - offset cannot overflow
    int64_t end = (limit && *limit <= total - offset) ? offset + *limit - 1 : total;

    std::ostringstream out;
    if (offset > 1 || end < total) {
      out << "Showing lines " << offset << "-" << end << " of " << total << "\n\n";
    }

    char number[16];
    for (int64_t i = offset; i <= end; ++i) {
      std::snprintf(number, sizeof(number), "%6lld", static_cast<long long>(i));
      out << number << "|" << lines[static_cast<size_t>(i - 1)];
      if (i < end) {
        out << "\n";
      }
    }

    spdlog::debug("[ReadFileTool] Read {} of {} lines from {}", end - offset + 1, total, path.string());
    return ToolResult::ok(out.str(), {{"total_lines", total}, {"path", path.string()}, {"shown_start", offset}, {"shown_end", end}});
  });
}

// ============================================================================
// Registration
// ============================================================================

void register_builtins(ToolRegistry& registry) {
  registry.register_tool(std::make_shared<ReadFileTool>());
}

}  // namespace streamagent::tools
