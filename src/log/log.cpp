#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "streamagent/core/config.hpp"

namespace streamagent {

namespace {

namespace fs = std::filesystem;

fs::path rotated_name(const fs::path& current, size_t slot) {
  return current.parent_path() / (current.stem().string() + "." + std::to_string(slot) + current.extension().string());
}

// streamagent.log -> streamagent.0.log -> ... -> streamagent.<max_files-1>.log
void rotate_logs_on_startup(const fs::path& current_log, size_t max_files) {
  std::error_code ec;
  if (max_files == 0 || !fs::exists(current_log, ec)) {
    return;
  }

  fs::remove(rotated_name(current_log, max_files - 1), ec);

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto old_name = rotated_name(current_log, static_cast<size_t>(i));
    if (fs::exists(old_name, ec)) {
      fs::rename(old_name, rotated_name(current_log, static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, rotated_name(current_log, 0), ec);
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "streamagent.log" : fs::path(log_path);

    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("streamagent", file_sink);

    logger->set_level(spdlog::level::from_str(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("streamagent");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== streamagent started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

}  // namespace streamagent
