#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "streamagent/core/types.hpp"

namespace streamagent {

// Backend connection settings (OpenAI-compatible chat completions endpoint)
struct ProviderConfig {
  std::string name = "openai";
  std::string api_key;
  std::string base_url = "https://api.openai.com/v1";
  std::string model = "gpt-4o-mini";
  std::optional<std::string> organization;
  std::map<std::string, std::string> headers;
};

// Transient-failure retry budget
struct RetryConfig {
  int max_retries = 3;
  int64_t base_delay_ms = 1000;
};

// Application configuration
struct Config {
  ProviderConfig provider;

  std::string system_prompt =
      "You are a helpful assistant running in a terminal. Use the available tools when they help answer the user, "
      "and keep answers concise.";

  // Generation
  bool stream = true;
  std::optional<double> temperature;
  std::optional<int> max_tokens;

  // Transport
  int request_timeout_seconds = 120;
  RetryConfig retry;

  // Tool output limits
  struct TruncateSettings {
    size_t max_lines = 2000;
    size_t max_bytes = 51200;
  } truncate;

  // Working directory handed to tools
  std::filesystem::path working_dir = std::filesystem::current_path();

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file (missing or malformed files yield defaults)
  static Config load(const std::filesystem::path& path);
  static Config load_default();

  // load_default() plus environment overrides
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path& path) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();
std::filesystem::path config_dir();
std::filesystem::path default_config_file();
std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace streamagent
