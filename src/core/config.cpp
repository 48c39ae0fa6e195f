#include "streamagent/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace streamagent {

namespace fs = std::filesystem;

namespace {

const char* first_env(std::initializer_list<const char*> names) {
  for (const char* name : names) {
    const char* value = std::getenv(name);
    if (value && *value) {
      return value;
    }
  }
  return nullptr;
}

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Cannot open config file {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    // Load provider
    if (j.contains("provider")) {
      const auto& p = j["provider"];
      config.provider.name = p.value("name", config.provider.name);
      config.provider.api_key = p.value("api_key", config.provider.api_key);
      config.provider.base_url = p.value("base_url", config.provider.base_url);
      config.provider.model = p.value("model", config.provider.model);
      if (p.contains("organization")) {
        config.provider.organization = p["organization"].get<std::string>();
      }
      if (p.contains("headers")) {
        for (auto& [k, v] : p["headers"].items()) {
          config.provider.headers[k] = v.get<std::string>();
        }
      }
    }

    config.system_prompt = j.value("system_prompt", config.system_prompt);
    config.stream = j.value("stream", config.stream);
    if (j.contains("temperature")) {
      config.temperature = j["temperature"].get<double>();
    }
    if (j.contains("max_tokens")) {
      config.max_tokens = j["max_tokens"].get<int>();
    }
    config.request_timeout_seconds = j.value("request_timeout", config.request_timeout_seconds);

    // Load retry settings
    if (j.contains("retry")) {
      const auto& r = j["retry"];
      config.retry.max_retries = r.value("max_retries", config.retry.max_retries);
      config.retry.base_delay_ms = r.value("base_delay_ms", config.retry.base_delay_ms);
    }

    // Load truncation settings
    if (j.contains("truncate")) {
      const auto& t = j["truncate"];
      config.truncate.max_lines = t.value("max_lines", config.truncate.max_lines);
      config.truncate.max_bytes = t.value("max_bytes", config.truncate.max_bytes);
    }

    if (j.contains("working_dir")) {
      config.working_dir = j["working_dir"].get<std::string>();
    }

    config.log_level = j.value("log_level", config.log_level);
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const json::exception& e) {
    spdlog::warn("Ignoring malformed config file {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  if (const char* key = first_env({"STREAMAGENT_API_KEY", "OPENAI_API_KEY", "API_KEY"})) {
    config.provider.api_key = key;
  }
  if (const char* base_url = first_env({"STREAMAGENT_BASE_URL", "OPENAI_BASE_URL"})) {
    config.provider.base_url = base_url;
  }
  if (const char* model = first_env({"STREAMAGENT_MODEL", "OPENAI_MODEL"})) {
    config.provider.model = model;
  }
  if (const char* level = first_env({"STREAMAGENT_LOG_LEVEL"})) {
    config.log_level = level;
  }

  return config;
}

void Config::save(const fs::path& path) const {
  json j;

  json p;
  p["name"] = provider.name;
  p["api_key"] = provider.api_key;
  p["base_url"] = provider.base_url;
  p["model"] = provider.model;
  if (provider.organization) {
    p["organization"] = *provider.organization;
  }
  if (!provider.headers.empty()) {
    p["headers"] = provider.headers;
  }
  j["provider"] = p;

  j["system_prompt"] = system_prompt;
  j["stream"] = stream;
  if (temperature) {
    j["temperature"] = *temperature;
  }
  if (max_tokens) {
    j["max_tokens"] = *max_tokens;
  }
  j["request_timeout"] = request_timeout_seconds;
  j["retry"] = {{"max_retries", retry.max_retries}, {"base_delay_ms", retry.base_delay_ms}};
  j["truncate"] = {{"max_lines", truncate.max_lines}, {"max_bytes", truncate.max_bytes}};
  j["working_dir"] = working_dir.string();

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("Cannot write config file {}", path.string());
    return;
  }
  file << j.dump(2);
}

namespace config_paths {

fs::path home_dir() {
  if (const char* home = std::getenv("HOME")) {
    return home;
  }
  return fs::current_path();
}

fs::path config_dir() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
    return fs::path(xdg) / "streamagent";
  }
  return home_dir() / ".config" / "streamagent";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".streamagent.json";
}

}  // namespace config_paths

}  // namespace streamagent
