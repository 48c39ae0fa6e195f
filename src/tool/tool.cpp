#include "streamagent/tool/tool.hpp"

#include <algorithm>
#include <sstream>

namespace streamagent {

std::string ToolResult::to_model_output() const {
  if (success) {
    return output;
  }
  return "Error: " + error.value_or("") + "\nOutput: " + output;
}

json ToolResult::to_json() const {
  json j = {{"success", success}, {"output", output}, {"metadata", metadata}, {"truncated", truncated}};
  if (error) {
    j["error"] = *error;
  } else {
    j["error"] = nullptr;
  }
  return j;
}

// Parameter schema to JSON
json ParameterSchema::to_json_schema() const {
  json schema;
  schema["type"] = type;
  schema["description"] = description;

  if (default_value) {
    schema["default"] = *default_value;
  }

  if (enum_values && !enum_values->empty()) {
    schema["enum"] = *enum_values;
  }

  if (minimum) {
    schema["minimum"] = *minimum;
  }

  return schema;
}

// Tool to JSON schema
json Tool::to_json_schema() const {
  json schema;
  schema["name"] = name();
  schema["description"] = description();

  json properties = json::object();
  json required_props = json::array();

  for (const auto &param : parameters()) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  schema["parameters"] = {{"type", "object"}, {"properties", properties}, {"required", required_props}};

  return schema;
}

namespace {

bool matches_type(const json &value, const std::string &type) {
  if (type == "string") return value.is_string();
  if (type == "integer") return value.is_number_integer();
  if (type == "number") return value.is_number();
  if (type == "boolean") return value.is_boolean();
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  return true;
}

}  // namespace

std::vector<std::string> Tool::validate_args(const json &args) const {
  if (!args.is_object()) {
    return {"Arguments must be a JSON object"};
  }

  std::vector<std::string> errors;
  for (const auto &param : parameters()) {
    auto it = args.find(param.name);
    if (it == args.end() || it->is_null()) {
      if (param.required) {
        errors.push_back("Missing required parameter: " + param.name);
      }
      continue;
    }

    if (!matches_type(*it, param.type)) {
      errors.push_back("Parameter '" + param.name + "' must be of type " + param.type);
      continue;
    }

    if (param.minimum && it->is_number() && it->get<double>() < *param.minimum) {
      std::ostringstream msg;
      msg << "Parameter '" << param.name << "' must be >= " << *param.minimum;
      errors.push_back(msg.str());
    }

    if (param.enum_values && it->is_string()) {
      const auto &values = *param.enum_values;
      if (std::find(values.begin(), values.end(), it->get<std::string>()) == values.end()) {
        errors.push_back("Parameter '" + param.name + "' has an unsupported value");
      }
    }
  }

  return errors;
}

// SimpleTool implementation
SimpleTool::SimpleTool(std::string name, std::string description) : name_(std::move(name)), description_(std::move(description)) {}

// Truncation helpers
namespace Truncate {

TruncateResult output(const std::string &text, size_t max_lines, size_t max_bytes) {
  TruncateResult result;
  result.truncated = false;

  // Sanitize input to ensure valid UTF-8 (prevents nlohmann::json type_error.316)
  std::string safe_text = sanitize_utf8(text);

  // Check byte limit
  if (safe_text.size() > max_bytes) {
    // Never cut inside a multi-byte sequence
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(safe_text[cut]) & 0xC0) == 0x80) {
      cut--;
    }
    result.truncated = true;
    result.content = safe_text.substr(0, cut);
    result.content += "\n... [Output truncated. " + std::to_string(safe_text.size() - cut) + " bytes omitted]";
    return result;
  }

  // Check line limit
  size_t line_count = 0;
  size_t pos = 0;
  size_t last_newline = 0;

  while ((pos = safe_text.find('\n', pos)) != std::string::npos) {
    line_count++;
    last_newline = pos;
    pos++;

    if (line_count >= max_lines && pos < safe_text.size()) {
      result.truncated = true;
      result.content = safe_text.substr(0, last_newline);

      // Count remaining lines, including an unterminated last one
      size_t remaining = 0;
      size_t line_start = pos;
      while ((pos = safe_text.find('\n', pos)) != std::string::npos) {
        remaining++;
        pos++;
        line_start = pos;
      }
      if (line_start < safe_text.size()) {
        remaining++;
      }

      result.content += "\n... [" + std::to_string(remaining) + " lines truncated]";
      return result;
    }
  }

  result.content = safe_text;
  return result;
}

}  // namespace Truncate

}  // namespace streamagent
