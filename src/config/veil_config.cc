#include "veil_config.h"
#include "veil_enhancer.h"
#include "veil_pattern_type.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace VeilConfig {

using json = nlohmann::json;

namespace {

bool ParseByteLimit(const std::string& value, int64_t* out) {
  if (value.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || parsed <= 0) {
    return false;
  }
  *out = parsed;
  return true;
}

bool ReadStringList(const json& data, const char* key, std::vector<std::string>* out) {
  if (!data.contains(key)) {
    return true;
  }
  const json& list = data[key];
  if (!list.is_array()) {
    LOG_ERROR("Config", std::string("'") + key + "' must be an array of strings");
    return false;
  }
  std::vector<std::string> values;
  for (const auto& item : list) {
    if (!item.is_string()) {
      LOG_ERROR("Config", std::string("'") + key + "' must be an array of strings");
      return false;
    }
    values.push_back(item.get<std::string>());
  }
  *out = std::move(values);
  return true;
}

bool ReadString(const json& data, const char* key, std::string* out) {
  if (!data.contains(key)) {
    return true;
  }
  if (!data[key].is_string()) {
    LOG_ERROR("Config", std::string("'") + key + "' must be a string");
    return false;
  }
  *out = data[key].get<std::string>();
  return true;
}

}  // namespace

const char* OutputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::TEXT: return "text";
    case OutputFormat::JSON: return "json";
    case OutputFormat::HTML: return "html";
    default: return "unknown";
  }
}

std::optional<OutputFormat> ParseOutputFormat(const std::string& value) {
  if (value == "text") return OutputFormat::TEXT;
  if (value == "json") return OutputFormat::JSON;
  if (value == "html") return OutputFormat::HTML;
  return std::nullopt;
}

void LoadDefaults(ToolConfig* config) {
  *config = ToolConfig();
}

bool LoadConfigFile(const std::string& path, ToolConfig* config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("Config", "Cannot open config file: " + path);
    return false;
  }

  json data;
  try {
    data = json::parse(file);
  } catch (const json::parse_error& e) {
    LOG_ERROR("Config", "Invalid JSON in " + path + ": " + e.what());
    return false;
  }

  if (!data.is_object()) {
    LOG_ERROR("Config", "Config file must contain a JSON object: " + path);
    return false;
  }

  bool ok = true;

  std::string level_name;
  ok = ReadString(data, "log_level", &level_name) && ok;
  if (!level_name.empty() && !VeilLogger::Logger::ParseLevel(level_name, &config->log_level)) {
    LOG_ERROR("Config", "Unknown log_level: " + level_name);
    ok = false;
  }

  ok = ReadString(data, "log_file", &config->log_file) && ok;
  ok = ReadString(data, "session_file", &config->session_file) && ok;
  ok = ReadString(data, "preset", &config->preset) && ok;
  ok = ReadString(data, "preset_dir", &config->preset_dir) && ok;
  ok = ReadStringList(data, "enhancers", &config->enhancers) && ok;
  ok = ReadStringList(data, "preserve", &config->preserve) && ok;
  ok = ReadStringList(data, "enabled_patterns", &config->enabled_patterns) && ok;

  if (data.contains("custom_patterns")) {
    const json& patterns = data["custom_patterns"];
    if (!patterns.is_array()) {
      LOG_ERROR("Config", "'custom_patterns' must be an array");
      ok = false;
    } else {
      std::vector<VeilCore::CustomPattern> custom;
      for (const auto& entry : patterns) {
        if (!entry.is_object() || !entry.contains("regex") || !entry["regex"].is_string()) {
          LOG_ERROR("Config", "custom_patterns entries need a \"regex\" string");
          ok = false;
          continue;
        }
        VeilCore::CustomPattern pattern;
        pattern.regex = entry["regex"].get<std::string>();
        pattern.prefix = "CUSTOM";
        if (entry.contains("prefix") && entry["prefix"].is_string()) {
          pattern.prefix = entry["prefix"].get<std::string>();
        }
        custom.push_back(pattern);
      }
      config->custom_patterns = std::move(custom);
    }
  }

  std::string format_name;
  ok = ReadString(data, "output_format", &format_name) && ok;
  if (!format_name.empty()) {
    if (auto format = ParseOutputFormat(format_name)) {
      config->output_format = *format;
    } else {
      LOG_ERROR("Config", "Unknown output_format: " + format_name);
      ok = false;
    }
  }

  if (data.contains("max_input_bytes")) {
    const json& limit = data["max_input_bytes"];
    if (!limit.is_number_integer() || limit.get<int64_t>() <= 0) {
      LOG_ERROR("Config", "'max_input_bytes' must be a positive integer");
      ok = false;
    } else {
      config->max_input_bytes = limit.get<int64_t>();
    }
  }

  if (ok) {
    LOG_DEBUG("Config", "Loaded config file " + path);
  }
  return ok;
}

void LoadConfigFromEnv(ToolConfig* config) {
  const char* env = nullptr;

  if ((env = std::getenv("VEIL_LOG_LEVEL")) != nullptr) {
    if (!VeilLogger::Logger::ParseLevel(env, &config->log_level)) {
      LOG_WARN("Config", std::string("Ignoring VEIL_LOG_LEVEL=") + env);
    }
  }
  if ((env = std::getenv("VEIL_LOG_FILE")) != nullptr) {
    config->log_file = env;
  }
  if ((env = std::getenv("VEIL_SESSION_FILE")) != nullptr) {
    config->session_file = env;
  }
  if ((env = std::getenv("VEIL_PRESET")) != nullptr) {
    config->preset = env;
  }
  if ((env = std::getenv("VEIL_PRESET_DIR")) != nullptr) {
    config->preset_dir = env;
  }
  if ((env = std::getenv("VEIL_MAX_INPUT_BYTES")) != nullptr) {
    if (!ParseByteLimit(env, &config->max_input_bytes)) {
      LOG_WARN("Config", std::string("Ignoring VEIL_MAX_INPUT_BYTES=") + env);
    }
  }
}

bool ValidateConfig(const ToolConfig& config, std::string* error) {
  if (config.max_input_bytes <= 0) {
    *error = "max_input_bytes must be positive";
    return false;
  }

  for (const auto& id : config.enabled_patterns) {
    if (!VeilCore::ParsePatternType(id)) {
      *error = "unknown pattern type: " + id;
      return false;
    }
  }

  const auto& known = VeilEnhancers::KnownEnhancers();
  for (const auto& name : config.enhancers) {
    if (std::find(known.begin(), known.end(), name) == known.end()) {
      *error = "unknown enhancer: " + name;
      return false;
    }
  }

  for (const auto& pattern : config.custom_patterns) {
    if (pattern.regex.empty()) {
      *error = "custom pattern with empty regex";
      return false;
    }
  }

  return true;
}

void PrintConfig(const ToolConfig& config) {
  std::cerr << "Configuration:\n"
            << "  log_level:        " << VeilLogger::Logger::LevelName(config.log_level) << "\n"
            << "  log_file:         " << (config.log_file.empty() ? "(stderr)" : config.log_file) << "\n"
            << "  session_file:     " << (config.session_file.empty() ? "(none)" : config.session_file) << "\n"
            << "  preset:           " << (config.preset.empty() ? "(none)" : config.preset) << "\n"
            << "  preset_dir:       " << (config.preset_dir.empty() ? "(none)" : config.preset_dir) << "\n"
            << "  enhancers:        " << config.enhancers.size() << "\n"
            << "  preserve:         " << config.preserve.size() << " value(s)\n"
            << "  custom_patterns:  " << config.custom_patterns.size() << "\n"
            << "  enabled_patterns: " << (config.enabled_patterns.empty() ? std::string("(preset/all)")
                                          : std::to_string(config.enabled_patterns.size())) << "\n"
            << "  output_format:    " << OutputFormatToString(config.output_format) << "\n"
            << "  max_input_bytes:  " << config.max_input_bytes << std::endl;
}

}  // namespace VeilConfig
