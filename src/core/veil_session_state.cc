#include "veil_session_state.h"
#include "veil_placeholder_registry.h"
#include "logger.h"

namespace VeilCore {

using json = nlohmann::json;

namespace {

ImportStatus SchemaError(const std::string& what) {
  LOG_WARN("SessionState", "Import rejected: " + what);
  return ImportStatus::SCHEMA_ERROR;
}

}  // namespace

json SessionState::ToJSON() const {
  json data;
  data["mappings"] = mappings;
  data["reverse_mappings"] = reverse_mappings;
  data["counters"] = counters;

  json enabled = json::object();
  for (PatternType type : AllPatternTypes()) {
    auto it = enabled_patterns.find(type);
    enabled[PatternTypeToId(type)] = (it == enabled_patterns.end()) ? true : it->second;
  }
  data["enabled_patterns"] = enabled;

  json custom = json::array();
  for (const auto& pattern : custom_patterns) {
    custom.push_back(json::array({pattern.regex, pattern.prefix}));
  }
  data["custom_patterns"] = custom;

  data["preserve_list"] = preserve_list;

  json enhancer_settings = json::object();
  for (const auto& [name, config] : enhancers) {
    enhancer_settings[name] = {
      {"enabled", config.enabled},
      {"confidence_threshold", config.confidence_threshold}
    };
  }
  data["enhancers"] = enhancer_settings;

  return data;
}

std::string SessionState::Serialize(int indent) const {
  return ToJSON().dump(indent);
}

ImportStatus SessionState::FromJSON(const json& data, SessionState* out) {
  if (!data.is_object()) {
    return SchemaError("session state is not an object");
  }

  // Mapping tables go through the registry's own validation
  PlaceholderRegistry registry;
  ImportStatus status = registry.FromJSON(data);
  if (status != ImportStatus::OK) {
    return status;
  }

  SessionState state;
  state.mappings = registry.mappings();
  state.reverse_mappings = registry.reverse_mappings();
  state.counters = registry.counters();

  if (!data.contains("enabled_patterns") || !data["enabled_patterns"].is_object()) {
    return SchemaError("'enabled_patterns' missing or not an object");
  }
  for (PatternType type : AllPatternTypes()) {
    state.enabled_patterns[type] = true;
  }
  for (const auto& [id, flag] : data["enabled_patterns"].items()) {
    auto type = ParsePatternType(id);
    if (!type) {
      return SchemaError("unknown pattern type '" + id + "'");
    }
    if (!flag.is_boolean()) {
      return SchemaError("enabled flag for '" + id + "' is not a boolean");
    }
    state.enabled_patterns[*type] = flag.get<bool>();
  }

  if (!data.contains("custom_patterns") || !data["custom_patterns"].is_array()) {
    return SchemaError("'custom_patterns' missing or not an array");
  }
  for (const auto& entry : data["custom_patterns"]) {
    if (!entry.is_array() || entry.size() != 2 ||
        !entry[0].is_string() || !entry[1].is_string()) {
      return SchemaError("custom pattern is not a [regex, prefix] pair");
    }
    state.custom_patterns.push_back({entry[0].get<std::string>(), entry[1].get<std::string>()});
  }

  if (!data.contains("preserve_list") || !data["preserve_list"].is_array()) {
    return SchemaError("'preserve_list' missing or not an array");
  }
  for (const auto& value : data["preserve_list"]) {
    if (!value.is_string()) {
      return SchemaError("preserve list entry is not a string");
    }
    state.preserve_list.push_back(value.get<std::string>());
  }

  if (data.contains("enhancers")) {
    if (!data["enhancers"].is_object()) {
      return SchemaError("'enhancers' is not an object");
    }
    for (const auto& [name, settings] : data["enhancers"].items()) {
      if (!settings.is_object() ||
          !settings.contains("enabled") || !settings["enabled"].is_boolean() ||
          !settings.contains("confidence_threshold") ||
          !settings["confidence_threshold"].is_number()) {
        return SchemaError("settings for enhancer '" + name + "' are malformed");
      }
      VeilEnhancers::EnhancerConfig config;
      config.enabled = settings["enabled"].get<bool>();
      config.confidence_threshold = settings["confidence_threshold"].get<double>();
      state.enhancers[name] = config;
    }
  }

  *out = std::move(state);
  return ImportStatus::OK;
}

ImportStatus SessionState::Parse(const std::string& text, SessionState* out) {
  json data;
  try {
    data = json::parse(text);
  } catch (const json::parse_error& e) {
    LOG_WARN("SessionState", std::string("Import rejected: ") + e.what());
    return ImportStatus::PARSE_ERROR;
  }
  return FromJSON(data, out);
}

}  // namespace VeilCore
