#include "veil_preset.h"
#include <algorithm>

namespace VeilPresets {

using json = nlohmann::json;
using VeilCore::CustomPattern;

namespace {

std::vector<std::string> ReadStringArray(const json& data, const char* key) {
  std::vector<std::string> values;
  if (!data.contains(key) || !data[key].is_array()) {
    return values;
  }
  for (const auto& value : data[key]) {
    if (value.is_string()) {
      values.push_back(value.get<std::string>());
    }
  }
  return values;
}

std::string ReadString(const json& data, const char* key) {
  if (data.contains(key) && data[key].is_string()) {
    return data[key].get<std::string>();
  }
  return "";
}

}  // namespace

std::optional<Preset> Preset::FromJSON(const json& data, const std::string& fallback_id) {
  if (!data.is_object()) {
    return std::nullopt;
  }

  Preset preset;
  preset.id = ReadString(data, "id");
  if (preset.id.empty()) {
    preset.id = fallback_id;
  }
  if (preset.id.empty()) {
    return std::nullopt;
  }

  preset.name = ReadString(data, "name");
  preset.description = ReadString(data, "description");
  preset.patterns = ReadStringArray(data, "patterns");
  preset.preserve = ReadStringArray(data, "preserve");

  if (data.contains("custom_patterns") && data["custom_patterns"].is_array()) {
    for (const auto& entry : data["custom_patterns"]) {
      if (!entry.is_object()) continue;
      std::string regex = ReadString(entry, "regex");
      std::string prefix = ReadString(entry, "prefix");
      if (!regex.empty() && !prefix.empty()) {
        preset.custom_patterns.push_back({regex, prefix});
      }
    }
  }

  return preset;
}

json Preset::ToJSON() const {
  json custom = json::array();
  for (const auto& pattern : custom_patterns) {
    custom.push_back({{"regex", pattern.regex}, {"prefix", pattern.prefix}});
  }

  return {
    {"id", id},
    {"name", name},
    {"description", description},
    {"patterns", patterns},
    {"preserve", preserve},
    {"custom_patterns", custom}
  };
}

BuiltinPresetSource::BuiltinPresetSource() {
  std::vector<Preset> builtins = {
    {"default", "Default", "Standard configuration for most logs",
     {"ipv4", "ipv6", "email", "hostname", "url", "uuid", "mac", "phone", "api_key",
      "jwt", "username", "server_name", "path_unix", "path_windows"},
     {"localhost", "127.0.0.1", "::1"},
     {}},
    {"ansible", "Ansible / Infrastructure", "Ansible, SSH and infrastructure tooling logs",
     {"ipv4", "ipv6", "hostname", "path_unix", "username", "server_name", "api_key", "email"},
     {"localhost", "127.0.0.1"},
     {{R"re((?:PLAY|TASK)\s+\[([^\]]+)\])re", "TASK"}}},
    {"apache", "Apache / Nginx", "Apache and Nginx web server logs",
     {"ipv4", "ipv6", "url", "hostname", "email", "username"},
     {"localhost", "127.0.0.1"},
     {{R"re("[A-Z]+ ([^"]+) HTTP/[0-9.]+")re", "REQUEST"}}},
    {"kubernetes", "Kubernetes", "Kubernetes and Docker logs",
     {"ipv4", "hostname", "uuid", "path_unix", "email", "server_name"},
     {"localhost", "kubernetes.default"},
     {{R"re(pod/[a-z0-9-]+)re", "POD"},
      {R"re(namespace/[a-z0-9-]+)re", "NS"},
      {R"re([a-z0-9]+-[a-z0-9]+-[a-z0-9]+-[a-z0-9]+-[a-z0-9]+)re", "KUID"}}},
    {"aws", "AWS CloudWatch", "AWS and CloudWatch logs",
     {"ipv4", "email", "url", "api_key", "hostname"},
     {"amazonaws.com"},
     {{R"re(arn:aws:[a-z0-9-]+:[a-z0-9-]*:[0-9]*:[a-zA-Z0-9/_-]+)re", "ARN"},
      {R"re(i-[0-9a-f]{8,17})re", "EC2"},
      {R"re(sg-[0-9a-f]+)re", "SG"},
      {R"re(vpc-[0-9a-f]+)re", "VPC"},
      {R"re(subnet-[0-9a-f]+)re", "SUBNET"},
      {R"re(AKIA[0-9A-Z]{16})re", "AKID"}}},
    {"database", "Database", "SQL and database server logs",
     {"ipv4", "email", "hostname", "uuid", "connection_string", "api_key"},
     {"localhost"},
     {{R"re((?:mysql|postgresql|mongodb|redis)://[^\s]+)re", "DBURL"}}},
    {"security", "Security audit", "Paranoid mode, every detector enabled",
     {},
     {},
     {}},
    {"minimal", "Minimal", "IP addresses and emails only",
     {"ipv4", "ipv6", "email"},
     {"localhost", "127.0.0.1"},
     {}},
  };

  for (auto& preset : builtins) {
    if (preset.id == "security") {
      for (VeilCore::PatternType type : VeilCore::AllPatternTypes()) {
        preset.patterns.push_back(VeilCore::PatternTypeToId(type));
      }
    }
    std::string id = preset.id;
    presets_[id] = std::move(preset);
  }
}

std::optional<Preset> BuiltinPresetSource::Find(const std::string& id) const {
  auto it = presets_.find(id);
  if (it == presets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> BuiltinPresetSource::List() const {
  std::vector<std::string> ids;
  for (const auto& entry : presets_) {
    ids.push_back(entry.first);
  }
  return ids;
}

LayeredPresetSource::LayeredPresetSource(std::shared_ptr<const PresetSource> primary,
                                         std::shared_ptr<const PresetSource> fallback)
    : primary_(std::move(primary)), fallback_(std::move(fallback)) {}

std::optional<Preset> LayeredPresetSource::Find(const std::string& id) const {
  if (primary_) {
    if (auto preset = primary_->Find(id)) {
      return preset;
    }
  }
  if (fallback_) {
    return fallback_->Find(id);
  }
  return std::nullopt;
}

std::vector<std::string> LayeredPresetSource::List() const {
  std::vector<std::string> ids;
  for (const auto* source : {primary_.get(), fallback_.get()}) {
    if (!source) continue;
    for (const auto& id : source->List()) {
      if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
      }
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace VeilPresets
