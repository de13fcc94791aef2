#include "veil_placeholder_registry.h"
#include "logger.h"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace VeilCore {

using json = nlohmann::json;

std::string FormatPlaceholder(const std::string& prefix, int64_t number) {
  std::ostringstream oss;
  oss << '[' << prefix << '_' << std::setfill('0') << std::setw(3) << number << ']';
  return oss.str();
}

bool ParsePlaceholder(const std::string& token, std::string* prefix, int64_t* number) {
  if (token.size() < 7 || token.front() != '[' || token.back() != ']') {
    return false;
  }

  size_t underscore = token.rfind('_');
  if (underscore == std::string::npos || underscore < 2) {
    return false;
  }

  std::string digits = token.substr(underscore + 1, token.size() - underscore - 2);
  if (digits.size() < 3 || digits.size() > 18) {
    return false;
  }
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }

  if (prefix) *prefix = token.substr(1, underscore - 1);
  if (number) *number = std::stoll(digits);
  return true;
}

std::string PlaceholderRegistry::GetOrCreate(const std::string& value, const std::string& prefix) {
  auto it = mappings_.find(value);
  if (it != mappings_.end()) {
    return it->second;
  }

  int64_t number = ++counters_[prefix];
  std::string placeholder = FormatPlaceholder(prefix, number);

  mappings_[value] = placeholder;
  reverse_mappings_[placeholder] = value;
  return placeholder;
}

std::optional<std::string> PlaceholderRegistry::Lookup(const std::string& value) const {
  auto it = mappings_.find(value);
  if (it == mappings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> PlaceholderRegistry::Reverse(const std::string& placeholder) const {
  auto it = reverse_mappings_.find(placeholder);
  if (it == reverse_mappings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string PlaceholderRegistry::Deanonymize(const std::string& text) const {
  if (reverse_mappings_.empty()) {
    return text;
  }

  std::string result;
  result.reserve(text.size());

  size_t pos = 0;
  while (pos < text.size()) {
    size_t open = text.find('[', pos);
    if (open == std::string::npos) {
      result.append(text, pos, std::string::npos);
      break;
    }
    result.append(text, pos, open - pos);

    size_t close = text.find(']', open + 1);
    if (close == std::string::npos) {
      result.append(text, open, std::string::npos);
      break;
    }

    auto it = reverse_mappings_.find(text.substr(open, close - open + 1));
    if (it != reverse_mappings_.end()) {
      result += it->second;
      pos = close + 1;
    } else {
      // Not ours; a later '[' may still start a placeholder
      result += '[';
      pos = open + 1;
    }
  }

  return result;
}

std::vector<std::pair<std::string, std::string>> PlaceholderRegistry::MappingTable() const {
  // reverse_mappings_ is already ordered by placeholder
  return std::vector<std::pair<std::string, std::string>>(reverse_mappings_.begin(),
                                                          reverse_mappings_.end());
}

std::string PlaceholderRegistry::ExportText() const {
  std::ostringstream oss;
  oss << "# Mapping Table (Placeholder -> Original)\n";
  oss << std::string(60, '=');
  for (const auto& [placeholder, original] : reverse_mappings_) {
    oss << '\n' << placeholder << " -> " << original;
  }
  return oss.str();
}

json PlaceholderRegistry::ToJSON() const {
  json data;
  data["mappings"] = mappings_;
  data["reverse_mappings"] = reverse_mappings_;
  data["counters"] = counters_;
  return data;
}

ImportStatus PlaceholderRegistry::FromJSON(const json& data) {
  if (!data.is_object()) {
    return ImportStatus::SCHEMA_ERROR;
  }

  for (const char* key : {"mappings", "reverse_mappings", "counters"}) {
    if (!data.contains(key) || !data[key].is_object()) {
      LOG_WARN("PlaceholderRegistry", std::string("Import rejected: '") + key +
               "' missing or not an object");
      return ImportStatus::SCHEMA_ERROR;
    }
  }

  std::map<std::string, std::string> mappings;
  std::map<std::string, std::string> reverse_mappings;
  std::map<std::string, int64_t> counters;

  for (const auto& [original, placeholder] : data["mappings"].items()) {
    if (!placeholder.is_string()) {
      return ImportStatus::SCHEMA_ERROR;
    }
    mappings[original] = placeholder.get<std::string>();
  }

  for (const auto& [placeholder, original] : data["reverse_mappings"].items()) {
    if (!original.is_string()) {
      return ImportStatus::SCHEMA_ERROR;
    }
    reverse_mappings[placeholder] = original.get<std::string>();
  }

  for (const auto& [prefix, counter] : data["counters"].items()) {
    if (!counter.is_number_integer() || counter.get<int64_t>() < 0) {
      return ImportStatus::SCHEMA_ERROR;
    }
    counters[prefix] = counter.get<int64_t>();
  }

  // The two maps must be exact inverses of each other
  if (mappings.size() != reverse_mappings.size()) {
    LOG_WARN("PlaceholderRegistry", "Import rejected: mapping tables differ in size");
    return ImportStatus::INCONSISTENT;
  }
  for (const auto& [original, placeholder] : mappings) {
    auto it = reverse_mappings.find(placeholder);
    if (it == reverse_mappings.end() || it->second != original) {
      LOG_WARN("PlaceholderRegistry", "Import rejected: " + placeholder +
               " has no matching reverse entry");
      return ImportStatus::INCONSISTENT;
    }

    // Counters must be past every issued number or a placeholder would be re-issued
    std::string prefix;
    int64_t number = 0;
    if (!ParsePlaceholder(placeholder, &prefix, &number)) {
      LOG_WARN("PlaceholderRegistry", "Import rejected: malformed placeholder " + placeholder);
      return ImportStatus::INCONSISTENT;
    }
    auto counter = counters.find(prefix);
    if (counter == counters.end() || counter->second < number) {
      LOG_WARN("PlaceholderRegistry", "Import rejected: counter for " + prefix +
               " is behind " + placeholder);
      return ImportStatus::INCONSISTENT;
    }
  }

  mappings_ = std::move(mappings);
  reverse_mappings_ = std::move(reverse_mappings);
  counters_ = std::move(counters);

  LOG_DEBUG("PlaceholderRegistry", "Imported " + std::to_string(mappings_.size()) + " mapping(s)");
  return ImportStatus::OK;
}

void PlaceholderRegistry::Clear() {
  mappings_.clear();
  reverse_mappings_.clear();
  counters_.clear();
}

int64_t PlaceholderRegistry::Counter(const std::string& prefix) const {
  auto it = counters_.find(prefix);
  return it != counters_.end() ? it->second : 0;
}

}  // namespace VeilCore
