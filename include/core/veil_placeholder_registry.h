#ifndef VEIL_PLACEHOLDER_REGISTRY_H_
#define VEIL_PLACEHOLDER_REGISTRY_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "veil_status.h"

namespace VeilCore {

/**
 * PlaceholderRegistry - stable value <-> placeholder assignment
 *
 * Placeholders have the form [PREFIX_NNN]: NNN is a per-prefix counter
 * starting at 1, zero-padded to three digits and never reused, so
 * [IP_999] is followed by [IP_1000].
 *
 * The same original value always gets the same placeholder for the life
 * of the registry, and two different values never share one. The
 * prefix only matters the first time a value is seen.
 */
class PlaceholderRegistry {
 public:
  PlaceholderRegistry() = default;

  std::string GetOrCreate(const std::string& value, const std::string& prefix);

  std::optional<std::string> Lookup(const std::string& value) const;
  std::optional<std::string> Reverse(const std::string& placeholder) const;

  /**
   * Replace every known placeholder in |text| by its original. Tokens
   * that look like placeholders but were never issued are left as-is.
   * Restored values are not scanned again.
   */
  std::string Deanonymize(const std::string& text) const;

  // (placeholder, original) pairs sorted by placeholder
  std::vector<std::pair<std::string, std::string>> MappingTable() const;

  // "# Mapping Table (Placeholder -> Original)", a rule, then one
  // "PLACEHOLDER -> ORIGINAL" line per entry sorted by placeholder
  std::string ExportText() const;

  // {"mappings": {...}, "reverse_mappings": {...}, "counters": {...}}
  nlohmann::json ToJSON() const;

  // Validates before touching anything; state is replaced only on OK
  ImportStatus FromJSON(const nlohmann::json& data);

  void Clear();

  size_t Size() const { return mappings_.size(); }
  int64_t Counter(const std::string& prefix) const;

  const std::map<std::string, std::string>& mappings() const { return mappings_; }
  const std::map<std::string, std::string>& reverse_mappings() const { return reverse_mappings_; }
  const std::map<std::string, int64_t>& counters() const { return counters_; }

 private:
  std::map<std::string, std::string> mappings_;          // original -> placeholder
  std::map<std::string, std::string> reverse_mappings_;  // placeholder -> original
  std::map<std::string, int64_t> counters_;              // prefix -> last issued number
};

std::string FormatPlaceholder(const std::string& prefix, int64_t number);

/**
 * Split "[PREFIX_NNN]" into prefix and number. NNN must be at least three
 * digits. Returns false for anything else.
 */
bool ParsePlaceholder(const std::string& token, std::string* prefix, int64_t* number);

}  // namespace VeilCore

#endif  // VEIL_PLACEHOLDER_REGISTRY_H_
