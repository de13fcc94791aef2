#ifndef VEIL_SESSION_STATE_H_
#define VEIL_SESSION_STATE_H_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "veil_detection.h"
#include "veil_enhancer.h"
#include "veil_pattern_type.h"
#include "veil_status.h"

namespace VeilCore {

/**
 * SessionState - full snapshot of an anonymizer's mutable state
 *
 * Export/import of this snapshot is the only persistence path; the engine
 * itself never touches the filesystem. JSON layout:
 *
 *   {
 *     "mappings":         {original: placeholder},
 *     "reverse_mappings": {placeholder: original},
 *     "counters":         {prefix: last issued number},
 *     "enabled_patterns": {type id: bool},
 *     "custom_patterns":  [[regex, prefix], ...],
 *     "preserve_list":    [string, ...],
 *     "enhancers":        {name: {"enabled": bool, "confidence_threshold": number}}
 *   }
 *
 * "enhancers" may be absent on import; every other key is required.
 * Pattern types missing from "enabled_patterns" default to enabled.
 */
struct SessionState {
  std::map<std::string, std::string> mappings;
  std::map<std::string, std::string> reverse_mappings;
  std::map<std::string, int64_t> counters;
  std::map<PatternType, bool> enabled_patterns;
  std::vector<CustomPattern> custom_patterns;
  std::vector<std::string> preserve_list;
  std::map<std::string, VeilEnhancers::EnhancerConfig> enhancers;

  nlohmann::json ToJSON() const;
  std::string Serialize(int indent = 2) const;

  // |out| is written only when the result is OK
  static ImportStatus FromJSON(const nlohmann::json& data, SessionState* out);
  static ImportStatus Parse(const std::string& text, SessionState* out);
};

}  // namespace VeilCore

#endif  // VEIL_SESSION_STATE_H_
