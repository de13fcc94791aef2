#include "veil_detection.h"
#include <sstream>

namespace VeilCore {

std::string Detection::Prefix() const {
  if (custom_prefix && !custom_prefix->empty()) {
    return *custom_prefix;
  }
  return PatternTypePrefix(pattern_type);
}

int DetectionStats::Count(PatternType type) const {
  auto it = by_type.find(PatternTypeToId(type));
  return it != by_type.end() ? it->second : 0;
}

std::string DetectionStats::ToString() const {
  std::stringstream ss;
  ss << "Anonymization stats: " << total_items_found << " value(s) replaced";
  if (!by_type.empty()) {
    ss << " (";
    bool first = true;
    for (const auto& [id, count] : by_type) {
      if (!first) ss << ", ";
      ss << id << ":" << count;
      first = false;
    }
    ss << ")";
  }
  return ss.str();
}

}  // namespace VeilCore
