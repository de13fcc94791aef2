#ifndef VEIL_DETECTION_H_
#define VEIL_DETECTION_H_

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "veil_pattern_type.h"

namespace VeilCore {

/**
 * One detected sensitive value.
 *
 * [start, end) is a half-open byte interval into the analysed text.
 * custom_prefix is only set for detections produced by a custom pattern;
 * the registry then uses it instead of the category prefix.
 */
struct Detection {
  std::string value;
  PatternType pattern_type = PatternType::CUSTOM;
  size_t start = 0;
  size_t end = 0;
  std::optional<std::string> placeholder;
  std::optional<std::string> custom_prefix;

  size_t Length() const { return end - start; }

  // Prefix used for placeholder assignment
  std::string Prefix() const;
};

/**
 * Per-category detection counts, keyed by pattern type id
 */
struct DetectionStats {
  int total_items_found = 0;
  std::map<std::string, int> by_type;

  void AddDetection(PatternType type) {
    total_items_found++;
    by_type[PatternTypeToId(type)]++;
  }

  int Count(PatternType type) const;

  std::string ToString() const;
};

struct CustomPattern {
  std::string regex;
  std::string prefix;

  bool operator==(const CustomPattern& other) const {
    return regex == other.regex && prefix == other.prefix;
  }
};

struct AnonymizationResult {
  std::string anonymized_text;
  std::map<std::string, std::string> mappings;  // original -> placeholder
  DetectionStats stats;
  std::vector<Detection> detections;            // sorted by start
};

struct PreviewResult {
  std::vector<Detection> detections;            // sorted by start
  DetectionStats stats;
};

}  // namespace VeilCore

#endif  // VEIL_DETECTION_H_
