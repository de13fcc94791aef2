#ifndef VEIL_PATTERN_CATALOG_H_
#define VEIL_PATTERN_CATALOG_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <re2/re2.h>

#include "veil_pattern_type.h"

namespace VeilCore {

/**
 * A catalog pattern after compilation. |regex| is null when the source
 * failed to compile; such entries are kept so the catalog order stays
 * stable, and the detector skips them.
 */
struct CompiledPattern {
  PatternType type;
  std::string source;
  std::shared_ptr<const re2::RE2> regex;
};

/**
 * PatternCatalog - the ordered list of built-in detectors
 *
 * Position in the list is priority: when two detections of equal length
 * overlap, the one produced by the earlier pattern wins. Every pattern is
 * matched case-insensitively with RE2, so matching time is linear in the
 * input whatever the pattern.
 *
 * The compiled catalog is process-wide, built on first use and read-only
 * afterwards. It carries no session data, so any number of anonymizer
 * instances share it.
 */
class PatternCatalog {
 public:
  static const PatternCatalog& Instance();

  const std::vector<CompiledPattern>& Patterns() const { return patterns_; }

  // Source regex for a category, empty for CUSTOM
  std::string SourceFor(PatternType type) const;

  size_t CompiledCount() const;

 private:
  PatternCatalog();

  std::vector<CompiledPattern> patterns_;
};

// Program size budget for one compiled pattern
constexpr int64_t kPatternMaxMem = 8 << 20;

/**
 * Compile |source| with the engine's options (RE2 syntax, Latin-1 so
 * offsets are byte offsets, case-insensitive). Returns null and fills
 * |error| when the regex is malformed or exceeds kPatternMaxMem.
 */
std::shared_ptr<const re2::RE2> CompilePattern(const std::string& source,
                                               std::string* error);

}  // namespace VeilCore

#endif  // VEIL_PATTERN_CATALOG_H_
