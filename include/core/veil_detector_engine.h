#ifndef VEIL_DETECTOR_ENGINE_H_
#define VEIL_DETECTOR_ENGINE_H_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <re2/re2.h>

#include "veil_detection.h"
#include "veil_pattern_type.h"

namespace VeilCore {

/**
 * DetectorEngine - produces raw candidate spans
 *
 * Candidates come back in the order the overlap resolver must see them:
 * enhancer detections first, then catalog detections in catalog order,
 * then custom patterns in registration order. Nothing is validated or
 * filtered here.
 *
 * For a match with capture groups, the first matched non-empty group is
 * the detection (patterns often match context such as "user=" around the
 * sensitive part). Empty matches are dropped.
 *
 * A pattern that fails to compile is logged and skipped; the run always
 * completes. Matching is linear in the input length, so long lines and
 * large PEM blocks cost time, never stack.
 */
class DetectorEngine {
 public:
  DetectorEngine() = default;

  /**
   * @param text                 Text to scan
   * @param enabled              Per-type switch; types absent from the map are enabled
   * @param custom_patterns      User patterns, in registration order
   * @param enhancer_detections  Already-converted enhancer spans
   */
  std::vector<Detection> Run(const std::string& text,
                             const std::map<PatternType, bool>& enabled,
                             const std::vector<CustomPattern>& custom_patterns,
                             const std::vector<Detection>& enhancer_detections);

  // Drop compiled custom patterns; they are rebuilt on the next run
  void InvalidateCustomCache();

  // Number of custom patterns in the cache that compiled
  size_t CompiledCustomCount() const;

 private:
  struct CompiledCustom {
    CustomPattern pattern;
    std::shared_ptr<const re2::RE2> regex;
  };

  void EnsureCustomCompiled(const std::vector<CustomPattern>& custom_patterns);

  std::vector<CompiledCustom> compiled_custom_;
  bool custom_cache_valid_ = false;
};

/**
 * Append every match of |regex| in |text| to |out| as a detection of
 * |type|. The next search starts where the reported span ends, so context
 * matched after a capture group can begin the following match.
 *
 * @return Number of detections appended
 */
size_t CollectMatches(const re2::RE2& regex,
                      const std::string& text,
                      PatternType type,
                      const std::optional<std::string>& custom_prefix,
                      std::vector<Detection>* out);

}  // namespace VeilCore

#endif  // VEIL_DETECTOR_ENGINE_H_
