#ifndef VEIL_ANONYMIZER_H_
#define VEIL_ANONYMIZER_H_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "veil_detection.h"
#include "veil_detector_engine.h"
#include "veil_enhancer.h"
#include "veil_pattern_type.h"
#include "veil_placeholder_registry.h"
#include "veil_preset.h"
#include "veil_session_state.h"
#include "veil_status.h"

namespace VeilCore {

enum class MappingFormat {
  TEXT,
  JSON
};

/**
 * VeilAnonymizer - replaces sensitive values with stable placeholders
 *
 * Pipeline for every call:
 *   enhancers + catalog + custom patterns -> validation -> preserve list
 *   -> overlap resolution -> placeholder assignment -> substitution
 *
 * One instance is one session: the same value gets the same placeholder
 * across every Anonymize() call on the instance, which keeps references
 * consistent across several files of one incident. The instance is not
 * thread-safe; give each concurrent session its own instance or
 * serialize access externally.
 *
 * Usage:
 *   VeilAnonymizer anonymizer;
 *   AnonymizationResult result = anonymizer.Anonymize(log_text);
 *   std::string restored = anonymizer.Deanonymize(result.anonymized_text);
 */
class VeilAnonymizer {
 public:
  VeilAnonymizer();
  ~VeilAnonymizer() = default;

  VeilAnonymizer(const VeilAnonymizer&) = delete;
  VeilAnonymizer& operator=(const VeilAnonymizer&) = delete;

  /**
   * Detect sensitive values without replacing them.
   *
   * @return Disjoint detections sorted by start offset
   */
  std::vector<Detection> Detect(const std::string& text);

  /**
   * Replace every detection by its placeholder. Placeholders are handed
   * out from the end of the text towards the start.
   */
  AnonymizationResult Anonymize(const std::string& text);

  // Same detections as Anonymize() would make; nothing is registered
  PreviewResult Preview(const std::string& text);

  std::string Deanonymize(const std::string& text) const;

  // Forget every mapping and counter; configuration is kept
  void Reset();

  // Stats of the last Anonymize() call
  DetectionStats GetStats() const { return stats_; }

  // ----- pattern configuration -----

  void SetPatternEnabled(PatternType type, bool enabled);
  bool IsPatternEnabled(PatternType type) const;

  // Disable everything except |types|
  void EnableOnly(const std::vector<PatternType>& types);

  void AddCustomPattern(const std::string& regex, const std::string& prefix = "CUSTOM");
  void ClearCustomPatterns();
  const std::vector<CustomPattern>& custom_patterns() const { return custom_patterns_; }

  // Detections containing any preserved value (case-insensitive) are dropped
  void AddPreserveValue(const std::string& value);
  void ClearPreserveList();
  const std::vector<std::string>& preserve_list() const { return preserve_list_; }

  /**
   * Look up |id| in |source| and apply it. Returns false and leaves the
   * configuration untouched when the source has no such preset.
   */
  bool LoadPreset(const VeilPresets::PresetSource& source, const std::string& id);

  /**
   * Disable every type, enable the preset's types (unknown ids ignored),
   * replace the preserve list and the custom patterns.
   */
  void ApplyPreset(const VeilPresets::Preset& preset);

  // ----- enhancers -----

  void AddEnhancer(std::unique_ptr<VeilEnhancers::Enhancer> enhancer);
  VeilEnhancers::Enhancer* FindEnhancer(const std::string& name) const;
  std::vector<VeilEnhancers::EnhancerStatus> GetEnhancerStatus() const;

  // ----- persistence -----

  SessionState ExportSessionState() const;

  /**
   * Replace the whole session with |state|. Enhancer settings apply to
   * attached enhancers of the same name; known enhancers that are not
   * attached yet are created. Mapping tables that disagree are rejected
   * and nothing changes.
   */
  ImportStatus ImportSessionState(const SessionState& state);

  // Parses and validates, then imports. Nothing changes unless OK.
  ImportStatus ImportSessionState(const std::string& json_text);

  std::string ExportMappings(MappingFormat format = MappingFormat::TEXT) const;

  // Mapping tables only ({"mappings", "reverse_mappings", "counters"})
  ImportStatus ImportMappings(const std::string& json_text);

  // (placeholder, original) pairs sorted by placeholder
  std::vector<std::pair<std::string, std::string>> MappingTable() const;

  const PlaceholderRegistry& registry() const { return registry_; }

 private:
  bool ShouldPreserve(const std::string& value) const;
  std::vector<Detection> CollectEnhancerDetections(const std::string& text);

  PlaceholderRegistry registry_;
  DetectorEngine engine_;
  DetectionStats stats_;

  std::map<PatternType, bool> enabled_patterns_;
  std::vector<CustomPattern> custom_patterns_;
  std::vector<std::string> preserve_list_;
  std::vector<std::unique_ptr<VeilEnhancers::Enhancer>> enhancers_;
};

/**
 * Options for one-shot anonymization. A preset, when given, wins over
 * |enabled_patterns|; custom patterns and preserve values are added on top.
 */
struct AnonymizeOptions {
  std::optional<std::string> preset;
  std::optional<std::vector<std::string>> enabled_patterns;
  std::vector<CustomPattern> custom_patterns;
  std::vector<std::string> preserve_values;
};

// Anonymize with a fresh engine and the built-in presets
AnonymizationResult AnonymizeText(const std::string& text,
                                  const AnonymizeOptions& options = AnonymizeOptions());

}  // namespace VeilCore

#endif  // VEIL_ANONYMIZER_H_
