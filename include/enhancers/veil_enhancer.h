#ifndef VEIL_ENHANCER_H_
#define VEIL_ENHANCER_H_

#include <memory>
#include <string>
#include <vector>

#include "veil_detection.h"
#include "veil_pattern_type.h"

namespace VeilEnhancers {

/**
 * Per-enhancer settings. Results scoring below |confidence_threshold|
 * are dropped before they reach the anonymizer.
 */
struct EnhancerConfig {
  bool enabled = true;
  double confidence_threshold = 0.7;
};

/**
 * One entity reported by an enhancer. |entity_label| is the enhancer's
 * own vocabulary (EMAIL_ADDRESS, FQDN, SECRET, ...); MapEntityLabel()
 * turns it into a pattern type.
 */
struct EnhancerResult {
  std::string value;
  std::string entity_label;
  size_t start = 0;
  size_t end = 0;
  double confidence = 1.0;
  std::string source;
};

struct EnhancerStatus {
  std::string name;
  bool available = false;
  bool initialized = false;
  bool enabled = false;
  double confidence_threshold = 0.0;
};

/**
 * Enhancer - capability interface for external detectors
 *
 * An enhancer supplies extra spans with confidence scores. Its detections
 * are offered to the overlap resolver ahead of the built-in catalog, so
 * they win equal-length conflicts.
 *
 * Implementations must be synchronous; any timeout or offloading is the
 * implementation's business.
 */
class Enhancer {
 public:
  explicit Enhancer(const EnhancerConfig& config = EnhancerConfig());
  virtual ~Enhancer() = default;

  virtual std::string Name() const = 0;

  // True when the enhancer's dependencies are usable
  virtual bool IsAvailable() const = 0;

  virtual std::vector<EnhancerResult> Detect(const std::string& text) = 0;

  /**
   * One-time setup on first use. Returns false when the enhancer is
   * unavailable or DoInitialize() fails or throws.
   */
  bool Initialize();

  std::vector<EnhancerResult> FilterByConfidence(
      const std::vector<EnhancerResult>& results) const;

  EnhancerStatus Status() const;

  const EnhancerConfig& config() const { return config_; }
  void set_config(const EnhancerConfig& config) { config_ = config; }

 protected:
  virtual bool DoInitialize() { return true; }

  EnhancerConfig config_;
  bool initialized_ = false;
};

// Fixed label table; unknown labels map to CUSTOM. Case-insensitive.
VeilCore::PatternType MapEntityLabel(const std::string& label);

/**
 * Run |enhancer| over |text| and convert what survives into detections:
 * disabled, unavailable or throwing enhancers contribute nothing. Results
 * under the confidence threshold or with a span outside |text| are dropped.
 */
std::vector<VeilCore::Detection> CollectDetections(Enhancer& enhancer,
                                                   const std::string& text);

// Names accepted by CreateEnhancer(), in registration order
const std::vector<std::string>& KnownEnhancers();

// Returns null for an unknown name
std::unique_ptr<Enhancer> CreateEnhancer(const std::string& name,
                                         const EnhancerConfig& config = EnhancerConfig());

}  // namespace VeilEnhancers

#endif  // VEIL_ENHANCER_H_
