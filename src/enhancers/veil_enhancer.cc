#include "veil_enhancer.h"
#include "veil_domain_enhancer.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <exception>
#include <map>

namespace VeilEnhancers {

using VeilCore::Detection;
using VeilCore::PatternType;

Enhancer::Enhancer(const EnhancerConfig& config) : config_(config) {}

bool Enhancer::Initialize() {
  if (initialized_) {
    return true;
  }

  if (!IsAvailable()) {
    return false;
  }

  bool ready = false;
  try {
    ready = DoInitialize();
  } catch (const std::exception& e) {
    LOG_WARN("Enhancer", "Failed to initialize " + Name() + ": " + e.what());
    return false;
  }

  if (!ready) {
    LOG_WARN("Enhancer", "Failed to initialize " + Name());
    return false;
  }

  initialized_ = true;
  return true;
}

std::vector<EnhancerResult> Enhancer::FilterByConfidence(
    const std::vector<EnhancerResult>& results) const {
  std::vector<EnhancerResult> kept;
  for (const auto& result : results) {
    if (result.confidence >= config_.confidence_threshold) {
      kept.push_back(result);
    }
  }
  return kept;
}

EnhancerStatus Enhancer::Status() const {
  EnhancerStatus status;
  status.name = Name();
  status.available = IsAvailable();
  status.initialized = initialized_;
  status.enabled = config_.enabled;
  status.confidence_threshold = config_.confidence_threshold;
  return status;
}

PatternType MapEntityLabel(const std::string& label) {
  static const std::map<std::string, PatternType> kLabels = {
    // NER-style entity names
    {"EMAIL_ADDRESS", PatternType::EMAIL},
    {"PHONE_NUMBER", PatternType::PHONE},
    {"IP_ADDRESS", PatternType::IPV4},
    {"URL", PatternType::URL},
    {"DOMAIN_NAME", PatternType::HOSTNAME},
    {"PERSON", PatternType::USERNAME},
    {"LOCATION", PatternType::HOSTNAME},
    {"CREDIT_CARD", PatternType::CREDIT_CARD},
    {"IBAN_CODE", PatternType::IBAN},
    {"US_SSN", PatternType::SSN},
    {"FR_SSN", PatternType::SSN},
    {"DATE_TIME", PatternType::DATE},
    {"NRP", PatternType::USERNAME},
    {"MEDICAL_LICENSE", PatternType::API_KEY},
    {"US_PASSPORT", PatternType::SSN},
    {"US_DRIVER_LICENSE", PatternType::SSN},
    {"CRYPTO", PatternType::API_KEY},
    {"UK_NHS", PatternType::SSN},
    // Secret scanners
    {"PII", PatternType::USERNAME},
    {"SECRET", PatternType::API_KEY},
    {"API_KEY", PatternType::API_KEY},
    {"PASSWORD", PatternType::API_KEY},
    // Domain extraction
    {"FQDN", PatternType::HOSTNAME},
    {"SUBDOMAIN", PatternType::HOSTNAME},
    {"DOMAIN", PatternType::HOSTNAME},
    {"TLD", PatternType::HOSTNAME},
  };

  std::string upper = label;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  auto it = kLabels.find(upper);
  return it != kLabels.end() ? it->second : PatternType::CUSTOM;
}

std::vector<Detection> CollectDetections(Enhancer& enhancer, const std::string& text) {
  std::vector<Detection> detections;

  if (!enhancer.config().enabled || !enhancer.Initialize()) {
    return detections;
  }

  std::vector<EnhancerResult> results;
  try {
    results = enhancer.FilterByConfidence(enhancer.Detect(text));
  } catch (const std::exception& e) {
    LOG_WARN("Enhancer", enhancer.Name() + " failed, continuing without it: " + e.what());
    return detections;
  }

  for (const auto& result : results) {
    if (result.start >= result.end || result.end > text.size()) {
      LOG_WARN("Enhancer", enhancer.Name() + " reported an invalid span, ignoring it");
      continue;
    }

    Detection det;
    det.value = text.substr(result.start, result.end - result.start);
    det.pattern_type = MapEntityLabel(result.entity_label);
    det.start = result.start;
    det.end = result.end;
    detections.push_back(std::move(det));
  }

  LOG_DEBUG("Enhancer", enhancer.Name() + " contributed " +
            std::to_string(detections.size()) + " detection(s)");
  return detections;
}

const std::vector<std::string>& KnownEnhancers() {
  static const std::vector<std::string> names = {"domain"};
  return names;
}

std::unique_ptr<Enhancer> CreateEnhancer(const std::string& name,
                                         const EnhancerConfig& config) {
  if (name == "domain") {
    return std::make_unique<DomainEnhancer>(config);
  }
  LOG_WARN("Enhancer", "Unknown enhancer: " + name);
  return nullptr;
}

}  // namespace VeilEnhancers
