#include "veil_anonymizer.h"
#include "veil_overlap_resolver.h"
#include "veil_validator.h"
#include "logger.h"
#include <algorithm>
#include <cctype>

namespace VeilCore {

using json = nlohmann::json;

namespace {

std::string ToLower(const std::string& s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

}  // namespace

VeilAnonymizer::VeilAnonymizer() {
  for (PatternType type : AllPatternTypes()) {
    enabled_patterns_[type] = true;
  }
}

bool VeilAnonymizer::ShouldPreserve(const std::string& value) const {
  if (preserve_list_.empty()) {
    return false;
  }

  std::string lower_value = ToLower(value);
  for (const auto& preserved : preserve_list_) {
    if (preserved.empty()) continue;
    if (lower_value.find(ToLower(preserved)) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::vector<Detection> VeilAnonymizer::CollectEnhancerDetections(const std::string& text) {
  std::vector<Detection> detections;
  for (auto& enhancer : enhancers_) {
    std::vector<Detection> found = VeilEnhancers::CollectDetections(*enhancer, text);
    detections.insert(detections.end(), found.begin(), found.end());
  }
  return detections;
}

std::vector<Detection> VeilAnonymizer::Detect(const std::string& text) {
  if (text.empty()) {
    return {};
  }

  std::vector<Detection> candidates =
      engine_.Run(text, enabled_patterns_, custom_patterns_, CollectEnhancerDetections(text));

  OverlapResolver resolver;
  size_t rejected_invalid = 0;
  size_t rejected_preserved = 0;

  for (const auto& candidate : candidates) {
    if (!Validate(candidate.value, candidate.pattern_type)) {
      rejected_invalid++;
      continue;
    }
    if (ShouldPreserve(candidate.value)) {
      rejected_preserved++;
      continue;
    }
    resolver.Offer(candidate);
  }

  std::vector<Detection> detections = resolver.Finish();

  LOG_DEBUG("Anonymizer", std::to_string(candidates.size()) + " candidate(s), " +
            std::to_string(rejected_invalid) + " invalid, " +
            std::to_string(rejected_preserved) + " preserved, " +
            std::to_string(detections.size()) + " kept");
  return detections;
}

AnonymizationResult VeilAnonymizer::Anonymize(const std::string& text) {
  AnonymizationResult result;
  stats_ = DetectionStats();

  result.detections = Detect(text);

  // Placeholders are assigned from the end of the text backwards
  for (auto it = result.detections.rbegin(); it != result.detections.rend(); ++it) {
    it->placeholder = registry_.GetOrCreate(it->value, it->Prefix());
    stats_.AddDetection(it->pattern_type);
  }

  std::string output;
  output.reserve(text.size());
  size_t cursor = 0;
  for (const auto& det : result.detections) {
    output.append(text, cursor, det.start - cursor);
    output.append(*det.placeholder);
    cursor = det.end;
  }
  output.append(text, cursor, std::string::npos);

  result.anonymized_text = std::move(output);
  result.mappings = registry_.mappings();
  result.stats = stats_;

  LOG_DEBUG("Anonymizer", "Anonymized: " + stats_.ToString());
  return result;
}

PreviewResult VeilAnonymizer::Preview(const std::string& text) {
  PreviewResult result;
  result.detections = Detect(text);
  for (const auto& det : result.detections) {
    result.stats.AddDetection(det.pattern_type);
  }
  return result;
}

std::string VeilAnonymizer::Deanonymize(const std::string& text) const {
  return registry_.Deanonymize(text);
}

void VeilAnonymizer::Reset() {
  registry_.Clear();
  stats_ = DetectionStats();
}

void VeilAnonymizer::SetPatternEnabled(PatternType type, bool enabled) {
  enabled_patterns_[type] = enabled;
}

bool VeilAnonymizer::IsPatternEnabled(PatternType type) const {
  auto it = enabled_patterns_.find(type);
  return it == enabled_patterns_.end() || it->second;
}

void VeilAnonymizer::EnableOnly(const std::vector<PatternType>& types) {
  for (auto& entry : enabled_patterns_) {
    entry.second = false;
  }
  for (PatternType type : types) {
    enabled_patterns_[type] = true;
  }
}

void VeilAnonymizer::AddCustomPattern(const std::string& regex, const std::string& prefix) {
  custom_patterns_.push_back({regex, prefix});
  engine_.InvalidateCustomCache();
}

void VeilAnonymizer::ClearCustomPatterns() {
  custom_patterns_.clear();
  engine_.InvalidateCustomCache();
}

void VeilAnonymizer::AddPreserveValue(const std::string& value) {
  preserve_list_.push_back(value);
}

void VeilAnonymizer::ClearPreserveList() {
  preserve_list_.clear();
}

bool VeilAnonymizer::LoadPreset(const VeilPresets::PresetSource& source, const std::string& id) {
  auto preset = source.Find(ToLower(id));
  if (!preset) {
    LOG_WARN("Anonymizer", "Unknown preset: " + id);
    return false;
  }

  ApplyPreset(*preset);
  LOG_INFO("Anonymizer", "Loaded preset '" + preset->id + "'");
  return true;
}

void VeilAnonymizer::ApplyPreset(const VeilPresets::Preset& preset) {
  for (auto& entry : enabled_patterns_) {
    entry.second = false;
  }

  for (const auto& id : preset.patterns) {
    auto type = ParsePatternType(ToLower(id));
    if (!type) {
      LOG_DEBUG("Anonymizer", "Preset " + preset.id + " names unknown type " + id);
      continue;
    }
    enabled_patterns_[*type] = true;
  }

  preserve_list_ = preset.preserve;
  custom_patterns_ = preset.custom_patterns;
  engine_.InvalidateCustomCache();
}

void VeilAnonymizer::AddEnhancer(std::unique_ptr<VeilEnhancers::Enhancer> enhancer) {
  if (!enhancer) {
    return;
  }
  LOG_INFO("Anonymizer", "Enhancer attached: " + enhancer->Name());
  enhancers_.push_back(std::move(enhancer));
}

VeilEnhancers::Enhancer* VeilAnonymizer::FindEnhancer(const std::string& name) const {
  for (const auto& enhancer : enhancers_) {
    if (enhancer->Name() == name) {
      return enhancer.get();
    }
  }
  return nullptr;
}

std::vector<VeilEnhancers::EnhancerStatus> VeilAnonymizer::GetEnhancerStatus() const {
  std::vector<VeilEnhancers::EnhancerStatus> statuses;
  for (const auto& enhancer : enhancers_) {
    statuses.push_back(enhancer->Status());
  }
  return statuses;
}

SessionState VeilAnonymizer::ExportSessionState() const {
  SessionState state;
  state.mappings = registry_.mappings();
  state.reverse_mappings = registry_.reverse_mappings();
  state.counters = registry_.counters();
  state.enabled_patterns = enabled_patterns_;
  state.custom_patterns = custom_patterns_;
  state.preserve_list = preserve_list_;
  for (const auto& enhancer : enhancers_) {
    state.enhancers[enhancer->Name()] = enhancer->config();
  }
  return state;
}

ImportStatus VeilAnonymizer::ImportSessionState(const SessionState& state) {
  json tables = {
    {"mappings", state.mappings},
    {"reverse_mappings", state.reverse_mappings},
    {"counters", state.counters}
  };
  ImportStatus status = registry_.FromJSON(tables);
  if (status != ImportStatus::OK) {
    LOG_ERROR("Anonymizer", std::string("Session mappings rejected: ") +
              ImportStatusToString(status));
    return status;
  }

  for (PatternType type : AllPatternTypes()) {
    auto it = state.enabled_patterns.find(type);
    enabled_patterns_[type] = it == state.enabled_patterns.end() || it->second;
  }
  custom_patterns_ = state.custom_patterns;
  preserve_list_ = state.preserve_list;
  engine_.InvalidateCustomCache();

  for (const auto& [name, config] : state.enhancers) {
    if (VeilEnhancers::Enhancer* existing = FindEnhancer(name)) {
      existing->set_config(config);
      continue;
    }
    AddEnhancer(VeilEnhancers::CreateEnhancer(name, config));
  }

  stats_ = DetectionStats();
  LOG_INFO("Anonymizer", "Session imported: " + std::to_string(registry_.Size()) + " mapping(s)");
  return ImportStatus::OK;
}

ImportStatus VeilAnonymizer::ImportSessionState(const std::string& json_text) {
  SessionState state;
  ImportStatus status = SessionState::Parse(json_text, &state);
  if (status != ImportStatus::OK) {
    LOG_WARN("Anonymizer", std::string("Session import failed: ") + ImportStatusToString(status));
    return status;
  }
  return ImportSessionState(state);
}

std::string VeilAnonymizer::ExportMappings(MappingFormat format) const {
  if (format == MappingFormat::JSON) {
    return registry_.ToJSON().dump(2);
  }
  return registry_.ExportText();
}

ImportStatus VeilAnonymizer::ImportMappings(const std::string& json_text) {
  json data;
  try {
    data = json::parse(json_text);
  } catch (const json::parse_error& e) {
    LOG_WARN("Anonymizer", std::string("Mapping import failed: ") + e.what());
    return ImportStatus::PARSE_ERROR;
  }

  ImportStatus status = registry_.FromJSON(data);
  if (status != ImportStatus::OK) {
    LOG_WARN("Anonymizer", std::string("Mapping import failed: ") + ImportStatusToString(status));
  }
  return status;
}

std::vector<std::pair<std::string, std::string>> VeilAnonymizer::MappingTable() const {
  return registry_.MappingTable();
}

AnonymizationResult AnonymizeText(const std::string& text, const AnonymizeOptions& options) {
  VeilAnonymizer anonymizer;

  bool preset_applied = false;
  if (options.preset) {
    VeilPresets::BuiltinPresetSource builtins;
    preset_applied = anonymizer.LoadPreset(builtins, *options.preset);
  }

  if (!preset_applied && options.enabled_patterns) {
    std::vector<PatternType> types;
    for (const auto& id : *options.enabled_patterns) {
      if (auto type = ParsePatternType(ToLower(id))) {
        types.push_back(*type);
      }
    }
    anonymizer.EnableOnly(types);
  }

  for (const auto& pattern : options.custom_patterns) {
    anonymizer.AddCustomPattern(pattern.regex, pattern.prefix);
  }
  for (const auto& value : options.preserve_values) {
    anonymizer.AddPreserveValue(value);
  }

  return anonymizer.Anonymize(text);
}

}  // namespace VeilCore
