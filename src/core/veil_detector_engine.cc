#include "veil_detector_engine.h"
#include "veil_pattern_catalog.h"
#include "logger.h"
#include <algorithm>

namespace VeilCore {

size_t CollectMatches(const re2::RE2& regex,
                      const std::string& text,
                      PatternType type,
                      const std::optional<std::string>& custom_prefix,
                      std::vector<Detection>* out) {
  const re2::StringPiece input(text);
  const int groups = regex.NumberOfCapturingGroups() + 1;
  std::vector<re2::StringPiece> match(groups);
  size_t found = 0;
  size_t pos = 0;

  while (pos <= text.size() &&
         regex.Match(input, pos, text.size(), re2::RE2::UNANCHORED, match.data(), groups)) {
    size_t match_start = static_cast<size_t>(match[0].data() - text.data());

    int group = 0;
    for (int i = 1; i < groups; i++) {
      if (!match[i].empty()) {
        group = i;
        break;
      }
    }

    if (match[group].empty()) {
      pos = match_start + std::max<size_t>(match[0].size(), 1);
      continue;
    }

    Detection det;
    det.start = static_cast<size_t>(match[group].data() - text.data());
    det.end = det.start + match[group].size();
    det.value = text.substr(det.start, det.end - det.start);
    det.pattern_type = type;
    det.custom_prefix = custom_prefix;
    pos = det.end;
    out->push_back(std::move(det));
    found++;
  }

  return found;
}

void DetectorEngine::InvalidateCustomCache() {
  compiled_custom_.clear();
  custom_cache_valid_ = false;
}

size_t DetectorEngine::CompiledCustomCount() const {
  size_t count = 0;
  for (const auto& custom : compiled_custom_) {
    if (custom.regex) count++;
  }
  return count;
}

void DetectorEngine::EnsureCustomCompiled(const std::vector<CustomPattern>& custom_patterns) {
  // A list that no longer matches the cache counts as a mutation too
  if (custom_cache_valid_ && compiled_custom_.size() == custom_patterns.size()) {
    bool same = true;
    for (size_t i = 0; i < custom_patterns.size(); i++) {
      if (!(compiled_custom_[i].pattern == custom_patterns[i])) {
        same = false;
        break;
      }
    }
    if (same) {
      return;
    }
  }

  compiled_custom_.clear();
  for (const auto& pattern : custom_patterns) {
    CompiledCustom compiled;
    compiled.pattern = pattern;

    std::string error;
    compiled.regex = CompilePattern(pattern.regex, &error);
    if (!compiled.regex) {
      LOG_WARN("DetectorEngine", "Skipping custom pattern '" + pattern.regex +
               "' (" + pattern.prefix + "): " + error);
    }
    compiled_custom_.push_back(std::move(compiled));
  }
  custom_cache_valid_ = true;
}

std::vector<Detection> DetectorEngine::Run(const std::string& text,
                                           const std::map<PatternType, bool>& enabled,
                                           const std::vector<CustomPattern>& custom_patterns,
                                           const std::vector<Detection>& enhancer_detections) {
  std::vector<Detection> candidates = enhancer_detections;

  for (const auto& pattern : PatternCatalog::Instance().Patterns()) {
    auto flag = enabled.find(pattern.type);
    if (flag != enabled.end() && !flag->second) {
      continue;
    }
    if (!pattern.regex) {
      continue;
    }
    CollectMatches(*pattern.regex, text, pattern.type, std::nullopt, &candidates);
  }

  EnsureCustomCompiled(custom_patterns);
  for (const auto& custom : compiled_custom_) {
    if (!custom.regex) {
      continue;
    }
    CollectMatches(*custom.regex, text, PatternType::CUSTOM, custom.pattern.prefix, &candidates);
  }

  LOG_DEBUG("DetectorEngine", "Collected " + std::to_string(candidates.size()) +
            " candidate(s) from " + std::to_string(text.size()) + " bytes");
  return candidates;
}

}  // namespace VeilCore
