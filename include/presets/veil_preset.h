#ifndef VEIL_PRESET_H_
#define VEIL_PRESET_H_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "veil_detection.h"

namespace VeilPresets {

/**
 * A named configuration bundle: which pattern types to enable, what to
 * preserve, and which custom patterns to register.
 *
 * |patterns| holds type ids as written by the preset author; ids the
 * engine does not know are ignored when the preset is applied.
 */
struct Preset {
  std::string id;
  std::string name;
  std::string description;
  std::vector<std::string> patterns;
  std::vector<std::string> preserve;
  std::vector<VeilCore::CustomPattern> custom_patterns;

  /**
   * Build from {"id", "name", "description", "patterns", "preserve",
   * "custom_patterns": [{"regex", "prefix"}]}. "id" falls back to
   * |fallback_id|; "preserve" and "custom_patterns" are optional, custom
   * entries missing a regex or a prefix are skipped.
   */
  static std::optional<Preset> FromJSON(const nlohmann::json& data,
                                        const std::string& fallback_id = "");

  nlohmann::json ToJSON() const;
};

/**
 * PresetSource - where presets come from
 *
 * The anonymizer only asks a source for a preset by id; storage and
 * lookup belong to the source.
 */
class PresetSource {
 public:
  virtual ~PresetSource() = default;

  virtual std::optional<Preset> Find(const std::string& id) const = 0;
  virtual std::vector<std::string> List() const = 0;
};

/**
 * The presets shipped with veil: default, ansible, apache, kubernetes,
 * aws, database, security, minimal.
 */
class BuiltinPresetSource : public PresetSource {
 public:
  BuiltinPresetSource();

  std::optional<Preset> Find(const std::string& id) const override;
  std::vector<std::string> List() const override;

 private:
  std::map<std::string, Preset> presets_;
};

/**
 * Looks up presets in |primary| first, then in |fallback|
 */
class LayeredPresetSource : public PresetSource {
 public:
  LayeredPresetSource(std::shared_ptr<const PresetSource> primary,
                      std::shared_ptr<const PresetSource> fallback);

  std::optional<Preset> Find(const std::string& id) const override;
  std::vector<std::string> List() const override;

 private:
  std::shared_ptr<const PresetSource> primary_;
  std::shared_ptr<const PresetSource> fallback_;
};

}  // namespace VeilPresets

#endif  // VEIL_PRESET_H_
