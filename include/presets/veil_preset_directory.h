#ifndef VEIL_PRESET_DIRECTORY_H_
#define VEIL_PRESET_DIRECTORY_H_

#include <map>
#include <string>
#include <vector>

#include "veil_preset.h"

namespace VeilPresets {

/**
 * PresetDirectory - presets stored as *.json files in one directory
 *
 * Files are read once by Load(). The preset id is the file's "id" field,
 * or the file name without extension. Unreadable or malformed files are
 * logged and skipped.
 */
class PresetDirectory : public PresetSource {
 public:
  explicit PresetDirectory(const std::string& directory);

  // Returns the number of presets loaded
  size_t Load();

  // Writes <directory>/<id>.json. Requires id, name, description and patterns.
  bool Save(const Preset& preset);

  std::optional<Preset> Find(const std::string& id) const override;
  std::vector<std::string> List() const override;

 private:
  std::string directory_;
  std::map<std::string, Preset> presets_;
};

}  // namespace VeilPresets

#endif  // VEIL_PRESET_DIRECTORY_H_
