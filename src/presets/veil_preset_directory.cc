#include "veil_preset_directory.h"
#include "logger.h"
#include <filesystem>
#include <fstream>

namespace VeilPresets {

namespace fs = std::filesystem;
using json = nlohmann::json;

PresetDirectory::PresetDirectory(const std::string& directory) : directory_(directory) {}

size_t PresetDirectory::Load() {
  presets_.clear();

  std::error_code ec;
  if (!fs::is_directory(directory_, ec)) {
    LOG_WARN("PresetDirectory", "Not a directory: " + directory_);
    return 0;
  }

  for (const auto& entry : fs::directory_iterator(directory_, ec)) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) || entry.path().extension() != ".json") {
      continue;
    }

    std::ifstream file(entry.path());
    if (!file.is_open()) {
      LOG_WARN("PresetDirectory", "Could not open preset " + entry.path().string());
      continue;
    }

    try {
      json data = json::parse(file);
      auto preset = Preset::FromJSON(data, entry.path().stem().string());
      if (!preset) {
        LOG_WARN("PresetDirectory", "Ignoring malformed preset " + entry.path().string());
        continue;
      }
      std::string id = preset->id;
      presets_[id] = std::move(*preset);
    } catch (const json::exception& e) {
      LOG_WARN("PresetDirectory", "Could not load preset " + entry.path().string() +
               ": " + e.what());
    }
  }

  if (ec) {
    LOG_WARN("PresetDirectory", "Error reading " + directory_ + ": " + ec.message());
  }

  LOG_DEBUG("PresetDirectory", "Loaded " + std::to_string(presets_.size()) +
            " preset(s) from " + directory_);
  return presets_.size();
}

bool PresetDirectory::Save(const Preset& preset) {
  if (preset.id.empty() || preset.name.empty() || preset.description.empty() ||
      preset.patterns.empty()) {
    LOG_WARN("PresetDirectory", "Refusing to save incomplete preset '" + preset.id + "'");
    return false;
  }

  fs::path path = fs::path(directory_) / (preset.id + ".json");
  std::ofstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("PresetDirectory", "Cannot write " + path.string());
    return false;
  }

  file << preset.ToJSON().dump(4) << "\n";
  if (!file) {
    LOG_ERROR("PresetDirectory", "Failed writing " + path.string());
    return false;
  }

  presets_[preset.id] = preset;
  return true;
}

std::optional<Preset> PresetDirectory::Find(const std::string& id) const {
  auto it = presets_.find(id);
  if (it == presets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> PresetDirectory::List() const {
  std::vector<std::string> ids;
  for (const auto& entry : presets_) {
    ids.push_back(entry.first);
  }
  return ids;
}

}  // namespace VeilPresets
