#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logger.h"
#include "veil_anonymizer.h"
#include "veil_config.h"
#include "veil_html_highlighter.h"
#include "veil_preset.h"
#include "veil_preset_directory.h"

using json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitImportFailed = 2;

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [OPTIONS] COMMAND\n\n";
  std::cout << "Commands:\n";
  std::cout << "  anonymize             Replace sensitive values by placeholders\n";
  std::cout << "  deanonymize           Restore originals from the session's mappings\n";
  std::cout << "  preview               Show what would be anonymized\n";
  std::cout << "  export                Print the session's mapping table\n";
  std::cout << "  presets               List available presets\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  --config FILE         JSON configuration file\n";
  std::cout << "  --session FILE        Session state loaded before and saved after the run\n";
  std::cout << "  --preset ID           Apply a preset (see 'presets')\n";
  std::cout << "  --preset-dir DIR      Directory of additional *.json presets\n";
  std::cout << "  --preserve VALUE      Never anonymize values containing VALUE (repeatable)\n";
  std::cout << "  --pattern REGEX:PFX   Custom pattern with placeholder prefix PFX (repeatable)\n";
  std::cout << "  --enable ID,...       Only detect these pattern types\n";
  std::cout << "  --enhancer NAME       Attach an enhancer (repeatable; known: domain)\n";
  std::cout << "  --format FMT          Output format: text, json, html (default: text)\n";
  std::cout << "  --input FILE          Read input from FILE (default: stdin)\n";
  std::cout << "  --output FILE         Write output to FILE (default: stdout)\n";
  std::cout << "  --log-file FILE       Append log lines to FILE\n";
  std::cout << "  --verbose             Enable verbose output\n";
  std::cout << "  --help                Show this help message\n";
  std::cout << "\n";
  std::cout << "Environment:\n";
  std::cout << "  VEIL_LOG_LEVEL, VEIL_LOG_FILE, VEIL_SESSION_FILE, VEIL_PRESET,\n";
  std::cout << "  VEIL_PRESET_DIR, VEIL_MAX_INPUT_BYTES\n";
  std::cout << "\n";
  std::cout << "Priority order: command line > environment > config file > defaults\n";
}

std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> items;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

// "REGEX:PREFIX" splits on the last ':' when what follows is a valid
// prefix; otherwise the whole argument is the regex.
VeilCore::CustomPattern ParsePatternArg(const std::string& arg) {
  size_t colon = arg.rfind(':');
  if (colon != std::string::npos && colon > 0 && colon + 1 < arg.size()) {
    std::string prefix = arg.substr(colon + 1);
    bool valid = true;
    for (char c : prefix) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
        valid = false;
        break;
      }
    }
    if (valid) {
      return {arg.substr(0, colon), prefix};
    }
  }
  return {arg, "CUSTOM"};
}

bool ReadInput(const std::string& path, int64_t max_bytes, std::string* out) {
  std::string data;
  if (path.empty() || path == "-") {
    data.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
      std::cerr << "Error: cannot open input file " << path << std::endl;
      return false;
    }
    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  if (static_cast<int64_t>(data.size()) > max_bytes) {
    std::cerr << "Error: input is " << data.size() << " bytes, limit is " << max_bytes
              << " (set VEIL_MAX_INPUT_BYTES to raise it)" << std::endl;
    return false;
  }

  *out = std::move(data);
  return true;
}

bool WriteOutput(const std::string& path, const std::string& content) {
  if (path.empty() || path == "-") {
    std::cout << content;
    if (!content.empty() && content.back() != '\n') {
      std::cout << "\n";
    }
    return static_cast<bool>(std::cout.flush());
  }

  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "Error: cannot open output file " << path << std::endl;
    return false;
  }
  file << content;
  if (!file) {
    std::cerr << "Error: failed writing " << path << std::endl;
    return false;
  }
  return true;
}

// Returns kExitOk when the file is absent or imported
int LoadSession(const std::string& path, VeilCore::VeilAnonymizer* anonymizer) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_INFO("veil", "No session at " + path + ", starting a new one");
    return kExitOk;
  }

  std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  VeilCore::ImportStatus status = anonymizer->ImportSessionState(text);
  if (status != VeilCore::ImportStatus::OK) {
    std::cerr << "Error: cannot import session " << path << ": "
              << VeilCore::ImportStatusToString(status) << std::endl;
    return kExitImportFailed;
  }
  return kExitOk;
}

bool SaveSession(const std::string& path, const VeilCore::VeilAnonymizer& anonymizer) {
  std::ofstream file(path);
  if (!file.is_open()) {
    std::cerr << "Error: cannot write session " << path << std::endl;
    return false;
  }
  file << anonymizer.ExportSessionState().Serialize() << "\n";
  if (!file) {
    std::cerr << "Error: failed writing session " << path << std::endl;
    return false;
  }
  LOG_INFO("veil", "Session saved to " + path + " (" +
           std::to_string(anonymizer.registry().Size()) + " mappings)");
  return true;
}

bool ConfigureAnonymizer(const VeilConfig::ToolConfig& config,
                         const VeilPresets::PresetSource& presets,
                         VeilCore::VeilAnonymizer* anonymizer) {
  if (!config.preset.empty() && !anonymizer->LoadPreset(presets, config.preset)) {
    std::cerr << "Error: unknown preset '" << config.preset << "'" << std::endl;
    return false;
  }

  if (!config.enabled_patterns.empty()) {
    std::vector<VeilCore::PatternType> types;
    for (const auto& id : config.enabled_patterns) {
      if (auto type = VeilCore::ParsePatternType(id)) {
        types.push_back(*type);
      }
    }
    anonymizer->EnableOnly(types);
  }

  for (const auto& pattern : config.custom_patterns) {
    const auto& existing = anonymizer->custom_patterns();
    if (std::find(existing.begin(), existing.end(), pattern) == existing.end()) {
      anonymizer->AddCustomPattern(pattern.regex, pattern.prefix);
    }
  }

  for (const auto& value : config.preserve) {
    const auto& existing = anonymizer->preserve_list();
    if (std::find(existing.begin(), existing.end(), value) == existing.end()) {
      anonymizer->AddPreserveValue(value);
    }
  }

  for (const auto& name : config.enhancers) {
    if (!anonymizer->FindEnhancer(name)) {
      anonymizer->AddEnhancer(VeilEnhancers::CreateEnhancer(name));
    }
  }

  return true;
}

json DetectionsToJSON(const std::vector<VeilCore::Detection>& detections) {
  json list = json::array();
  for (const auto& det : detections) {
    json item = {
      {"value", det.value},
      {"type", VeilCore::PatternTypeToId(det.pattern_type)},
      {"start", det.start},
      {"end", det.end}
    };
    if (det.placeholder) {
      item["placeholder"] = *det.placeholder;
    }
    list.push_back(item);
  }
  return list;
}

std::string FormatPreviewText(const VeilCore::PreviewResult& preview) {
  std::ostringstream out;
  for (const auto& det : preview.detections) {
    out << det.start << "-" << det.end << "\t"
        << VeilCore::PatternTypeToId(det.pattern_type) << "\t" << det.value << "\n";
  }
  out << preview.stats.ToString() << "\n";
  return out.str();
}

std::string FormatPresets(const VeilPresets::PresetSource& presets,
                          VeilConfig::OutputFormat format) {
  if (format == VeilConfig::OutputFormat::JSON) {
    json list = json::array();
    for (const auto& id : presets.List()) {
      if (auto preset = presets.Find(id)) {
        list.push_back(preset->ToJSON());
      }
    }
    return list.dump(2);
  }

  std::ostringstream out;
  for (const auto& id : presets.List()) {
    if (auto preset = presets.Find(id)) {
      out << preset->id << "\t" << preset->name << " - " << preset->description << "\n";
    }
  }
  return out.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  VeilLogger::Logger::Init();

  VeilConfig::ToolConfig config;
  VeilConfig::LoadDefaults(&config);

  // The config file is loaded first so every other source can override it
  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      if (!VeilConfig::LoadConfigFile(argv[i + 1], &config)) {
        std::cerr << "Error: invalid config file " << argv[i + 1] << std::endl;
        return kExitError;
      }
    }
  }
  VeilConfig::LoadConfigFromEnv(&config);

  std::string command;
  std::string input_path;
  std::string output_path;
  bool verbose = false;

  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      return kExitOk;
    } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      ++i;  // already loaded
    } else if (strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
      config.session_file = argv[++i];
    } else if (strcmp(argv[i], "--preset") == 0 && i + 1 < argc) {
      config.preset = argv[++i];
    } else if (strcmp(argv[i], "--preset-dir") == 0 && i + 1 < argc) {
      config.preset_dir = argv[++i];
    } else if (strcmp(argv[i], "--preserve") == 0 && i + 1 < argc) {
      config.preserve.push_back(argv[++i]);
    } else if (strcmp(argv[i], "--pattern") == 0 && i + 1 < argc) {
      config.custom_patterns.push_back(ParsePatternArg(argv[++i]));
    } else if (strcmp(argv[i], "--enable") == 0 && i + 1 < argc) {
      config.enabled_patterns = SplitList(argv[++i]);
    } else if (strcmp(argv[i], "--enhancer") == 0 && i + 1 < argc) {
      config.enhancers.push_back(argv[++i]);
    } else if (strcmp(argv[i], "--format") == 0 && i + 1 < argc) {
      auto format = VeilConfig::ParseOutputFormat(argv[++i]);
      if (!format) {
        std::cerr << "Unknown format: " << argv[i] << std::endl;
        PrintUsage(argv[0]);
        return kExitError;
      }
      config.output_format = *format;
    } else if (strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
      input_path = argv[++i];
    } else if (strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
      output_path = argv[++i];
    } else if (strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
      config.log_file = argv[++i];
    } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
      verbose = true;
      config.log_level = VeilLogger::DEBUG;
    } else if (argv[i][0] != '-' && command.empty()) {
      command = argv[i];
    } else {
      std::cerr << "Unknown option: " << argv[i] << std::endl;
      PrintUsage(argv[0]);
      return kExitError;
    }
  }

  if (!config.log_file.empty()) {
    VeilLogger::Logger::Init(config.log_file);
  }
  VeilLogger::Logger::SetLevel(config.log_level);

  if (command.empty()) {
    PrintUsage(argv[0]);
    return kExitError;
  }

  std::string error;
  if (!VeilConfig::ValidateConfig(config, &error)) {
    std::cerr << "Error: " << error << std::endl;
    return kExitError;
  }

  if (verbose) {
    VeilConfig::PrintConfig(config);
  }

  std::shared_ptr<VeilPresets::PresetDirectory> preset_dir;
  if (!config.preset_dir.empty()) {
    preset_dir = std::make_shared<VeilPresets::PresetDirectory>(config.preset_dir);
    preset_dir->Load();
  }
  VeilPresets::LayeredPresetSource presets(
      preset_dir, std::make_shared<VeilPresets::BuiltinPresetSource>());

  if (command == "presets") {
    return WriteOutput(output_path, FormatPresets(presets, config.output_format))
        ? kExitOk : kExitError;
  }

  if (command != "anonymize" && command != "deanonymize" && command != "preview" &&
      command != "export") {
    std::cerr << "Unknown command: " << command << std::endl;
    PrintUsage(argv[0]);
    return kExitError;
  }

  VeilCore::VeilAnonymizer anonymizer;

  if (!config.session_file.empty()) {
    int status = LoadSession(config.session_file, &anonymizer);
    if (status != kExitOk) {
      return status;
    }
  }

  if (command == "export") {
    VeilCore::MappingFormat format = config.output_format == VeilConfig::OutputFormat::JSON
        ? VeilCore::MappingFormat::JSON : VeilCore::MappingFormat::TEXT;
    return WriteOutput(output_path, anonymizer.ExportMappings(format)) ? kExitOk : kExitError;
  }

  std::string input;
  if (!ReadInput(input_path, config.max_input_bytes, &input)) {
    return kExitError;
  }

  if (command == "deanonymize") {
    return WriteOutput(output_path, anonymizer.Deanonymize(input)) ? kExitOk : kExitError;
  }

  if (!ConfigureAnonymizer(config, presets, &anonymizer)) {
    return kExitError;
  }

  if (command == "preview") {
    VeilCore::PreviewResult preview = anonymizer.Preview(input);
    std::string rendered;
    switch (config.output_format) {
      case VeilConfig::OutputFormat::HTML:
        rendered = VeilRender::HighlightHtml(input, preview.detections);
        break;
      case VeilConfig::OutputFormat::JSON:
        rendered = json({{"detections", DetectionsToJSON(preview.detections)},
                         {"stats", preview.stats.by_type}}).dump(2);
        break;
      default:
        rendered = FormatPreviewText(preview);
    }
    return WriteOutput(output_path, rendered) ? kExitOk : kExitError;
  }

  // anonymize
  VeilCore::AnonymizationResult result = anonymizer.Anonymize(input);
  std::string rendered;
  switch (config.output_format) {
    case VeilConfig::OutputFormat::HTML:
      rendered = VeilRender::HighlightHtml(input, result.detections);
      break;
    case VeilConfig::OutputFormat::JSON:
      rendered = json({{"anonymized_text", result.anonymized_text},
                       {"mappings", result.mappings},
                       {"stats", result.stats.by_type},
                       {"detections", DetectionsToJSON(result.detections)}}).dump(2);
      break;
    default:
      rendered = result.anonymized_text;
  }

  if (verbose) {
    std::cerr << result.stats.ToString() << std::endl;
  }

  if (!WriteOutput(output_path, rendered)) {
    return kExitError;
  }

  if (!config.session_file.empty() && !SaveSession(config.session_file, anonymizer)) {
    return kExitError;
  }

  return kExitOk;
}
