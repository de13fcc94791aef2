#ifndef VEIL_CONFIG_H_
#define VEIL_CONFIG_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "logger.h"
#include "veil_detection.h"

namespace VeilConfig {

// Default configuration values
constexpr int64_t kDefaultMaxInputBytes = 50 * 1024 * 1024;  // 50MB
constexpr const char* kDefaultPreset = "default";

enum class OutputFormat {
  TEXT,
  JSON,
  HTML
};

const char* OutputFormatToString(OutputFormat format);
std::optional<OutputFormat> ParseOutputFormat(const std::string& value);

/**
 * Settings of the veil command line tool.
 *
 * Priority order: CLI args > Environment variables > Config file > Defaults
 */
struct ToolConfig {
  VeilLogger::Level log_level = VeilLogger::Level::INFO;
  std::string log_file;                              // empty: stderr only
  std::string session_file;                          // empty: no persistence
  std::string preset;                                // empty: all types enabled
  std::string preset_dir;                            // extra *.json presets
  std::vector<std::string> enhancers;                // enhancer names to attach
  std::vector<std::string> preserve;                 // values never anonymized
  std::vector<VeilCore::CustomPattern> custom_patterns;
  std::vector<std::string> enabled_patterns;         // empty: leave as is
  OutputFormat output_format = OutputFormat::TEXT;
  int64_t max_input_bytes = kDefaultMaxInputBytes;
};

void LoadDefaults(ToolConfig* config);

/**
 * Load settings from a JSON file on top of |config|. Keys that are absent
 * keep their current value.
 *
 *   {
 *     "log_level": "info",
 *     "log_file": "/var/log/veil.log",
 *     "session_file": "incident-42.json",
 *     "preset": "kubernetes",
 *     "preset_dir": "/etc/veil/presets",
 *     "enhancers": ["domain"],
 *     "preserve": ["localhost"],
 *     "custom_patterns": [{"regex": "TICKET-[0-9]+", "prefix": "TICKET"}],
 *     "enabled_patterns": ["ipv4", "email"],
 *     "output_format": "text",
 *     "max_input_bytes": 52428800
 *   }
 *
 * @return false if the file cannot be read or a value has the wrong type;
 *         |config| may then be partially updated
 */
bool LoadConfigFile(const std::string& path, ToolConfig* config);

/**
 * Load settings from environment variables on top of |config|.
 *
 * Environment variables:
 *   VEIL_LOG_LEVEL - debug, info, warn or error (default: info)
 *   VEIL_LOG_FILE - Append log lines to this file
 *   VEIL_SESSION_FILE - Session state file loaded before and saved after a run
 *   VEIL_PRESET - Preset id applied before anonymizing
 *   VEIL_PRESET_DIR - Directory of additional *.json presets
 *   VEIL_MAX_INPUT_BYTES - Refuse larger inputs (default: 50MB)
 *
 * Malformed values are logged and ignored.
 */
void LoadConfigFromEnv(ToolConfig* config);

/**
 * Validate configuration.
 * Returns false and fills |error| when a setting cannot work.
 */
bool ValidateConfig(const ToolConfig& config, std::string* error);

// Print configuration (for --verbose)
void PrintConfig(const ToolConfig& config);

}  // namespace VeilConfig

#endif  // VEIL_CONFIG_H_
