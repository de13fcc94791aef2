#ifndef VEIL_PATTERN_TYPE_H_
#define VEIL_PATTERN_TYPE_H_

#include <optional>
#include <string>
#include <vector>

namespace VeilCore {

/**
 * Categories of sensitive data the engine knows how to detect.
 *
 * Every category has a fixed lowercase id (used in session state and
 * presets), a placeholder prefix and a highlight color. CUSTOM is the
 * category of user-registered patterns and of unknown enhancer labels.
 */
enum class PatternType {
  IPV4,
  IPV6,
  EMAIL,
  HOSTNAME,
  URL,
  PATH_WINDOWS,
  PATH_UNIX,
  UUID,
  MAC_ADDRESS,
  PHONE,
  API_KEY,
  JWT,
  CREDIT_CARD,
  DATE,
  USERNAME,
  SERVER_NAME,
  IBAN,
  SSN,
  PRIVATE_KEY,
  CONNECTION_STRING,
  CUSTOM
};

// Lowercase identifier, e.g. "ipv4", "mac", "connection_string"
const char* PatternTypeToId(PatternType type);

// Placeholder prefix, e.g. "IP", "HOST", "VAL"
const char* PatternTypePrefix(PatternType type);

// Upper-case display name, e.g. "MAC_ADDRESS"
const char* PatternTypeName(PatternType type);

// CSS color used by the highlighter
const char* PatternTypeColor(PatternType type);

// Only the exact lowercase ids are accepted
std::optional<PatternType> ParsePatternType(const std::string& id);

// All categories in declaration order
const std::vector<PatternType>& AllPatternTypes();

}  // namespace VeilCore

#endif  // VEIL_PATTERN_TYPE_H_
