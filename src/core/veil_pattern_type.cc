#include "veil_pattern_type.h"

namespace VeilCore {

namespace {

struct PatternTypeInfo {
  PatternType type;
  const char* id;
  const char* prefix;
  const char* name;
  const char* color;
};

// Indexed by the enum value; keep in declaration order
const PatternTypeInfo kPatternTypeTable[] = {
  {PatternType::IPV4,              "ipv4",              "IP",      "IPV4",              "#ff6b6b"},
  {PatternType::IPV6,              "ipv6",              "IPV6",    "IPV6",              "#ff8787"},
  {PatternType::EMAIL,             "email",             "EMAIL",   "EMAIL",             "#4dabf7"},
  {PatternType::HOSTNAME,          "hostname",          "HOST",    "HOSTNAME",          "#69db7c"},
  {PatternType::URL,               "url",               "URL",     "URL",               "#38d9a9"},
  {PatternType::PATH_WINDOWS,      "path_windows",      "PATH",    "PATH_WINDOWS",      "#ffd43b"},
  {PatternType::PATH_UNIX,         "path_unix",         "PATH",    "PATH_UNIX",         "#ffe066"},
  {PatternType::UUID,              "uuid",              "UUID",    "UUID",              "#da77f2"},
  {PatternType::MAC_ADDRESS,       "mac",               "MAC",     "MAC_ADDRESS",       "#e599f7"},
  {PatternType::PHONE,             "phone",             "PHONE",   "PHONE",             "#74c0fc"},
  {PatternType::API_KEY,           "api_key",           "KEY",     "API_KEY",           "#ff922b"},
  {PatternType::JWT,               "jwt",               "TOKEN",   "JWT",               "#ffa94d"},
  {PatternType::CREDIT_CARD,       "credit_card",       "CC",      "CREDIT_CARD",       "#f06595"},
  {PatternType::DATE,              "date",              "DATE",    "DATE",              "#a9e34b"},
  {PatternType::USERNAME,          "username",          "USER",    "USERNAME",          "#63e6be"},
  {PatternType::SERVER_NAME,       "server_name",       "SERVER",  "SERVER_NAME",       "#20c997"},
  {PatternType::IBAN,              "iban",              "IBAN",    "IBAN",              "#f783ac"},
  {PatternType::SSN,               "ssn",               "SSN",     "SSN",               "#ff8787"},
  {PatternType::PRIVATE_KEY,       "private_key",       "PRIVKEY", "PRIVATE_KEY",       "#e64980"},
  {PatternType::CONNECTION_STRING, "connection_string", "CONNSTR", "CONNECTION_STRING", "#fd7e14"},
  {PatternType::CUSTOM,            "custom",            "VAL",     "CUSTOM",            "#868e96"},
};

const PatternTypeInfo& Info(PatternType type) {
  return kPatternTypeTable[static_cast<int>(type)];
}

}  // namespace

const char* PatternTypeToId(PatternType type) {
  return Info(type).id;
}

const char* PatternTypePrefix(PatternType type) {
  return Info(type).prefix;
}

const char* PatternTypeName(PatternType type) {
  return Info(type).name;
}

const char* PatternTypeColor(PatternType type) {
  return Info(type).color;
}

std::optional<PatternType> ParsePatternType(const std::string& id) {
  for (const auto& info : kPatternTypeTable) {
    if (id == info.id) {
      return info.type;
    }
  }
  return std::nullopt;
}

const std::vector<PatternType>& AllPatternTypes() {
  static const std::vector<PatternType> all = [] {
    std::vector<PatternType> types;
    for (const auto& info : kPatternTypeTable) {
      types.push_back(info.type);
    }
    return types;
  }();
  return all;
}

}  // namespace VeilCore
