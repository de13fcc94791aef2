#include "veil_pattern_catalog.h"
#include "logger.h"
#include <memory>

namespace VeilCore {

namespace {

struct CatalogEntry {
  PatternType type;
  const char* regex;
};

// Order is priority. Specific formats that other patterns would swallow
// (keys, tokens, connection strings, URLs) come first.
const CatalogEntry kCatalog[] = {
  // PEM private key blocks
  {PatternType::PRIVATE_KEY,
   R"re(-----BEGIN (?:RSA |EC |DSA |OPENSSH |PGP |ENCRYPTED )?PRIVATE KEY-----[\s\S]*?-----END (?:RSA |EC |DSA |OPENSSH |PGP |ENCRYPTED )?PRIVATE KEY-----)re"},

  {PatternType::JWT,
   R"re(\beyJ[A-Za-z0-9_-]{10,}\.eyJ[A-Za-z0-9_-]{10,}\.[A-Za-z0-9_-]{10,}\b)re"},

  // ADO.NET / JDBC style strings carrying a password
  {PatternType::CONNECTION_STRING,
   R"re((?:Server|Data Source|Host|jdbc:[a-z]+:)=[^;\s]+(?:;[^;\s]+)*(?:;(?:Password|Pwd|PWD)=[^;\s]+))re"},

  // URLs before hostnames so the host part is not matched alone
  {PatternType::URL,
   R"re(https?://[^\s<>"'{}|\\^`\[\]]+(?:\?[^\s<>"'{}|\\^`\[\]]*)?)re"},

  {PatternType::EMAIL,
   R"re(\b[A-Za-z0-9](?:[A-Za-z0-9._%+-]{0,62}[A-Za-z0-9])?@(?:[A-Za-z0-9](?:[A-Za-z0-9-]{0,61}[A-Za-z0-9])?\.)+[A-Za-z]{2,63}\b)re"},

  {PatternType::UUID,
   R"re(\b[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[1-5][0-9a-fA-F]{3}-[89abAB][0-9a-fA-F]{3}-[0-9a-fA-F]{12}\b)re"},

  // Dotted quad with optional CIDR suffix
  {PatternType::IPV4,
   R"re(\b(?:(?:25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9]?[0-9])\.){3}(?:25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9]?[0-9])(?:/[0-9]{1,2})?\b)re"},

  // Full and compressed forms, optional prefix length
  {PatternType::IPV6,
   R"re((?:)re"
   R"re((?:[0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4}|)re"
   R"re((?:[0-9a-fA-F]{1,4}:){6}:[0-9a-fA-F]{1,4}|)re"
   R"re((?:[0-9a-fA-F]{1,4}:){5}(?::[0-9a-fA-F]{1,4}){1,2}|)re"
   R"re((?:[0-9a-fA-F]{1,4}:){4}(?::[0-9a-fA-F]{1,4}){1,3}|)re"
   R"re((?:[0-9a-fA-F]{1,4}:){3}(?::[0-9a-fA-F]{1,4}){1,4}|)re"
   R"re((?:[0-9a-fA-F]{1,4}:){2}(?::[0-9a-fA-F]{1,4}){1,5}|)re"
   R"re((?:[0-9a-fA-F]{1,4}:){1}(?::[0-9a-fA-F]{1,4}){1,6}|)re"
   R"re(::(?:[0-9a-fA-F]{1,4}:){0,5}[0-9a-fA-F]{1,4}|)re"
   R"re((?:[0-9a-fA-F]{1,4}:){1,7}:|)re"
   R"re(::)re"
   R"re()(?:/[0-9]{1,3})?)re"},

  // Hostnames ending in a known public or infrastructure suffix
  {PatternType::HOSTNAME,
   R"re(\b(?:[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?\.)+)re"
   R"re((?:com|org|net|edu|gov|mil|int|io|fr|de|uk|eu|es|it|nl|be|ch|at|ca|au|nz|jp|cn|kr|br|ru|in|mx|za|)re"
   R"re(local|internal|corp|lan|intra|cloud|app|dev|test|staging|prod|localhost|example|invalid|onion|i2p|)re"
   R"re(bit|eth|crypto|web3|xyz|online|site|tech|info|biz|co|me|tv|cc|ws|mobi|name|pro|aero|coop|museum|)re"
   R"re(travel|jobs|asia|tel|post|arpa|amazonaws|azure|gcp|cloudflare|digitalocean|heroku|vercel|netlify)\b)re"},

  {PatternType::MAC_ADDRESS,
   R"re(\b(?:[0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2}\b|\b[0-9A-Fa-f]{4}\.[0-9A-Fa-f]{4}\.[0-9A-Fa-f]{4}\b)re"},

  // International, French national, and North American layouts
  {PatternType::PHONE,
   R"re((?:)re"
   R"re((?:\+|00)[1-9][0-9]{0,3}[\s.-]?[0-9]{1,2}(?:[\s.-]?[0-9]{2}){4}|)re"
   R"re(\b0[1-9](?:[\s.-]?[0-9]{2}){4}\b|)re"
   R"re(\([0-9]{3}\)[\s.-]?[0-9]{3}[\s.-]?[0-9]{4}|)re"
   R"re(\b[0-9]{3}[\s.-][0-9]{3}[\s.-][0-9]{4}\b|)re"
   R"re((?:\+|00)[1-9][0-9]{0,2}[\s.-]?\(?[0-9]{2,4}\)?(?:[\s.-]?[0-9]{2,4}){2,4})re"
   R"re())re"},

  // key=value secrets (the value is captured) and vendor token formats
  {PatternType::API_KEY,
   R"re((?:)re"
   R"re((?:api[_-]?key|apikey|api_secret|secret[_-]?key|auth[_-]?token|access[_-]?token|password|passwd|pwd|credentials?|private[_-]?key)[=:\s]+["']?([A-Za-z0-9_.=+/-]{16,})["']?|)re"
   R"re(\b(?:sk|pk|rk|ak)[-_](?:[a-zA-Z]+-)?[a-zA-Z0-9]{16,}\b|)re"
   R"re(\b(?:ghp|gho|ghu|ghs|ghr)_[A-Za-z0-9]{36,}\b|)re"
   R"re(\bxox[baprs]-[A-Za-z0-9-]{10,}\b|)re"
   R"re(\bAIza[A-Za-z0-9_-]{35}\b)re"
   R"re())re"},

  {PatternType::PATH_WINDOWS,
   R"re([A-Za-z]:\\(?:[^\\/:*?"<>|\r\n\s]+\\)*[^\\/:*?"<>|\r\n\s]+)re"},

  // The leading guard stands in for "not preceded by an alphanumeric";
  // the path itself is the capture group.
  {PatternType::PATH_UNIX,
   R"re((?:^|[^A-Za-z0-9])(/(?:home|var|etc|usr|opt|tmp|root|mnt|srv|data|app|apps?)/[a-zA-Z0-9._/-]+))re"},

  // Visa, MasterCard, Amex, Discover with optional separators
  {PatternType::CREDIT_CARD,
   R"re(\b(?:4[0-9]{3}[\s-]?[0-9]{4}[\s-]?[0-9]{4}[\s-]?[0-9]{4}|5[1-5][0-9]{2}[\s-]?[0-9]{4}[\s-]?[0-9]{4}[\s-]?[0-9]{4}|3[47][0-9]{2}[\s-]?[0-9]{6}[\s-]?[0-9]{5}|6(?:011|5[0-9]{2})[\s-]?[0-9]{4}[\s-]?[0-9]{4}[\s-]?[0-9]{4})\b)re"},

  {PatternType::DATE,
   R"re(\b(?:0?[1-9]|[12][0-9]|3[01])[/-](?:0?[1-9]|1[012])[/-](?:19|20)?\d{2}\b|\b(?:19|20)\d{2}[/-](?:0?[1-9]|1[012])[/-](?:0?[1-9]|[12][0-9]|3[01])\b)re"},

  {PatternType::IBAN,
   R"re(\b[A-Z]{2}[0-9]{2}[\s]?(?:[A-Z0-9]{4}[\s]?){2,7}[A-Z0-9]{1,4}\b)re"},

  // US SSN and French NIR
  {PatternType::SSN,
   R"re(\b(?:[0-9]{3}-[0-9]{2}-[0-9]{4}|[12][0-9]{2}(?:0[1-9]|1[0-2]|[2-9][0-9])(?:0[1-9]|[1-8][0-9]|9[0-8]|2[AB])[0-9]{3}[0-9]{3}[0-9]{2})\b)re"},

  // u=name, user=name, and name@<ipv4> as seen in ssh/ansible logs.
  // Alternatives are tried left to right. Trailing context is matched but
  // lies outside the captured name.
  {PatternType::USERNAME,
   R"re((?:)re"
   R"re((?:^|[\s|])u=([a-zA-Z][a-zA-Z0-9_-]{1,31})(?:[\s|,;]|$)|)re"
   R"re((?:user|username|usr|login)[=:\s]+["']?([a-zA-Z][a-zA-Z0-9_.-]{1,63})["']?|)re"
   R"re((?:^|[\s]|\\r\\n|\\n)([a-zA-Z][a-zA-Z0-9_-]{1,31})@(?:\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}))re"
   R"re())re"},

  // Ansible host markers and upper-case dashed machine names
  {PatternType::SERVER_NAME,
   R"re((?:)re"
   R"re((?:fatal|ok|changed|unreachable|failed|skipped|rescued|ignored):\s*\[([A-Za-z][A-Za-z0-9_-]{2,})\]|)re"
   R"re(\[([A-Z][A-Z0-9_-]*(?:-[A-Za-z0-9_]+)+)\]|)re"
   R"re((?:^|\|)\s*([A-Z][A-Z0-9]*(?:-[A-Za-z0-9_]+)+)\s*(?:[|:]|\s+ok=))re"
   R"re())re"},
};

}  // namespace

std::shared_ptr<const re2::RE2> CompilePattern(const std::string& source,
                                               std::string* error) {
  re2::RE2::Options options;
  options.set_case_sensitive(false);
  options.set_encoding(re2::RE2::Options::EncodingLatin1);
  options.set_max_mem(kPatternMaxMem);
  options.set_log_errors(false);

  auto compiled = std::make_shared<const re2::RE2>(source, options);
  if (!compiled->ok()) {
    if (error) {
      *error = compiled->error();
    }
    return nullptr;
  }
  return compiled;
}

const PatternCatalog& PatternCatalog::Instance() {
  static const PatternCatalog catalog;
  return catalog;
}

PatternCatalog::PatternCatalog() {
  for (const auto& entry : kCatalog) {
    CompiledPattern compiled;
    compiled.type = entry.type;
    compiled.source = entry.regex;

    std::string error;
    compiled.regex = CompilePattern(compiled.source, &error);
    if (!compiled.regex) {
      LOG_WARN("PatternCatalog", std::string("Failed to compile pattern ") +
               PatternTypeToId(entry.type) + ": " + error);
    }
    patterns_.push_back(std::move(compiled));
  }

  LOG_DEBUG("PatternCatalog", "Compiled " + std::to_string(CompiledCount()) + "/" +
            std::to_string(patterns_.size()) + " catalog patterns");
}

std::string PatternCatalog::SourceFor(PatternType type) const {
  for (const auto& pattern : patterns_) {
    if (pattern.type == type) {
      return pattern.source;
    }
  }
  return "";
}

size_t PatternCatalog::CompiledCount() const {
  size_t count = 0;
  for (const auto& pattern : patterns_) {
    if (pattern.regex) count++;
  }
  return count;
}

}  // namespace VeilCore
