#include "veil_domain_enhancer.h"
#include "veil_pattern_catalog.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_set>

namespace VeilEnhancers {

namespace {

const size_t kMaxCacheEntries = 10000;

// Subset of the public suffix list: generic and country TLDs, common
// second-level registries and hosting providers' private suffixes.
const std::unordered_set<std::string>& PublicSuffixes() {
  static const std::unordered_set<std::string> suffixes = {
    // generic
    "com", "org", "net", "edu", "gov", "mil", "int", "info", "biz", "name",
    "pro", "aero", "coop", "museum", "travel", "jobs", "mobi", "asia", "tel",
    "post", "arpa", "xyz", "online", "site", "tech", "app", "dev", "cloud",
    "io", "ai", "co", "me", "tv", "cc", "ws", "shop", "store", "blog",
    // country codes
    "fr", "de", "uk", "eu", "es", "it", "nl", "be", "ch", "at", "ca", "au",
    "nz", "jp", "cn", "kr", "br", "ru", "in", "mx", "za", "se", "no", "dk",
    "fi", "pl", "pt", "ie", "cz", "gr", "hu", "ro", "tr", "il", "ar", "cl",
    "us", "sg", "hk", "tw", "lu", "li", "is", "ee", "lv", "lt", "sk", "si",
    // second-level registries
    "co.uk", "org.uk", "ac.uk", "gov.uk", "me.uk", "ltd.uk", "plc.uk",
    "com.au", "net.au", "org.au", "edu.au", "gov.au",
    "co.nz", "org.nz", "net.nz",
    "co.jp", "ne.jp", "or.jp", "ac.jp",
    "com.br", "net.br", "org.br",
    "com.cn", "net.cn", "org.cn",
    "com.fr", "asso.fr", "gouv.fr",
    "co.za", "org.za",
    "com.mx", "com.ar", "com.tr", "com.sg", "com.hk", "com.tw",
    "co.in", "net.in", "org.in",
    "co.kr", "or.kr",
    "co.il", "org.il",
    // private suffixes
    "github.io", "gitlab.io", "herokuapp.com", "azurewebsites.net",
    "cloudfront.net", "appspot.com", "blogspot.com", "netlify.app",
    "vercel.app", "pages.dev", "workers.dev", "s3.amazonaws.com",
  };
  return suffixes;
}

std::string ToLower(const std::string& s) {
  std::string lower = s;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

std::vector<std::string> SplitLabels(const std::string& name) {
  std::vector<std::string> labels;
  size_t begin = 0;
  while (begin <= name.size()) {
    size_t dot = name.find('.', begin);
    if (dot == std::string::npos) {
      labels.push_back(name.substr(begin));
      break;
    }
    labels.push_back(name.substr(begin, dot - begin));
    begin = dot + 1;
  }
  return labels;
}

std::string JoinLabels(const std::vector<std::string>& labels, size_t from, size_t to) {
  std::string joined;
  for (size_t i = from; i < to; i++) {
    if (!joined.empty()) joined += '.';
    joined += labels[i];
  }
  return joined;
}

}  // namespace

std::string DomainParts::Fqdn() const {
  if (!is_valid) {
    return "";
  }
  std::string fqdn = subdomain.empty() ? domain : subdomain + "." + domain;
  return fqdn + "." + suffix;
}

DomainEnhancer::DomainEnhancer(const EnhancerConfig& config) : Enhancer(config) {}

bool DomainEnhancer::DoInitialize() {
  std::string error;
  candidate_pattern_ = VeilCore::CompilePattern(
      R"re(\b(?:[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?\.)+[a-zA-Z]{2,}\b)re", &error);
  if (!candidate_pattern_) {
    LOG_ERROR("DomainEnhancer", "Candidate pattern failed to compile: " + error);
    return false;
  }
  return true;
}

DomainParts DomainEnhancer::Extract(const std::string& candidate) {
  auto cached = cache_.find(candidate);
  if (cached != cache_.end()) {
    return cached->second;
  }

  DomainParts parts;
  std::vector<std::string> labels = SplitLabels(ToLower(candidate));
  const auto& suffixes = PublicSuffixes();

  // Longest suffix wins; a name that is itself a suffix has no domain
  for (size_t i = 0; i < labels.size(); i++) {
    std::string suffix = JoinLabels(labels, i, labels.size());
    if (!suffixes.count(suffix)) {
      continue;
    }
    if (i > 0 && !labels[i - 1].empty()) {
      parts.suffix = suffix;
      parts.domain = labels[i - 1];
      parts.subdomain = JoinLabels(labels, 0, i - 1);
      parts.is_valid = true;
    }
    break;
  }

  if (cache_.size() >= kMaxCacheEntries) {
    cache_.clear();
  }
  cache_[candidate] = parts;
  return parts;
}

bool DomainEnhancer::IsValidDomain(const std::string& candidate) {
  if (!Initialize()) {
    return false;
  }
  return Extract(candidate).is_valid;
}

double DomainEnhancer::CalculateConfidence(const DomainParts& parts) const {
  static const std::set<std::string> kCommonTlds = {
    "com", "org", "net", "fr", "eu", "io", "co", "uk", "de"
  };

  double confidence = 0.5;

  if (!parts.domain.empty() && !parts.suffix.empty()) {
    confidence += 0.3;
  }
  if (!parts.subdomain.empty()) {
    confidence += 0.1;
  }

  std::string last_label = parts.suffix.substr(parts.suffix.rfind('.') + 1);
  if (kCommonTlds.count(last_label)) {
    confidence += 0.1;
  }

  // Very short registrable labels are often abbreviations, not hosts
  if (parts.domain.size() < 3) {
    confidence -= 0.2;
  }

  return std::min(std::max(confidence, 0.0), 1.0);
}

std::vector<EnhancerResult> DomainEnhancer::Detect(const std::string& text) {
  std::vector<EnhancerResult> results;
  if (!Initialize()) {
    return results;
  }

  const re2::StringPiece input(text);
  re2::StringPiece match;
  size_t pos = 0;
  while (pos < text.size() &&
         candidate_pattern_->Match(input, pos, text.size(), re2::RE2::UNANCHORED, &match, 1)) {
    size_t start = static_cast<size_t>(match.data() - text.data());
    pos = start + std::max<size_t>(match.size(), 1);

    std::string candidate(match.data(), match.size());
    DomainParts parts = Extract(candidate);
    if (!parts.is_valid) {
      continue;
    }

    EnhancerResult result;
    result.value = candidate;
    result.entity_label = parts.subdomain.empty() ? "DOMAIN" : "FQDN";
    result.start = start;
    result.end = start + candidate.size();
    result.confidence = CalculateConfidence(parts);
    result.source = Name();
    results.push_back(std::move(result));
  }

  return results;
}

}  // namespace VeilEnhancers
