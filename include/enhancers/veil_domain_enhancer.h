#ifndef VEIL_DOMAIN_ENHANCER_H_
#define VEIL_DOMAIN_ENHANCER_H_

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <re2/re2.h>

#include "veil_enhancer.h"

namespace VeilEnhancers {

/**
 * Split of a domain name against the public suffix table
 */
struct DomainParts {
  std::string subdomain;  // "api.eu" in api.eu.example.co.uk
  std::string domain;     // "example"
  std::string suffix;     // "co.uk"
  bool is_valid = false;  // domain and suffix both present

  std::string Fqdn() const;
};

/**
 * DomainEnhancer - finds domain names whose suffix is a known public suffix
 *
 * The catalog's hostname pattern only knows a fixed list of top-level
 * labels. This enhancer matches any dotted name and keeps it when the
 * longest matching suffix from a compiled-in public suffix table (ccTLD
 * second levels such as co.uk and com.au, and private suffixes such as
 * github.io included) leaves a registrable label in front of it.
 *
 * Labels reported: FQDN when a subdomain is present, DOMAIN otherwise.
 */
class DomainEnhancer : public Enhancer {
 public:
  explicit DomainEnhancer(const EnhancerConfig& config = EnhancerConfig());

  std::string Name() const override { return "domain"; }
  bool IsAvailable() const override { return true; }
  std::vector<EnhancerResult> Detect(const std::string& text) override;

  DomainParts Extract(const std::string& candidate);
  bool IsValidDomain(const std::string& candidate);

  size_t CacheSize() const { return cache_.size(); }

 protected:
  bool DoInitialize() override;

 private:
  double CalculateConfidence(const DomainParts& parts) const;

  std::shared_ptr<const re2::RE2> candidate_pattern_;
  std::unordered_map<std::string, DomainParts> cache_;
};

}  // namespace VeilEnhancers

#endif  // VEIL_DOMAIN_ENHANCER_H_
