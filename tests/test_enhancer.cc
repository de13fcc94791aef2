#include <gtest/gtest.h>

#include <stdexcept>

#include "veil_anonymizer.h"
#include "veil_domain_enhancer.h"
#include "veil_enhancer.h"

using VeilCore::PatternType;
using VeilEnhancers::CollectDetections;
using VeilEnhancers::DomainEnhancer;
using VeilEnhancers::Enhancer;
using VeilEnhancers::EnhancerConfig;
using VeilEnhancers::EnhancerResult;
using VeilEnhancers::MapEntityLabel;

namespace {

// Reports a fixed list of results
class FakeEnhancer : public Enhancer {
 public:
  FakeEnhancer(std::vector<EnhancerResult> results, bool available = true,
               const EnhancerConfig& config = EnhancerConfig())
      : Enhancer(config), results_(std::move(results)), available_(available) {}

  std::string Name() const override { return "fake"; }
  bool IsAvailable() const override { return available_; }
  std::vector<EnhancerResult> Detect(const std::string&) override {
    detect_calls_++;
    return results_;
  }

  int detect_calls() const { return detect_calls_; }

 private:
  std::vector<EnhancerResult> results_;
  bool available_;
  int detect_calls_ = 0;
};

// Fails from Detect() or from its one-time setup
class ThrowingEnhancer : public Enhancer {
 public:
  explicit ThrowingEnhancer(bool fail_setup) : fail_setup_(fail_setup) {}

  std::string Name() const override { return "throwing"; }
  bool IsAvailable() const override { return true; }
  std::vector<EnhancerResult> Detect(const std::string&) override {
    throw std::runtime_error("model crashed");
  }

 protected:
  bool DoInitialize() override {
    if (fail_setup_) {
      throw std::runtime_error("model missing");
    }
    return true;
  }

 private:
  bool fail_setup_;
};

EnhancerResult Result(const std::string& label, size_t start, size_t end, double confidence) {
  EnhancerResult result;
  result.entity_label = label;
  result.start = start;
  result.end = end;
  result.confidence = confidence;
  result.source = "fake";
  return result;
}

}  // namespace

TEST(EntityLabelTest, FixedTable) {
  EXPECT_EQ(MapEntityLabel("EMAIL_ADDRESS"), PatternType::EMAIL);
  EXPECT_EQ(MapEntityLabel("PHONE_NUMBER"), PatternType::PHONE);
  EXPECT_EQ(MapEntityLabel("IP_ADDRESS"), PatternType::IPV4);
  EXPECT_EQ(MapEntityLabel("PERSON"), PatternType::USERNAME);
  EXPECT_EQ(MapEntityLabel("US_SSN"), PatternType::SSN);
  EXPECT_EQ(MapEntityLabel("SECRET"), PatternType::API_KEY);
  EXPECT_EQ(MapEntityLabel("FQDN"), PatternType::HOSTNAME);
}

TEST(EntityLabelTest, CaseInsensitiveWithCustomFallback) {
  EXPECT_EQ(MapEntityLabel("email_address"), PatternType::EMAIL);
  EXPECT_EQ(MapEntityLabel("Domain"), PatternType::HOSTNAME);
  EXPECT_EQ(MapEntityLabel("SOMETHING_NEW"), PatternType::CUSTOM);
  EXPECT_EQ(MapEntityLabel(""), PatternType::CUSTOM);
}

TEST(EnhancerTest, ResultsBelowThresholdAreDropped) {
  FakeEnhancer enhancer({Result("SECRET", 0, 4, 0.69), Result("SECRET", 5, 9, 0.7)});
  auto detections = CollectDetections(enhancer, "abcd efgh");
  ASSERT_EQ(detections.size(), 1u);
  EXPECT_EQ(detections[0].value, "efgh");
  EXPECT_EQ(detections[0].pattern_type, PatternType::API_KEY);
}

TEST(EnhancerTest, ThresholdIsConfigurable) {
  EnhancerConfig config;
  config.confidence_threshold = 0.5;
  FakeEnhancer enhancer({Result("SECRET", 0, 4, 0.6)}, true, config);
  EXPECT_EQ(CollectDetections(enhancer, "abcd").size(), 1u);
}

TEST(EnhancerTest, InvalidSpansAreDropped) {
  FakeEnhancer enhancer({Result("SECRET", 2, 2, 1.0), Result("SECRET", 3, 50, 1.0)});
  EXPECT_TRUE(CollectDetections(enhancer, "short").empty());
}

TEST(EnhancerTest, UnavailableOrDisabledContributesNothing) {
  FakeEnhancer unavailable({Result("SECRET", 0, 4, 1.0)}, false);
  EXPECT_TRUE(CollectDetections(unavailable, "abcd").empty());
  EXPECT_FALSE(unavailable.Status().initialized);

  EnhancerConfig disabled;
  disabled.enabled = false;
  FakeEnhancer off({Result("SECRET", 0, 4, 1.0)}, true, disabled);
  EXPECT_TRUE(CollectDetections(off, "abcd").empty());
  EXPECT_EQ(off.detect_calls(), 0);
}

TEST(EnhancerTest, StatusReflectsConfig) {
  FakeEnhancer enhancer({});
  CollectDetections(enhancer, "x");
  auto status = enhancer.Status();
  EXPECT_EQ(status.name, "fake");
  EXPECT_TRUE(status.available);
  EXPECT_TRUE(status.initialized);
  EXPECT_TRUE(status.enabled);
  EXPECT_DOUBLE_EQ(status.confidence_threshold, 0.7);
}

TEST(EnhancerTest, EnhancerWinsEqualLengthConflict) {
  // "User alice@example.com ..." - the email occupies [5, 22)
  const std::string text = "User alice@example.com logged in from 192.168.1.5";
  VeilCore::VeilAnonymizer anonymizer;
  anonymizer.AddEnhancer(std::make_unique<FakeEnhancer>(
      std::vector<EnhancerResult>{Result("SECRET", 6, 23, 0.9)}));

  auto detections = anonymizer.Detect(text);
  ASSERT_EQ(detections.size(), 2u);
  EXPECT_EQ(detections[0].pattern_type, PatternType::API_KEY);
  EXPECT_EQ(detections[0].start, 6u);
  EXPECT_EQ(detections[1].pattern_type, PatternType::IPV4);
}

TEST(EnhancerTest, ThrowingDetectContributesNothing) {
  ThrowingEnhancer enhancer(false);
  EXPECT_TRUE(CollectDetections(enhancer, "abcd").empty());
  EXPECT_TRUE(enhancer.Status().initialized);
}

TEST(EnhancerTest, ThrowingSetupLeavesEnhancerUninitialized) {
  ThrowingEnhancer enhancer(true);
  EXPECT_FALSE(enhancer.Initialize());
  EXPECT_TRUE(CollectDetections(enhancer, "abcd").empty());
  EXPECT_FALSE(enhancer.Status().initialized);
}

TEST(EnhancerTest, ThrowingEnhancerKeepsCatalogDetections) {
  VeilCore::VeilAnonymizer anonymizer;
  anonymizer.AddEnhancer(std::make_unique<ThrowingEnhancer>(false));
  anonymizer.AddEnhancer(std::make_unique<ThrowingEnhancer>(true));

  auto result = anonymizer.Anonymize("User alice@example.com logged in from 192.168.1.5");
  EXPECT_EQ(result.anonymized_text, "User [EMAIL_001] logged in from [IP_001]");
  EXPECT_EQ(result.stats.Count(PatternType::EMAIL), 1);
}

TEST(EnhancerRegistryTest, CreatesKnownEnhancers) {
  ASSERT_EQ(VeilEnhancers::KnownEnhancers().size(), 1u);
  auto enhancer = VeilEnhancers::CreateEnhancer("domain");
  ASSERT_TRUE(enhancer != nullptr);
  EXPECT_EQ(enhancer->Name(), "domain");
  EXPECT_TRUE(VeilEnhancers::CreateEnhancer("presidio") == nullptr);
}

TEST(DomainEnhancerTest, ExtractUsesLongestSuffix) {
  DomainEnhancer enhancer;
  auto parts = enhancer.Extract("api.eu.example.co.uk");
  ASSERT_TRUE(parts.is_valid);
  EXPECT_EQ(parts.subdomain, "api.eu");
  EXPECT_EQ(parts.domain, "example");
  EXPECT_EQ(parts.suffix, "co.uk");
  EXPECT_EQ(parts.Fqdn(), "api.eu.example.co.uk");
}

TEST(DomainEnhancerTest, RejectsUnknownSuffixAndBareSuffix) {
  DomainEnhancer enhancer;
  EXPECT_FALSE(enhancer.IsValidDomain("build.notatld"));
  EXPECT_FALSE(enhancer.IsValidDomain("co.uk"));
  EXPECT_TRUE(enhancer.IsValidDomain("example.org"));
}

TEST(DomainEnhancerTest, ExtractIsCached) {
  DomainEnhancer enhancer;
  enhancer.Extract("example.com");
  enhancer.Extract("example.com");
  EXPECT_EQ(enhancer.CacheSize(), 1u);
}

TEST(DomainEnhancerTest, DetectReportsLabelsAndConfidence) {
  DomainEnhancer enhancer;
  auto results = enhancer.Detect("mirror docs.example.org and example.com.br");
  ASSERT_EQ(results.size(), 2u);

  EXPECT_EQ(results[0].value, "docs.example.org");
  EXPECT_EQ(results[0].entity_label, "FQDN");
  EXPECT_EQ(results[0].start, 7u);
  EXPECT_NEAR(results[0].confidence, 1.0, 1e-9);

  EXPECT_EQ(results[1].value, "example.com.br");
  EXPECT_EQ(results[1].entity_label, "DOMAIN");
  EXPECT_NEAR(results[1].confidence, 0.8, 1e-9);
  EXPECT_EQ(results[1].source, "domain");
}

TEST(DomainEnhancerTest, FindsNamesTheCatalogMisses) {
  VeilCore::VeilAnonymizer anonymizer;
  anonymizer.AddEnhancer(VeilEnhancers::CreateEnhancer("domain"));

  // "se" is not among the catalog hostname suffixes
  auto result = anonymizer.Anonymize("pushed to build.acme.se");
  EXPECT_EQ(result.anonymized_text, "pushed to [HOST_001]");
  EXPECT_EQ(result.stats.Count(PatternType::HOSTNAME), 1);
}
