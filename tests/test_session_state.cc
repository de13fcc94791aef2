#include <gtest/gtest.h>

#include "veil_session_state.h"

using VeilCore::ImportStatus;
using VeilCore::PatternType;
using VeilCore::SessionState;
using json = nlohmann::json;

namespace {

SessionState SampleState() {
  SessionState state;
  state.mappings = {{"10.0.0.1", "[IP_001]"}, {"alice", "[USER_001]"}};
  state.reverse_mappings = {{"[IP_001]", "10.0.0.1"}, {"[USER_001]", "alice"}};
  state.counters = {{"IP", 1}, {"USER", 1}};
  state.enabled_patterns[PatternType::PHONE] = false;
  state.custom_patterns = {{"TICKET-[0-9]+", "TICKET"}};
  state.preserve_list = {"localhost"};
  state.enhancers["domain"] = {false, 0.85};
  return state;
}

}  // namespace

TEST(SessionStateTest, ToJsonLayout) {
  json data = SampleState().ToJSON();

  EXPECT_EQ(data["mappings"]["10.0.0.1"], "[IP_001]");
  EXPECT_EQ(data["reverse_mappings"]["[USER_001]"], "alice");
  EXPECT_EQ(data["counters"]["IP"], 1);

  // Every type is written, unspecified ones as enabled
  EXPECT_EQ(data["enabled_patterns"].size(), VeilCore::AllPatternTypes().size());
  EXPECT_EQ(data["enabled_patterns"]["phone"], false);
  EXPECT_EQ(data["enabled_patterns"]["ipv4"], true);

  ASSERT_EQ(data["custom_patterns"].size(), 1u);
  EXPECT_EQ(data["custom_patterns"][0], json::array({"TICKET-[0-9]+", "TICKET"}));
  EXPECT_EQ(data["preserve_list"], json::array({"localhost"}));
  EXPECT_EQ(data["enhancers"]["domain"]["enabled"], false);
}

TEST(SessionStateTest, SerializeParseRoundTrip) {
  SessionState original = SampleState();
  SessionState restored;
  ASSERT_EQ(SessionState::Parse(original.Serialize(), &restored), ImportStatus::OK);

  EXPECT_EQ(restored.mappings, original.mappings);
  EXPECT_EQ(restored.reverse_mappings, original.reverse_mappings);
  EXPECT_EQ(restored.counters, original.counters);
  EXPECT_FALSE(restored.enabled_patterns[PatternType::PHONE]);
  EXPECT_TRUE(restored.enabled_patterns[PatternType::EMAIL]);
  EXPECT_EQ(restored.custom_patterns, original.custom_patterns);
  EXPECT_EQ(restored.preserve_list, original.preserve_list);
  ASSERT_EQ(restored.enhancers.count("domain"), 1u);
  EXPECT_FALSE(restored.enhancers["domain"].enabled);
  EXPECT_DOUBLE_EQ(restored.enhancers["domain"].confidence_threshold, 0.85);
}

TEST(SessionStateTest, ParseErrorOnInvalidJson) {
  SessionState out;
  EXPECT_EQ(SessionState::Parse("{not json", &out), ImportStatus::PARSE_ERROR);
}

TEST(SessionStateTest, EnhancersAreOptional) {
  json data = SampleState().ToJSON();
  data.erase("enhancers");

  SessionState out;
  ASSERT_EQ(SessionState::FromJSON(data, &out), ImportStatus::OK);
  EXPECT_TRUE(out.enhancers.empty());
}

TEST(SessionStateTest, MissingTypesDefaultToEnabled) {
  json data = SampleState().ToJSON();
  data["enabled_patterns"] = {{"phone", false}};

  SessionState out;
  ASSERT_EQ(SessionState::FromJSON(data, &out), ImportStatus::OK);
  EXPECT_FALSE(out.enabled_patterns[PatternType::PHONE]);
  EXPECT_TRUE(out.enabled_patterns[PatternType::IPV4]);
}

TEST(SessionStateTest, SchemaErrors) {
  SessionState out;
  out.preserve_list = {"untouched"};

  json unknown_type = SampleState().ToJSON();
  unknown_type["enabled_patterns"]["ip_v4"] = true;
  EXPECT_EQ(SessionState::FromJSON(unknown_type, &out), ImportStatus::SCHEMA_ERROR);

  json missing_preserve = SampleState().ToJSON();
  missing_preserve.erase("preserve_list");
  EXPECT_EQ(SessionState::FromJSON(missing_preserve, &out), ImportStatus::SCHEMA_ERROR);

  json bad_custom = SampleState().ToJSON();
  bad_custom["custom_patterns"] = json::array({json::array({"only-regex"})});
  EXPECT_EQ(SessionState::FromJSON(bad_custom, &out), ImportStatus::SCHEMA_ERROR);

  json bad_flag = SampleState().ToJSON();
  bad_flag["enabled_patterns"]["ipv4"] = "yes";
  EXPECT_EQ(SessionState::FromJSON(bad_flag, &out), ImportStatus::SCHEMA_ERROR);

  json bad_enhancer = SampleState().ToJSON();
  bad_enhancer["enhancers"]["domain"] = {{"enabled", true}};
  EXPECT_EQ(SessionState::FromJSON(bad_enhancer, &out), ImportStatus::SCHEMA_ERROR);

  EXPECT_EQ(out.preserve_list, std::vector<std::string>{"untouched"});
}

TEST(SessionStateTest, InconsistentMappingsRejected) {
  json data = SampleState().ToJSON();
  data["counters"]["IP"] = 0;

  SessionState out;
  EXPECT_EQ(SessionState::FromJSON(data, &out), ImportStatus::INCONSISTENT);
}
