#include <gtest/gtest.h>

#include "veil_validator.h"

using VeilCore::IsValidLuhn;
using VeilCore::PatternType;
using VeilCore::Validate;

TEST(LuhnTest, AcceptsValidNumber) {
  EXPECT_TRUE(IsValidLuhn("4532015112830366"));
}

TEST(LuhnTest, RejectsWrongCheckDigit) {
  EXPECT_FALSE(IsValidLuhn("4532015112830367"));
}

TEST(LuhnTest, IgnoresSeparators) {
  EXPECT_TRUE(IsValidLuhn("4532-0151-1283-0366"));
  EXPECT_TRUE(IsValidLuhn("4532 0151 1283 0366"));
}

TEST(LuhnTest, RequiresThirteenDigits) {
  EXPECT_FALSE(IsValidLuhn("0"));
  EXPECT_FALSE(IsValidLuhn("000000000000"));
  EXPECT_TRUE(IsValidLuhn("0000000000000"));
}

TEST(ValidatorTest, IPv4NeedsFourParts) {
  EXPECT_TRUE(Validate("10.0.0.1", PatternType::IPV4));
  EXPECT_TRUE(Validate("10.0.0.0/24", PatternType::IPV4));
  EXPECT_FALSE(Validate("10.0.1", PatternType::IPV4));
}

TEST(ValidatorTest, HostnameRejectsDottedNumbers) {
  EXPECT_TRUE(Validate("srv01.example.com", PatternType::HOSTNAME));
  EXPECT_FALSE(Validate("1.2.3", PatternType::HOSTNAME));
  EXPECT_FALSE(Validate("localhost", PatternType::HOSTNAME));
}

TEST(ValidatorTest, EmailNeedsDottedDomain) {
  EXPECT_TRUE(Validate("alice@example.com", PatternType::EMAIL));
  EXPECT_FALSE(Validate("alice@localhost", PatternType::EMAIL));
  EXPECT_FALSE(Validate("alice.example.com", PatternType::EMAIL));
}

TEST(ValidatorTest, PhoneNeedsEightDigits) {
  EXPECT_TRUE(Validate("+33 6 12 34 56 78", PatternType::PHONE));
  EXPECT_TRUE(Validate("(555) 123-4567", PatternType::PHONE));
  EXPECT_FALSE(Validate("12 34 56", PatternType::PHONE));
}

TEST(ValidatorTest, CreditCardUsesLuhn) {
  EXPECT_TRUE(Validate("4532 0151 1283 0366", PatternType::CREDIT_CARD));
  EXPECT_FALSE(Validate("4532 0151 1283 0367", PatternType::CREDIT_CARD));
}

TEST(ValidatorTest, UnixPathRules) {
  EXPECT_TRUE(Validate("/var/log/syslog", PatternType::PATH_UNIX));
  EXPECT_FALSE(Validate("/var", PatternType::PATH_UNIX));
  EXPECT_FALSE(Validate("http://host/a/b", PatternType::PATH_UNIX));
}

TEST(ValidatorTest, OtherTypesAreTrusted) {
  EXPECT_TRUE(Validate("anything", PatternType::UUID));
  EXPECT_TRUE(Validate("x", PatternType::CUSTOM));
  EXPECT_TRUE(Validate("", PatternType::API_KEY));
}
