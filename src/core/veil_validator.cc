#include "veil_validator.h"
#include <algorithm>
#include <cctype>

namespace VeilCore {

namespace {

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsValidIPv4(const std::string& value) {
  return std::count(value.begin(), value.end(), '.') == 3;
}

bool IsValidHostname(const std::string& value) {
  if (value.find('.') == std::string::npos) {
    return false;
  }
  // Version strings and dotted numbers are not hostnames
  return !std::all_of(value.begin(), value.end(),
                      [](char c) { return IsDigit(c) || c == '.'; });
}

bool IsValidEmail(const std::string& value) {
  size_t at = value.rfind('@');
  if (at == std::string::npos) {
    return false;
  }
  return value.find('.', at + 1) != std::string::npos;
}

bool IsValidPhone(const std::string& value) {
  return std::count_if(value.begin(), value.end(), IsDigit) >= 8;
}

bool IsValidUnixPath(const std::string& value) {
  if (value.compare(0, 4, "http") == 0) {
    return false;
  }
  return std::count(value.begin(), value.end(), '/') >= 2;
}

}  // namespace

bool IsValidLuhn(const std::string& number) {
  std::string digits;
  for (char c : number) {
    if (IsDigit(c)) digits += c;
  }
  if (digits.length() < 13) {
    return false;
  }

  int sum = 0;
  bool alternate = false;

  for (int i = static_cast<int>(digits.length()) - 1; i >= 0; i--) {
    int digit = digits[i] - '0';

    if (alternate) {
      digit *= 2;
      if (digit > 9) {
        digit -= 9;
      }
    }

    sum += digit;
    alternate = !alternate;
  }

  return (sum % 10 == 0);
}

bool Validate(const std::string& value, PatternType type) {
  switch (type) {
    case PatternType::IPV4: return IsValidIPv4(value);
    case PatternType::HOSTNAME: return IsValidHostname(value);
    case PatternType::EMAIL: return IsValidEmail(value);
    case PatternType::PHONE: return IsValidPhone(value);
    case PatternType::CREDIT_CARD: return IsValidLuhn(value);
    case PatternType::PATH_UNIX: return IsValidUnixPath(value);
    default: return true;
  }
}

}  // namespace VeilCore
