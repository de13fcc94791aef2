#ifndef VEIL_VALIDATOR_H_
#define VEIL_VALIDATOR_H_

#include <string>

#include "veil_pattern_type.h"

namespace VeilCore {

/**
 * Structural checks applied to regex matches to cut false positives.
 * Categories without a dedicated check are accepted as matched.
 */
bool Validate(const std::string& value, PatternType type);

/**
 * Luhn mod-10 check over the digits of |number| (other characters are
 * ignored). Requires at least 13 digits.
 */
bool IsValidLuhn(const std::string& number);

}  // namespace VeilCore

#endif  // VEIL_VALIDATOR_H_
