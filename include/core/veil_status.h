#pragma once

#include <string>

namespace VeilCore {

// Outcome of importing mappings or a session snapshot.
// On anything but OK the importing object is left exactly as it was.
enum class ImportStatus {
  OK,                // State replaced
  PARSE_ERROR,       // Input is not valid JSON
  SCHEMA_ERROR,      // Missing key, wrong type, unknown pattern id
  INCONSISTENT       // Maps disagree, or counters would re-issue a placeholder
};

inline const char* ImportStatusToString(ImportStatus status) {
  switch (status) {
    case ImportStatus::OK: return "ok";
    case ImportStatus::PARSE_ERROR: return "parse_error";
    case ImportStatus::SCHEMA_ERROR: return "schema_error";
    case ImportStatus::INCONSISTENT: return "inconsistent";
    default: return "unknown";
  }
}

}  // namespace VeilCore
