#include "veil_overlap_resolver.h"
#include <algorithm>
#include <cstddef>

namespace VeilCore {

bool OverlapResolver::Offer(const Detection& candidate) {
  if (candidate.end <= candidate.start) {
    return false;
  }

  std::vector<size_t> to_remove;

  for (size_t i = 0; i < accepted_.size(); i++) {
    const Detection& existing = accepted_[i];
    size_t s = existing.start;
    size_t e = existing.end;

    if (candidate.end <= s || candidate.start >= e) {
      continue;
    }

    // Candidate swallows the accepted interval
    if (candidate.start <= s && candidate.end >= e) {
      to_remove.push_back(i);
      continue;
    }

    // Accepted interval swallows the candidate
    if (s <= candidate.start && e >= candidate.end) {
      return false;
    }

    // Partial overlap: strictly longer wins, ties keep the accepted one
    if (candidate.Length() > existing.Length()) {
      to_remove.push_back(i);
    } else {
      return false;
    }
  }

  for (auto it = to_remove.rbegin(); it != to_remove.rend(); ++it) {
    accepted_.erase(accepted_.begin() + static_cast<std::ptrdiff_t>(*it));
  }

  accepted_.push_back(candidate);
  return true;
}

std::vector<Detection> OverlapResolver::Finish() {
  std::vector<Detection> result;
  result.swap(accepted_);
  std::stable_sort(result.begin(), result.end(),
                   [](const Detection& a, const Detection& b) { return a.start < b.start; });
  return result;
}

std::vector<Detection> OverlapResolver::Resolve(const std::vector<Detection>& candidates) {
  OverlapResolver resolver;
  for (const auto& candidate : candidates) {
    resolver.Offer(candidate);
  }
  return resolver.Finish();
}

}  // namespace VeilCore
