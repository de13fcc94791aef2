#ifndef VEIL_OVERLAP_RESOLVER_H_
#define VEIL_OVERLAP_RESOLVER_H_

#include <vector>

#include "veil_detection.h"

namespace VeilCore {

/**
 * OverlapResolver - arbitrates overlapping candidates into a disjoint set
 *
 * Candidates are offered one at a time, in priority order (enhancers,
 * then catalog order, then custom patterns). Against each accepted
 * interval [s, e) a candidate [start, end):
 *
 *   - that does not overlap it is unaffected by it;
 *   - that contains it marks it for removal (a candidate may swallow
 *     several accepted intervals);
 *   - that is contained by it is rejected;
 *   - that partially overlaps it wins only if strictly longer. On equal
 *     length the accepted interval stays.
 *
 * A candidate that survives every comparison replaces the intervals it
 * marked. Finish() returns the survivors sorted by start.
 *
 * Cost is O(n * k) for n candidates and k accepted intervals.
 */
class OverlapResolver {
 public:
  OverlapResolver() = default;

  // Returns true if the candidate was accepted
  bool Offer(const Detection& candidate);

  // Accepted detections sorted by start; the resolver is left empty
  std::vector<Detection> Finish();

  size_t AcceptedCount() const { return accepted_.size(); }

  // Offer every candidate in order, then Finish()
  static std::vector<Detection> Resolve(const std::vector<Detection>& candidates);

 private:
  // Insertion order is kept so removal never reorders survivors
  std::vector<Detection> accepted_;
};

}  // namespace VeilCore

#endif  // VEIL_OVERLAP_RESOLVER_H_
