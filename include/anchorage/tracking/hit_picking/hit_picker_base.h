#ifndef ANCHORAGE_TRACKING_HIT_PICKING_HIT_PICKER_BASE_H
#define ANCHORAGE_TRACKING_HIT_PICKING_HIT_PICKER_BASE_H

#include <vector>
#include "anchorage/tracking/hit_candidate.h"

namespace anchorage {

/**
 * Abstract interface for hit selection policies.
 * Backends differ in how much they tell us about a hit, so the ranking
 * rules are pluggable.
 */
class HitPicker {
public:
    virtual ~HitPicker() = default;

    /**
     * Choose the single best candidate
     * @param candidates Hits in backend-reported order
     * @return Pointer into candidates, or nullptr if there is nothing to pick
     */
    virtual const HitCandidate* pick(const std::vector<HitCandidate>& candidates) const = 0;

    virtual const char* name() const = 0;
};

} // namespace anchorage

#endif /* ANCHORAGE_TRACKING_HIT_PICKING_HIT_PICKER_BASE_H */
