#ifndef ANCHORAGE_TRACKING_HIT_PICKING_NEAREST_HIT_PICKER_H
#define ANCHORAGE_TRACKING_HIT_PICKING_NEAREST_HIT_PICKER_H

#include "hit_picker_base.h"

namespace anchorage {

/**
 * Nearest hit regardless of type.
 * For backends that report a flat, unclassified hit list.
 */
class NearestHitPicker : public HitPicker {
public:
    const HitCandidate* pick(const std::vector<HitCandidate>& candidates) const override;
    const char* name() const override { return "nearest"; }
};

} // namespace anchorage

#endif /* ANCHORAGE_TRACKING_HIT_PICKING_NEAREST_HIT_PICKER_H */
