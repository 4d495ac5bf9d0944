#ifndef ANCHORAGE_TRACKING_HIT_PICKING_LAYERED_HIT_PICKER_H
#define ANCHORAGE_TRACKING_HIT_PICKING_LAYERED_HIT_PICKER_H

#include "hit_picker_base.h"

namespace anchorage {

/**
 * LayeredHitPicker - prefer the most reliable class of hit, then the nearest
 *
 * Algorithm:
 * 1. Any EXISTING_PLANE_USING_EXTENT hits: nearest of those
 * 2. Else any EXISTING_PLANE hits: nearest of those
 * 3. Else any non-feature-point hits: nearest of those
 * 4. Else the first feature point in backend order (feature points are
 *    not distance sorted)
 *
 * Equal distances keep backend order.
 */
class LayeredHitPicker : public HitPicker {
public:
    const HitCandidate* pick(const std::vector<HitCandidate>& candidates) const override;
    const char* name() const override { return "layered"; }
};

} // namespace anchorage

#endif /* ANCHORAGE_TRACKING_HIT_PICKING_LAYERED_HIT_PICKER_H */
