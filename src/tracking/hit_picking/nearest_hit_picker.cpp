//
// NearestHitPicker.cpp - Distance-only hit selection
//

#include "anchorage/tracking/hit_picking/nearest_hit_picker.h"
#include <algorithm>

namespace anchorage {

const HitCandidate* NearestHitPicker::pick(const std::vector<HitCandidate>& candidates) const {
    auto it = std::min_element(candidates.begin(), candidates.end(),
        [](const HitCandidate& a, const HitCandidate& b) { return a.distance < b.distance; });
    return it == candidates.end() ? nullptr : &*it;
}

} // namespace anchorage
