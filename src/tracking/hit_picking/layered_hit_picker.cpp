//
// LayeredHitPicker.cpp - Reliability-first hit selection
//

#include "anchorage/tracking/hit_picking/layered_hit_picker.h"
#include <algorithm>

namespace anchorage {

namespace {

// min_element returns the first of equal elements, so ties keep backend order
const HitCandidate* nearestOf(const std::vector<const HitCandidate*>& subset) {
    auto it = std::min_element(subset.begin(), subset.end(),
        [](const HitCandidate* a, const HitCandidate* b) { return a->distance < b->distance; });
    return it == subset.end() ? nullptr : *it;
}

} // namespace

const HitCandidate* LayeredHitPicker::pick(const std::vector<HitCandidate>& candidates) const {
    if (candidates.empty()) {
        return nullptr;
    }

    std::vector<const HitCandidate*> planes_using_extent;
    std::vector<const HitCandidate*> existing_planes;
    std::vector<const HitCandidate*> surfaces;
    const HitCandidate* first_feature_point = nullptr;

    for (const HitCandidate& candidate : candidates) {
        switch (candidate.type) {
            case HitType::EXISTING_PLANE_USING_EXTENT:
                planes_using_extent.push_back(&candidate);
                surfaces.push_back(&candidate);
                break;
            case HitType::EXISTING_PLANE:
                existing_planes.push_back(&candidate);
                surfaces.push_back(&candidate);
                break;
            case HitType::ESTIMATED_PLANE:
                surfaces.push_back(&candidate);
                break;
            case HitType::FEATURE_POINT:
                if (first_feature_point == nullptr) {
                    first_feature_point = &candidate;
                }
                break;
        }
    }

    if (!planes_using_extent.empty()) {
        return nearestOf(planes_using_extent);
    }
    if (!existing_planes.empty()) {
        return nearestOf(existing_planes);
    }
    if (!surfaces.empty()) {
        return nearestOf(surfaces);
    }
    return first_feature_point;
}

} // namespace anchorage
