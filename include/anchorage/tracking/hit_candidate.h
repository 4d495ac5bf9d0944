#ifndef ANCHORAGE_TRACKING_HIT_CANDIDATE_H
#define ANCHORAGE_TRACKING_HIT_CANDIDATE_H

#include <string>
#include "anchorage/core/pose.h"
#include "anchorage/core/utils/json.h"

namespace anchorage {

/*
 Types of hit test results, most trustworthy first:

 EXISTING_PLANE_USING_EXTENT: hit a tracked plane, inside its estimated extent.
 EXISTING_PLANE: hit a tracked plane, extent not taken into account. The point
                 may lie outside the actual surface.
 ESTIMATED_PLANE: hit a surface the backend has not anchored yet.
 FEATURE_POINT: hit a point the backend believes lies on some continuous
                surface. Orientation is not meaningful.
 */
enum class HitType {
    EXISTING_PLANE_USING_EXTENT,
    EXISTING_PLANE,
    ESTIMATED_PLANE,
    FEATURE_POINT
};

NLOHMANN_JSON_SERIALIZE_ENUM(HitType, {
    {HitType::EXISTING_PLANE_USING_EXTENT, "existing_plane_using_extent"},
    {HitType::EXISTING_PLANE, "existing_plane"},
    {HitType::ESTIMATED_PLANE, "estimated_plane"},
    {HitType::FEATURE_POINT, "feature_point"},
})

std::string toString(HitType type);

/**
 * Inverse of toString, through the JSON enum mapping above
 * @throws std::invalid_argument for names outside the mapping
 */
HitType hitTypeFromString(const std::string& name);

/**
 * One ray/surface intersection reported by a tracking backend.
 * Produced and consumed within a single resolution, never stored.
 */
struct HitCandidate {
    HitType type = HitType::FEATURE_POINT;
    double distance = 0.0;         // camera to hit point, non-negative (meters)
    std::string surface_id;        // stable surface identity, empty if the backend has none
    Pose anchor_pose;              // pose of the matched surface, tracker space
    Pose world_pose;               // exact intersection pose, tracker space

    bool hasSurfaceIdentity() const { return !surface_id.empty(); }
};

} // namespace anchorage

#endif /* ANCHORAGE_TRACKING_HIT_CANDIDATE_H */
