//
// AnchorResolver.cpp - Hit test to anchor offset resolution
//
// COORDINATE CONVENTIONS:
// - T_tracker_from_surface: candidate anchor_pose (matched surface in tracker space)
// - T_tracker_from_hit: candidate world_pose (exact intersection in tracker space)
// - offset: (hit.position - surface.position, hit.rotation * surface.rotation^-1)

#include "anchorage/tracking/anchor_resolver.h"
#include "anchorage/core/utils/transform.h"
#include <iostream>
#include <stdexcept>

namespace anchorage {

// ============================================================================
// Constructor
// ============================================================================

AnchorResolver::AnchorResolver(TrackingBackend& backend,
                               AnchorRegistry& registry,
                               std::shared_ptr<CoordinateSpace> tracker_space,
                               std::unique_ptr<HitPicker> picker,
                               const SessionConfig& config)
    : backend_(backend)
    , registry_(registry)
    , tracker_space_(std::move(tracker_space))
    , picker_(std::move(picker))
    , config_(config)
    , alive_(std::make_shared<bool>(true)) {

    if (!tracker_space_) {
        throw std::invalid_argument("AnchorResolver requires a tracker space");
    }
    if (!picker_) {
        throw std::invalid_argument("AnchorResolver requires a hit picker");
    }

    if (config_.enable_debug_output) {
        std::cout << "AnchorResolver initialized (backend: " << backend_.name()
                  << ", picker: " << picker_->name()
                  << ", vertical offset: " << config_.vertical_offset << "m)" << std::endl;
    }
}

// ============================================================================
// Hit Test Query
// ============================================================================

void AnchorResolver::resolveHit(double screen_x, double screen_y,
                                const CoordinateSpace& active_space,
                                ResolveCallback callback) {
    // Written so NaN fails the range check too
    if (!(screen_x >= 0.0 && screen_x <= 1.0 && screen_y >= 0.0 && screen_y <= 1.0)) {
        throw std::invalid_argument("screen point (" + std::to_string(screen_x) + ", " +
                                    std::to_string(screen_y) + ") is outside [0,1]");
    }

    if (!active_space.sharesRootWith(*tracker_space_)) {
        throw DisjointSpaceError(active_space.name(), tracker_space_->name());
    }

    if (config_.enable_debug_output) {
        std::cout << "AnchorResolver: hit test at (" << screen_x << ", " << screen_y
                  << ") from space '" << active_space.name() << "'" << std::endl;
    }

    std::weak_ptr<bool> alive = alive_;
    backend_.queryHitTest(screen_x, screen_y,
        [this, alive, callback](const HitTestResponse& response) {
            if (alive.expired()) {
                std::cout << "AnchorResolver: dropping hit test result for destroyed resolver" << std::endl;
                return;
            }
            Result result = handleResponse(response);
            if (callback) {
                callback(result);
            }
        });
}

AnchorResolver::Result AnchorResolver::handleResponse(const HitTestResponse& response) {
    if (!response.success) {
        std::cout << "WARNING: AnchorResolver: hit test query failed: " << response.error << std::endl;
        Result result;
        result.status = Result::Status::BACKEND_QUERY_FAILED;
        result.error = response.error.empty() ? "hit test query failed" : response.error;
        return result;
    }

    if (response.candidates.empty()) {
        if (config_.enable_debug_output) {
            std::cout << "AnchorResolver: no hit candidates" << std::endl;
        }
        return Result();
    }

    return resolveCandidates(response.candidates);
}

// ============================================================================
// Candidate Resolution
// ============================================================================

AnchorResolver::Result AnchorResolver::resolveCandidates(const std::vector<HitCandidate>& candidates) {
    Result result;

    const HitCandidate* best = picker_->pick(candidates);
    if (best == nullptr) {
        return result;
    }

    // Lift both poses to the eye-height baseline
    Pose T_tracker_from_surface = best->anchor_pose;
    Pose T_tracker_from_hit = best->world_pose;
    T_tracker_from_surface.position.y() += config_.vertical_offset;
    T_tracker_from_hit.position.y() += config_.vertical_offset;

    Anchor& anchor = findOrCreateAnchor(*best, T_tracker_from_surface);

    result.status = Result::Status::HIT;
    result.offset = AnchorOffset::between(anchor.id, T_tracker_from_surface, T_tracker_from_hit);

    if (config_.enable_debug_output) {
        std::cout << "AnchorResolver: picked " << toString(best->type) << " hit at "
                  << best->distance << "m of " << candidates.size() << " candidates"
                  << " -> anchor '" << anchor.id << "'" << std::endl;
        utils::TransformUtils::printTransform(result.offset.pose.toMatrix(), "Offset from anchor");
    }

    return result;
}

Anchor& AnchorResolver::findOrCreateAnchor(const HitCandidate& candidate, const Pose& anchor_pose) {
    // No surface identity: every hit gets its own anchor
    if (!candidate.hasSurfaceIdentity()) {
        Anchor& anchor = registry_.create(anchor_pose);
        backend_.addAnchor(anchor.id, candidate.anchor_pose);
        return anchor;
    }

    const std::string& surface_id = candidate.surface_id;
    auto mapped = surface_anchors_.find(surface_id);
    if (mapped != surface_anchors_.end()) {
        if (Anchor* existing = registry_.get(mapped->second)) {
            return *existing;
        }
    }

    // The surface id doubles as anchor id unless another anchor holds it or
    // it was removed; removed anchors are never resurrected
    Anchor* anchor = nullptr;
    if (!registry_.contains(surface_id) && !registry_.isRetired(surface_id)) {
        anchor = &registry_.create(anchor_pose, surface_id);
    } else {
        anchor = &registry_.create(anchor_pose);
    }
    surface_anchors_[surface_id] = anchor->id;

    // Backend poses are native, without the vertical offset
    backend_.addAnchor(anchor->id, candidate.anchor_pose);

    if (config_.enable_debug_output) {
        std::cout << "AnchorResolver: created anchor '" << anchor->id
                  << "' for surface '" << surface_id << "'" << std::endl;
    }
    return *anchor;
}

} // namespace anchorage
