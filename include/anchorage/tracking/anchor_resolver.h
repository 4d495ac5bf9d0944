#ifndef ANCHORAGE_TRACKING_ANCHOR_RESOLVER_H
#define ANCHORAGE_TRACKING_ANCHOR_RESOLVER_H

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "anchorage/core/anchor_offset.h"
#include "anchorage/core/anchor_registry.h"
#include "anchorage/core/coordinate_space.h"
#include "anchorage/session/session_config.h"
#include "anchorage/tracking/hit_picking/hit_picker_base.h"
#include "anchorage/tracking/tracking_backend.h"

namespace anchorage {

/**
 * AnchorResolver turns a screen tap into an offset from a stable anchor.
 *
 * Pipeline:
 * 1. query the backend for hit candidates at the screen point
 * 2. pick the best candidate
 * 3. find the anchor for the candidate's surface, or create one
 * 4. express the exact hit pose as an offset from that anchor
 *
 * COORDINATE CONVENTIONS:
 * - Candidate poses arrive in tracker space (the backend's native frame)
 * - Anchors are created in tracker space
 * - Offsets follow AnchorOffset: tracker-space translation from the anchor
 *   origin, rotation applied on top of the anchor rotation
 */
class AnchorResolver {
public:

    struct Result {
        enum class Status {
            HIT,                  // offset is valid
            NO_HIT,               // backend answered, nothing usable was hit
            BACKEND_QUERY_FAILED  // backend could not be asked, see error
        };
        Status status = Status::NO_HIT;
        AnchorOffset offset;
        std::string error;

        bool hit() const { return status == Status::HIT; }
    };

    using ResolveCallback = std::function<void(const Result&)>;

    /**
     * @param backend Hit test source; must outlive the resolver
     * @param registry Anchor owner; must outlive the resolver
     * @param tracker_space Root space anchors are expressed in
     * @param picker Candidate ranking policy
     * @param config Calibration and debug settings
     */
    AnchorResolver(TrackingBackend& backend,
                   AnchorRegistry& registry,
                   std::shared_ptr<CoordinateSpace> tracker_space,
                   std::unique_ptr<HitPicker> picker,
                   const SessionConfig& config);

    AnchorResolver(const AnchorResolver&) = delete;
    AnchorResolver& operator=(const AnchorResolver&) = delete;

    /**
     * Resolve a normalized screen point to an anchor offset.
     * Returns immediately; callback fires when the backend answers, inline
     * for synchronous backends. Late answers arriving after the resolver is
     * destroyed are dropped.
     *
     * @param screen_x,screen_y Normalized coordinates in [0,1], origin top left
     * @param active_space Caller's current space; must share the tracker root
     * @throws DisjointSpaceError if active_space is not rooted in tracker space
     * @throws std::invalid_argument if the screen point is out of range
     */
    void resolveHit(double screen_x, double screen_y,
                    const CoordinateSpace& active_space,
                    ResolveCallback callback);

    /**
     * Steps after the backend query: pick, match or create, compute offset
     */
    Result resolveCandidates(const std::vector<HitCandidate>& candidates);

    const HitPicker& picker() const { return *picker_; }

private:
    TrackingBackend& backend_;
    AnchorRegistry& registry_;
    std::shared_ptr<CoordinateSpace> tracker_space_;
    std::unique_ptr<HitPicker> picker_;
    SessionConfig config_;

    // Surface id -> anchor id of every surface anchor this resolver created
    std::unordered_map<std::string, std::string> surface_anchors_;

    // Expires with the resolver so in-flight callbacks can tell
    std::shared_ptr<bool> alive_;

    Result handleResponse(const HitTestResponse& response);
    Anchor& findOrCreateAnchor(const HitCandidate& candidate, const Pose& anchor_pose);
};

} // namespace anchorage

#endif /* ANCHORAGE_TRACKING_ANCHOR_RESOLVER_H */
