#ifndef ANCHORAGE_TRACKING_TRACKING_BACKEND_H
#define ANCHORAGE_TRACKING_TRACKING_BACKEND_H

#include <functional>
#include <string>
#include <vector>
#include "anchorage/core/pose.h"
#include "anchorage/tracking/hit_candidate.h"

namespace anchorage {

/**
 * Answer to a hit test query.
 * success == false means the backend could not be asked (transport or
 * internal failure). success == true with no candidates means nothing was hit.
 */
struct HitTestResponse {
    bool success = false;
    std::vector<HitCandidate> candidates;
    std::string error;

    static HitTestResponse hits(std::vector<HitCandidate> candidates);
    static HitTestResponse failure(std::string error);
};

/**
 * Capability interface over an AR tracking system (plane detection,
 * feature point SLAM, recorded sessions, ...).
 *
 * COORDINATE CONVENTIONS:
 * - All poses crossing this interface are in the backend's native world
 *   frame, which is the session's tracker space
 * - Screen coordinates are normalized: (0,0) top left, (1,1) bottom right
 *
 * Callbacks may be invoked inline or later from any thread. Hosts whose
 * backend calls back on another thread must marshal hit test completions
 * onto their update thread.
 */
class TrackingBackend {
public:
    using HitTestCallback = std::function<void(const HitTestResponse&)>;
    using PoseUpdateHandler = std::function<void(const std::string& anchor_id, const Pose& pose)>;

    virtual ~TrackingBackend() = default;

    /**
     * Cast a ray through a normalized screen point
     * @param callback Invoked exactly once if the backend ever answers
     */
    virtual void queryHitTest(double screen_x, double screen_y, HitTestCallback callback) = 0;

    /**
     * Install the receiver of the asynchronous (anchor id, pose) feed.
     * Replaces any previous handler.
     */
    virtual void setPoseUpdateHandler(PoseUpdateHandler handler) = 0;
    virtual void clearPoseUpdateHandler() = 0;

    /**
     * Ask the backend to track an anchor. Confirmation arrives on the pose
     * update feed, possibly never if the backend cannot track it.
     */
    virtual void addAnchor(const std::string& anchor_id, const Pose& pose) = 0;
    virtual void removeAnchor(const std::string& anchor_id) = 0;

    virtual std::string name() const = 0;
};

} // namespace anchorage

#endif /* ANCHORAGE_TRACKING_TRACKING_BACKEND_H */
