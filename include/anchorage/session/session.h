#ifndef ANCHORAGE_SESSION_SESSION_H
#define ANCHORAGE_SESSION_SESSION_H

#include <memory>
#include <string>
#include "anchorage/core/anchor_offset.h"
#include "anchorage/core/anchor_registry.h"
#include "anchorage/core/coordinate_space.h"
#include "anchorage/session/session_config.h"
#include "anchorage/tracking/anchor_resolver.h"
#include "anchorage/tracking/anchor_synchronizer.h"
#include "anchorage/tracking/tracking_backend.h"

namespace anchorage {

/**
 * Session ties one tracking backend to the anchor machinery.
 *
 * COORDINATE CONVENTIONS:
 * - Tracker space: root of the session's space tree, anchors live here
 * - Registry poses include the configured vertical offset
 * - Backend poses are native; the session converts in both directions
 *
 * Usage per frame on the host's update thread:
 *   session.findAnchor(x, y, *camera_space, on_offset);  // on tap
 *   session.update();                                    // every frame
 */
class Session {
public:
    /**
     * @param backend Tracking system; must outlive the session
     * @param config Session settings
     * @throws std::invalid_argument if config is invalid
     */
    explicit Session(TrackingBackend& backend, const SessionConfig& config = SessionConfig());
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    std::shared_ptr<CoordinateSpace> trackerSpace() const { return tracker_space_; }

    /**
     * Create a space under parent, or under tracker space when parent is null
     */
    std::shared_ptr<CoordinateSpace> createSpace(const std::string& name,
                                                 const std::shared_ptr<CoordinateSpace>& parent = nullptr,
                                                 const Pose& pose_in_parent = Pose::Identity());

    /**
     * Resolve a screen tap to an anchor offset. See AnchorResolver::resolveHit.
     */
    void findAnchor(double screen_x, double screen_y,
                    const CoordinateSpace& active_space,
                    AnchorResolver::ResolveCallback callback);

    /**
     * Place an anchor at a pose given in any space of this session
     * @return id of the new anchor
     * @throws DisjointSpaceError if space is unrelated to tracker space
     * @throws std::invalid_argument if id is live or was removed before
     */
    std::string addAnchor(const Pose& pose, const CoordinateSpace& space, const std::string& id = "");

    void removeAnchor(const std::string& id);

    /**
     * Update turn: apply queued backend reports and age anchors
     */
    AnchorSynchronizer::UpdateSummary update();

    /**
     * Absolute pose of an offset's target, expressed in target_space
     * @return false if the offset's anchor is unknown
     */
    bool resolveOffset(const AnchorOffset& offset, const CoordinateSpace& target_space, Pose& pose) const;

    const AnchorRegistry& anchors() const { return registry_; }
    AnchorRegistry& anchors() { return registry_; }

    const SessionConfig& config() const { return config_; }
    TrackingBackend& backend() { return backend_; }

private:
    TrackingBackend& backend_;
    SessionConfig config_;
    std::shared_ptr<CoordinateSpace> tracker_space_;
    AnchorRegistry registry_;
    AnchorSynchronizer synchronizer_;
    AnchorResolver resolver_;

    Pose toBackend(const Pose& pose) const;
    Pose fromBackend(const Pose& pose) const;
};

} // namespace anchorage

#endif /* ANCHORAGE_SESSION_SESSION_H */
