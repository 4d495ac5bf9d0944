#ifndef ANCHORAGE_TRACKING_BACKENDS_NULL_BACKEND_H
#define ANCHORAGE_TRACKING_BACKENDS_NULL_BACKEND_H

#include "anchorage/tracking/tracking_backend.h"

namespace anchorage {

/**
 * Backend for platforms without AR tracking.
 * Every hit test succeeds with no candidates; anchors are never confirmed.
 */
class NullBackend : public TrackingBackend {
public:
    void queryHitTest(double screen_x, double screen_y, HitTestCallback callback) override;
    void setPoseUpdateHandler(PoseUpdateHandler handler) override {}
    void clearPoseUpdateHandler() override {}
    void addAnchor(const std::string& anchor_id, const Pose& pose) override {}
    void removeAnchor(const std::string& anchor_id) override {}
    std::string name() const override { return "null"; }
};

} // namespace anchorage

#endif /* ANCHORAGE_TRACKING_BACKENDS_NULL_BACKEND_H */
