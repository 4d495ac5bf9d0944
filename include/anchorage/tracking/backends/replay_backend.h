#ifndef ANCHORAGE_TRACKING_BACKENDS_REPLAY_BACKEND_H
#define ANCHORAGE_TRACKING_BACKENDS_REPLAY_BACKEND_H

#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "anchorage/tracking/tracking_backend.h"

namespace anchorage {

/**
 * Plays back a recorded tracking session from JSON.
 *
 * Recording layout:
 * {
 *   "hit_tests": [
 *     {"x": 0.5, "y": 0.5, "candidates": [
 *        {"type": "existing_plane_using_extent", "distance": 1.2, "surface_id": "plane-1",
 *         "anchor_transform": [16 values, column-major],
 *         "world_transform": [16 values, column-major]}]},
 *     {"x": 0.1, "y": 0.9, "error": "tracking lost"}
 *   ],
 *   "frames": [
 *     {"pose_updates": [{"id": "plane-1", "transform": [16 values]}]}
 *   ]
 * }
 *
 * Hit tests are answered inline, in recording order, whatever point is
 * queried. Anchors added through addAnchor are confirmed inline by echoing
 * their pose on the update feed.
 */
class ReplayBackend : public TrackingBackend {
public:
    struct RecordedHitTest {
        double screen_x = 0.5;
        double screen_y = 0.5;
        HitTestResponse response;
    };

    struct RecordedFrame {
        std::vector<std::pair<std::string, Pose>> pose_updates;
    };

    /**
     * @throws std::invalid_argument on a malformed recording
     */
    explicit ReplayBackend(const nlohmann::json& recording);

    /**
     * @throws std::runtime_error if the file cannot be read
     */
    static std::unique_ptr<ReplayBackend> load(const std::string& path);

    // === TrackingBackend ===
    void queryHitTest(double screen_x, double screen_y, HitTestCallback callback) override;
    void setPoseUpdateHandler(PoseUpdateHandler handler) override;
    void clearPoseUpdateHandler() override;
    void addAnchor(const std::string& anchor_id, const Pose& pose) override;
    void removeAnchor(const std::string& anchor_id) override;
    std::string name() const override { return "replay"; }

    /**
     * Emit the next recorded frame's pose updates
     * @return false once the recording has no frames left
     */
    bool advanceFrame();

    const std::deque<RecordedHitTest>& pendingHitTests() const { return hit_tests_; }
    std::size_t remainingFrames() const { return frames_.size(); }
    bool isTracking(const std::string& anchor_id) const { return tracked_anchors_.count(anchor_id) > 0; }

private:
    std::deque<RecordedHitTest> hit_tests_;
    std::deque<RecordedFrame> frames_;
    std::unordered_map<std::string, Pose> tracked_anchors_;
    PoseUpdateHandler pose_update_handler_;

    static HitCandidate parseCandidate(const nlohmann::json& j);
    static Pose parseTransform(const nlohmann::json& j, const std::string& name);
};

} // namespace anchorage

#endif /* ANCHORAGE_TRACKING_BACKENDS_REPLAY_BACKEND_H */
