#ifndef ANCHORAGE_TRACKING_ANCHOR_SYNCHRONIZER_H
#define ANCHORAGE_TRACKING_ANCHOR_SYNCHRONIZER_H

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "anchorage/core/anchor_registry.h"
#include "anchorage/core/pose.h"

namespace anchorage {

/**
 * Bridges the backend pose-update feed onto the host's update thread.
 *
 * The backend may report (anchor id, pose) from any thread; reports are
 * queued here and applied to the registry only when the host runs its
 * update turn. Within one turn the last report per id wins.
 *
 * Tracking states driven from here:
 *   PENDING --report--> TRACKED --N silent turns--> STALE --report--> TRACKED
 */
class AnchorSynchronizer {
public:
    struct UpdateSummary {
        std::size_t applied = 0;                // reports written to live anchors
        std::size_t dropped = 0;                // reports for unknown or removed anchors
        std::vector<std::string> turned_stale;  // anchors that went STALE this turn
    };

    /**
     * @param registry Anchor owner; must outlive the synchronizer
     * @param stale_after_frames Silent update turns before TRACKED -> STALE
     */
    AnchorSynchronizer(AnchorRegistry& registry, std::size_t stale_after_frames, bool debug_output = false);

    /**
     * Queue a backend report. Safe to call from any thread.
     */
    void enqueue(const std::string& anchor_id, const Pose& pose);

    /**
     * Apply queued reports and age tracked anchors by one frame.
     * Call once per update turn from the thread that owns the registry.
     */
    UpdateSummary processUpdates();

    std::size_t pendingCount() const;
    std::size_t frameCount() const { return frame_count_; }

private:
    AnchorRegistry& registry_;
    std::size_t stale_after_frames_;
    bool debug_output_;
    std::size_t frame_count_ = 0;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Pose> pending_;
};

} // namespace anchorage

#endif /* ANCHORAGE_TRACKING_ANCHOR_SYNCHRONIZER_H */
