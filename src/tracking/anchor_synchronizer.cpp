//
// AnchorSynchronizer.cpp - Backend pose feed -> registry, on the update turn
//

#include "anchorage/tracking/anchor_synchronizer.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace anchorage {

AnchorSynchronizer::AnchorSynchronizer(AnchorRegistry& registry, std::size_t stale_after_frames, bool debug_output)
    : registry_(registry)
    , stale_after_frames_(stale_after_frames)
    , debug_output_(debug_output) {
    if (stale_after_frames_ == 0) {
        throw std::invalid_argument("stale_after_frames must be positive");
    }
}

void AnchorSynchronizer::enqueue(const std::string& anchor_id, const Pose& pose) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_[anchor_id] = pose;
}

std::size_t AnchorSynchronizer::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

AnchorSynchronizer::UpdateSummary AnchorSynchronizer::processUpdates() {
    std::unordered_map<std::string, Pose> updates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        updates.swap(pending_);
    }

    UpdateSummary summary;

    // Apply in id order so observers see a deterministic sequence
    std::vector<std::string> ids;
    ids.reserve(updates.size());
    for (const auto& [id, pose] : updates) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());

    for (const std::string& id : ids) {
        if (!registry_.contains(id)) {
            // Backend reports can race with local removal
            summary.dropped++;
        } else {
            summary.applied++;
        }
        registry_.updatePose(id, updates.at(id));
    }

    summary.turned_stale = registry_.advanceFrame(stale_after_frames_);
    frame_count_++;

    if (debug_output_ && (summary.applied || summary.dropped || !summary.turned_stale.empty())) {
        std::cout << "AnchorSynchronizer: frame " << frame_count_ << ": applied " << summary.applied
                  << ", dropped " << summary.dropped
                  << ", stale " << summary.turned_stale.size() << std::endl;
    }
    for (const std::string& id : summary.turned_stale) {
        std::cout << "AnchorSynchronizer: anchor '" << id << "' lost tracking" << std::endl;
    }

    return summary;
}

} // namespace anchorage
