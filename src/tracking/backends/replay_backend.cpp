//
// ReplayBackend.cpp - Recorded tracking session playback
//

#include "anchorage/tracking/backends/replay_backend.h"
#include "anchorage/core/utils/transform.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace anchorage {

// ============================================================================
// Loading
// ============================================================================

ReplayBackend::ReplayBackend(const nlohmann::json& recording) {
    if (!recording.is_object()) {
        throw std::invalid_argument("replay recording must be a JSON object");
    }

    for (const nlohmann::json& entry : recording.value("hit_tests", nlohmann::json::array())) {
        RecordedHitTest hit_test;
        hit_test.screen_x = entry.value("x", 0.5);
        hit_test.screen_y = entry.value("y", 0.5);

        if (entry.contains("error")) {
            hit_test.response = HitTestResponse::failure(entry.at("error").get<std::string>());
        } else {
            std::vector<HitCandidate> candidates;
            for (const nlohmann::json& candidate : entry.value("candidates", nlohmann::json::array())) {
                candidates.push_back(parseCandidate(candidate));
            }
            hit_test.response = HitTestResponse::hits(std::move(candidates));
        }
        hit_tests_.push_back(std::move(hit_test));
    }

    for (const nlohmann::json& entry : recording.value("frames", nlohmann::json::array())) {
        RecordedFrame frame;
        for (const nlohmann::json& update : entry.value("pose_updates", nlohmann::json::array())) {
            std::string id = update.at("id").get<std::string>();
            frame.pose_updates.emplace_back(id, parseTransform(update.at("transform"), "pose update '" + id + "'"));
        }
        frames_.push_back(std::move(frame));
    }
}

std::unique_ptr<ReplayBackend> ReplayBackend::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("could not open replay recording: " + path);
    }
    std::cout << "loading: " << path << std::endl;
    return std::make_unique<ReplayBackend>(nlohmann::json::parse(ifs));
}

HitCandidate ReplayBackend::parseCandidate(const nlohmann::json& j) {
    HitCandidate candidate;

    candidate.type = hitTypeFromString(j.at("type").get<std::string>());

    candidate.distance = j.value("distance", 0.0);
    if (!(candidate.distance >= 0.0)) {
        throw std::invalid_argument("hit distance must be non-negative");
    }

    candidate.surface_id = j.value("surface_id", std::string());
    candidate.anchor_pose = parseTransform(j.at("anchor_transform"), "anchor_transform");
    // Feature points often carry a single transform
    candidate.world_pose = j.contains("world_transform")
        ? parseTransform(j.at("world_transform"), "world_transform")
        : candidate.anchor_pose;

    return candidate;
}

Pose ReplayBackend::parseTransform(const nlohmann::json& j, const std::string& name) {
    std::vector<double> values = j.get<std::vector<double>>();
    if (values.size() != 16) {
        throw std::invalid_argument(name + " must have 16 values, got " + std::to_string(values.size()));
    }
    Eigen::Matrix4d T = utils::TransformUtils::fromColumnMajor(values.data());
    if (!utils::TransformUtils::validateTransformMatrix(T, name)) {
        throw std::invalid_argument("invalid " + name + " in replay recording");
    }
    return Pose::fromMatrix(T);
}

// ============================================================================
// TrackingBackend
// ============================================================================

void ReplayBackend::queryHitTest(double screen_x, double screen_y, HitTestCallback callback) {
    HitTestResponse response;
    if (hit_tests_.empty()) {
        response = HitTestResponse::failure("no recorded hit test left");
    } else {
        response = hit_tests_.front().response;
        hit_tests_.pop_front();
    }
    if (callback) {
        callback(response);
    }
}

void ReplayBackend::setPoseUpdateHandler(PoseUpdateHandler handler) {
    pose_update_handler_ = std::move(handler);
}

void ReplayBackend::clearPoseUpdateHandler() {
    pose_update_handler_ = nullptr;
}

void ReplayBackend::addAnchor(const std::string& anchor_id, const Pose& pose) {
    tracked_anchors_[anchor_id] = pose;
    if (pose_update_handler_) {
        pose_update_handler_(anchor_id, pose);
    }
}

void ReplayBackend::removeAnchor(const std::string& anchor_id) {
    tracked_anchors_.erase(anchor_id);
}

bool ReplayBackend::advanceFrame() {
    if (frames_.empty()) {
        return false;
    }

    RecordedFrame frame = std::move(frames_.front());
    frames_.pop_front();

    for (const auto& [id, pose] : frame.pose_updates) {
        // Recorded surfaces report even if nobody added them, like plane anchors
        tracked_anchors_[id] = pose;
        if (pose_update_handler_) {
            pose_update_handler_(id, pose);
        }
    }
    return true;
}

} // namespace anchorage
