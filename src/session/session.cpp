//
// Session.cpp - Backend, registry, resolver and synchronizer wiring
//
// COORDINATE CONVENTIONS:
// - T_tracker_from_anchor: registry pose, native backend pose lifted by vertical_offset
// - T_native_from_anchor: pose as the backend reports it

#include "anchorage/session/session.h"
#include "anchorage/tracking/hit_picking/hit_picker.h"
#include <iostream>
#include <stdexcept>

namespace anchorage {

namespace {

const SessionConfig& validated(const SessionConfig& config) {
    if (!config.isValid()) {
        throw std::invalid_argument("Invalid Session configuration");
    }
    return config;
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

Session::Session(TrackingBackend& backend, const SessionConfig& config)
    : backend_(backend)
    , config_(validated(config))
    , tracker_space_(CoordinateSpace::createRoot("tracker"))
    , synchronizer_(registry_, config_.stale_after_frames, config_.enable_debug_output)
    , resolver_(backend_, registry_, tracker_space_, config_.createHitPicker(), config_) {

    backend_.setPoseUpdateHandler([this](const std::string& anchor_id, const Pose& pose) {
        synchronizer_.enqueue(anchor_id, fromBackend(pose));
    });

    if (config_.enable_debug_output) {
        std::cout << "Session started with " << backend_.name() << " backend" << std::endl;
    }
}

Session::~Session() {
    backend_.clearPoseUpdateHandler();
}

// ============================================================================
// Spaces
// ============================================================================

std::shared_ptr<CoordinateSpace> Session::createSpace(const std::string& name,
                                                      const std::shared_ptr<CoordinateSpace>& parent,
                                                      const Pose& pose_in_parent) {
    return CoordinateSpace::createChild(name, parent ? parent : tracker_space_, pose_in_parent);
}

// ============================================================================
// Anchors
// ============================================================================

void Session::findAnchor(double screen_x, double screen_y,
                         const CoordinateSpace& active_space,
                         AnchorResolver::ResolveCallback callback) {
    resolver_.resolveHit(screen_x, screen_y, active_space, std::move(callback));
}

std::string Session::addAnchor(const Pose& pose, const CoordinateSpace& space, const std::string& id) {
    Pose T_tracker_from_anchor = CoordinateSpace::transformPose(pose, space, *tracker_space_);

    Anchor& anchor = id.empty()
        ? registry_.create(T_tracker_from_anchor)
        : registry_.create(T_tracker_from_anchor, id);

    backend_.addAnchor(anchor.id, toBackend(T_tracker_from_anchor));

    if (config_.enable_debug_output) {
        std::cout << "Session: added anchor '" << anchor.id << "' from space '"
                  << space.name() << "'" << std::endl;
    }
    return anchor.id;
}

void Session::removeAnchor(const std::string& id) {
    if (!registry_.contains(id)) {
        return;
    }
    registry_.remove(id);
    backend_.removeAnchor(id);

    if (config_.enable_debug_output) {
        std::cout << "Session: removed anchor '" << id << "'" << std::endl;
    }
}

AnchorSynchronizer::UpdateSummary Session::update() {
    return synchronizer_.processUpdates();
}

bool Session::resolveOffset(const AnchorOffset& offset, const CoordinateSpace& target_space, Pose& pose) const {
    const Anchor* anchor = registry_.get(offset.anchor_id);
    if (anchor == nullptr) {
        return false;
    }
    Pose T_tracker_from_target = offset.absolutePose(anchor->pose);
    pose = CoordinateSpace::transformPose(T_tracker_from_target, *tracker_space_, target_space);
    return true;
}

// ============================================================================
// Vertical Offset
// ============================================================================

Pose Session::toBackend(const Pose& pose) const {
    Pose native = pose;
    native.position.y() -= config_.vertical_offset;
    return native;
}

Pose Session::fromBackend(const Pose& pose) const {
    Pose lifted = pose;
    lifted.position.y() += config_.vertical_offset;
    return lifted;
}

} // namespace anchorage
