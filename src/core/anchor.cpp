#include <utility>
#include "anchorage/core/anchor.h"

namespace anchorage {

  Anchor::Anchor() :
    id(),
    pose(Pose::Identity()),
    state(TrackingState::PENDING),
    frames_since_update(0) {
  }

  Anchor::Anchor(std::string id, Pose pose) :
    id(std::move(id)),
    pose(std::move(pose)),
    state(TrackingState::PENDING),
    frames_since_update(0) {
  }

  const char* toString(Anchor::TrackingState state) {
    switch (state) {
      case Anchor::TrackingState::PENDING: return "pending";
      case Anchor::TrackingState::TRACKED: return "tracked";
      case Anchor::TrackingState::STALE: return "stale";
      case Anchor::TrackingState::REMOVED: return "removed";
    }
    return "unknown";
  }

}
