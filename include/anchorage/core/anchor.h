#ifndef ANCHORAGE_CORE_ANCHOR_H
#define ANCHORAGE_CORE_ANCHOR_H

#include <string>
#include "anchorage/core/utils/json.h"
#include "anchorage/core/pose.h"

namespace anchorage {

  struct Anchor {
    public:
      enum class TrackingState {
        PENDING,   // created locally, backend has not confirmed it yet
        TRACKED,   // backend is reporting pose updates
        STALE,     // backend stopped reporting (e.g. surface lost)
        REMOVED    // terminal
      };

      std::string id;
      Pose pose;  // always in tracker space
      TrackingState state;
      std::size_t frames_since_update;

      Anchor();
      Anchor(std::string id, Pose pose);

      bool isTracked() const { return state == TrackingState::TRACKED; }
  };

  const char* toString(Anchor::TrackingState state);

  NLOHMANN_JSON_SERIALIZE_ENUM(Anchor::TrackingState, {
    {Anchor::TrackingState::PENDING, "pending"},
    {Anchor::TrackingState::TRACKED, "tracked"},
    {Anchor::TrackingState::STALE, "stale"},
    {Anchor::TrackingState::REMOVED, "removed"},
  })

  NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Anchor, id, pose, state)
}

#endif /* ANCHORAGE_CORE_ANCHOR_H */
