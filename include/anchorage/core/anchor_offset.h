#ifndef ANCHORAGE_CORE_ANCHOR_OFFSET_H
#define ANCHORAGE_CORE_ANCHOR_OFFSET_H

#include <string>
#include "anchorage/core/utils/json.h"
#include "anchorage/core/pose.h"

namespace anchorage {

  /**
   * Pose attached to an anchor by id.
   *
   * The offset translation is a tracker-space displacement from the anchor
   * origin and the offset rotation is applied on top of the anchor's
   * rotation, so:
   *   absolute.position    = anchor.position + offset.position
   *   absolute.orientation = offset.orientation * anchor.orientation
   */
  struct AnchorOffset {
    std::string anchor_id;
    Pose pose;

    AnchorOffset();
    AnchorOffset(std::string anchor_id, Pose pose);

    /**
     * Build the offset that places target relative to anchor_pose
     */
    static AnchorOffset between(const std::string& anchor_id, const Pose& anchor_pose, const Pose& target);

    Pose absolutePose(const Pose& anchor_pose) const;
  };

  NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AnchorOffset, anchor_id, pose)
}

#endif /* ANCHORAGE_CORE_ANCHOR_OFFSET_H */
