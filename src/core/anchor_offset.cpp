#include <utility>
#include "anchorage/core/anchor_offset.h"

namespace anchorage {

  AnchorOffset::AnchorOffset() :
    anchor_id(),
    pose(Pose::Identity()) {
  }

  AnchorOffset::AnchorOffset(std::string anchor_id, Pose pose) :
    anchor_id(std::move(anchor_id)),
    pose(std::move(pose)) {
  }

  AnchorOffset AnchorOffset::between(const std::string& anchor_id, const Pose& anchor_pose, const Pose& target) {
    Eigen::Vector3d offset_position = target.position - anchor_pose.position;
    Eigen::Quaterniond offset_rotation = target.orientation * anchor_pose.orientation.inverse();
    return AnchorOffset(anchor_id, Pose(offset_position, offset_rotation));
  }

  Pose AnchorOffset::absolutePose(const Pose& anchor_pose) const {
    return Pose(anchor_pose.position + pose.position,
                pose.orientation * anchor_pose.orientation);
  }

}
