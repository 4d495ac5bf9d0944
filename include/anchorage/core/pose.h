#ifndef ANCHORAGE_CORE_POSE_H
#define ANCHORAGE_CORE_POSE_H

#include <Eigen/Core>
#include <Eigen/Geometry>
#include "anchorage/core/utils/json.h"

namespace anchorage {

  /**
   * Rigid transform stored as position + unit quaternion.
   * Composition renormalizes the quaternion so long chains of small
   * rotations do not drift off the unit sphere.
   */
  struct Pose {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    Eigen::Vector3d position;
    Eigen::Quaterniond orientation;

    Pose();
    Pose(const Eigen::Vector3d& position, const Eigen::Quaterniond& orientation);

    static Pose Identity();
    static Pose fromMatrix(const Eigen::Matrix4d& T);

    Eigen::Matrix4d toMatrix() const;

    // this * other: apply other first, then this
    Pose operator*(const Pose& other) const;
    Pose inverse() const;

    Eigen::Vector3d transformPoint(const Eigen::Vector3d& point) const;

    bool isApprox(const Pose& other, double tolerance = 1e-9) const;
  };

  inline void to_json(nlohmann::json& j, const Pose& pose) {
    j = nlohmann::json{ {"position", pose.position}, {"orientation", pose.orientation} };
  }

  inline void from_json(const nlohmann::json& j, Pose& pose) {
    pose = Pose(j.at("position").get<Eigen::Vector3d>(),
                j.at("orientation").get<Eigen::Quaterniond>());
  }

}

#endif /* ANCHORAGE_CORE_POSE_H */
