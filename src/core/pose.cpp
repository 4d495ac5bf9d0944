//
// pose.cpp - Position + quaternion rigid transform
//

#include "anchorage/core/pose.h"
#include "anchorage/core/utils/transform.h"

namespace anchorage {

  Pose::Pose() :
    position(Eigen::Vector3d::Zero()),
    orientation(Eigen::Quaterniond::Identity()) {
  }

  Pose::Pose(const Eigen::Vector3d& position, const Eigen::Quaterniond& orientation) :
    position(position),
    orientation(orientation.normalized()) {
  }

  Pose Pose::Identity() {
    return Pose();
  }

  Pose Pose::fromMatrix(const Eigen::Matrix4d& T) {
    Eigen::Quaterniond q(utils::TransformUtils::extractRotation(T));
    return Pose(utils::TransformUtils::extractPosition(T), q);
  }

  Eigen::Matrix4d Pose::toMatrix() const {
    return utils::TransformUtils::createTransform(position, orientation);
  }

  Pose Pose::operator*(const Pose& other) const {
    Pose result;
    result.position = position + orientation * other.position;
    result.orientation = (orientation * other.orientation).normalized();
    return result;
  }

  Pose Pose::inverse() const {
    Pose result;
    result.orientation = orientation.conjugate().normalized();
    result.position = -(result.orientation * position);
    return result;
  }

  Eigen::Vector3d Pose::transformPoint(const Eigen::Vector3d& point) const {
    return position + orientation * point;
  }

  bool Pose::isApprox(const Pose& other, double tolerance) const {
    if ((position - other.position).norm() > tolerance) {
      return false;
    }
    return orientation.angularDistance(other.orientation) <= tolerance;
  }

}
