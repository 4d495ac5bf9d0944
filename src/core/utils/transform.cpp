//
// transform.cpp - Rigid transform checks and conversions
//

#include "anchorage/core/utils/transform.h"
#include <iostream>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace anchorage {
namespace utils {

// ============================================================================
// Validation
// ============================================================================

bool TransformUtils::validateTransformMatrix(const Eigen::Matrix4d& T, const std::string& label) {
    if (!T.allFinite()) {
        std::cout << "WARNING: " << label << " has NaN or infinite entries" << std::endl;
        return false;
    }

    Eigen::RowVector4d bottom = T.row(3);
    if ((bottom - Eigen::RowVector4d(0, 0, 0, 1)).cwiseAbs().maxCoeff() > BOTTOM_ROW_TOLERANCE) {
        std::cout << "WARNING: " << label << " is not homogeneous, bottom row is ["
                  << bottom << "]" << std::endl;
        return false;
    }

    Eigen::Matrix3d R = extractRotation(T);
    double drift = (R * R.transpose() - Eigen::Matrix3d::Identity()).cwiseAbs().maxCoeff();
    if (drift > ROTATION_TOLERANCE) {
        std::cout << "WARNING: " << label << " rotation is scaled or sheared (drift "
                  << drift << ")" << std::endl;
        return false;
    }

    // Proper rotations only
    if (R.determinant() < 0.0) {
        std::cout << "WARNING: " << label << " rotation is a reflection" << std::endl;
        return false;
    }

    return true;
}

// ============================================================================
// Debug Output
// ============================================================================

void TransformUtils::printTransform(const Eigen::Matrix4d& T, const std::string& label) {
    Eigen::Vector3d t = extractPosition(T);
    Eigen::Quaterniond q(extractRotation(T));
    double degrees = Eigen::AngleAxisd(q).angle() * 180.0 / M_PI;

    std::cout << label << ":" << std::endl
              << "  position:    (" << t.x() << ", " << t.y() << ", " << t.z() << ")" << std::endl
              << "  orientation: xyzw(" << q.x() << ", " << q.y() << ", " << q.z() << ", " << q.w()
              << "), " << degrees << " deg" << std::endl;
}

bool TransformUtils::isApproximatelyEqual(const Eigen::Matrix4d& A,
                                          const Eigen::Matrix4d& B,
                                          double tolerance) {
    return (A - B).cwiseAbs().maxCoeff() <= tolerance;
}

// ============================================================================
// Components
// ============================================================================

Eigen::Vector3d TransformUtils::extractPosition(const Eigen::Matrix4d& T) {
    return T.topRightCorner<3,1>();
}

Eigen::Matrix3d TransformUtils::extractRotation(const Eigen::Matrix4d& T) {
    return T.topLeftCorner<3,3>();
}

Eigen::Matrix4d TransformUtils::createTransform(const Eigen::Vector3d& position,
                                                const Eigen::Matrix3d& rotation) {
    Eigen::Isometry3d iso = Eigen::Isometry3d::Identity();
    iso.linear() = rotation;
    iso.translation() = position;
    return iso.matrix();
}

Eigen::Matrix4d TransformUtils::createTransform(const Eigen::Vector3d& position,
                                                const Eigen::Quaterniond& orientation) {
    return createTransform(position, orientation.normalized().toRotationMatrix());
}

Eigen::Matrix4d TransformUtils::fromColumnMajor(const double* values) {
    return Eigen::Map<const Eigen::Matrix4d>(values);
}

} // namespace utils
} // namespace anchorage
