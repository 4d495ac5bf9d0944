#ifndef ANCHORAGE_CORE_UTILS_TRANSFORM_H
#define ANCHORAGE_CORE_UTILS_TRANSFORM_H

#include <Eigen/Core>
#include <Eigen/Geometry>
#include <string>

namespace anchorage {
namespace utils {

/**
 * Helpers for 4x4 rigid transforms as backends hand them over
 * (column-major, translation in the last column)
 */
class TransformUtils {
public:
    /**
     * Check that T is rigid: finite entries, [0 0 0 1] bottom row, proper
     * rotation (orthonormal, det +1). Logs a WARNING naming the first
     * failed check.
     * @param label Shown in the warning
     */
    static bool validateTransformMatrix(const Eigen::Matrix4d& T, const std::string& label = "transform");

    /**
     * Dump translation and rotation (quaternion + angle) to stdout
     */
    static void printTransform(const Eigen::Matrix4d& T, const std::string& label = "transform");

    /**
     * Largest elementwise difference is within tolerance
     */
    static bool isApproximatelyEqual(const Eigen::Matrix4d& A,
                                     const Eigen::Matrix4d& B,
                                     double tolerance = 1e-6);

    static Eigen::Vector3d extractPosition(const Eigen::Matrix4d& T);
    static Eigen::Matrix3d extractRotation(const Eigen::Matrix4d& T);

    static Eigen::Matrix4d createTransform(const Eigen::Vector3d& position,
                                           const Eigen::Matrix3d& rotation);

    // Quaternion is normalized first
    static Eigen::Matrix4d createTransform(const Eigen::Vector3d& position,
                                           const Eigen::Quaterniond& orientation);

    /**
     * @param values 16 doubles, column-major
     */
    static Eigen::Matrix4d fromColumnMajor(const double* values);

private:
    static constexpr double BOTTOM_ROW_TOLERANCE = 1e-6;
    static constexpr double ROTATION_TOLERANCE = 1e-4;
};

} // namespace utils
} // namespace anchorage

#endif /* ANCHORAGE_CORE_UTILS_TRANSFORM_H */
