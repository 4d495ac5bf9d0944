#ifndef ANCHORAGE_CORE_UTILS_JSON_H
#define ANCHORAGE_CORE_UTILS_JSON_H

#include <stdexcept>
#include <string>
#include <vector>
#include <Eigen/Core>
#include <Eigen/Geometry>
#include <nlohmann/json.hpp>

namespace Eigen {

  // Matrices serialize column-major, the same flat layout backends report
  template< typename Scalar_, int Rows_, int Cols_ >
  static void to_json( nlohmann::json& j, const Matrix< Scalar_, Rows_, Cols_ >& mat )
  {
    j = std::vector<Scalar_>(mat.data(), mat.data() + mat.size());
  }

  template< typename Scalar_, int Rows_, int Cols_ >
  static void from_json( const nlohmann::json& j, Matrix< Scalar_, Rows_, Cols_ >& mat )
  {
    std::vector<Scalar_> values = j.get<std::vector<Scalar_>>();
    if (values.size() != static_cast<std::size_t>(Rows_ * Cols_)) {
      throw std::invalid_argument("expected " + std::to_string(Rows_ * Cols_) +
                                  " matrix values, got " + std::to_string(values.size()));
    }
    mat = Eigen::Map<const Eigen::Matrix<Scalar_, Rows_, Cols_>>(values.data());
  }

  // [x, y, z, w]
  template< typename Scalar_ >
  static void to_json( nlohmann::json& j, const Quaternion< Scalar_ >& q )
  {
    j = std::vector<Scalar_>{ q.x(), q.y(), q.z(), q.w() };
  }

  template< typename Scalar_ >
  static void from_json( const nlohmann::json& j, Quaternion< Scalar_ >& q )
  {
    std::vector<Scalar_> values = j.get<std::vector<Scalar_>>();
    if (values.size() != 4) {
      throw std::invalid_argument("expected quaternion [x, y, z, w], got " +
                                  std::to_string(values.size()) + " values");
    }
    q = Eigen::Quaternion<Scalar_>(values[3], values[0], values[1], values[2]);
  }

}

#endif /* ANCHORAGE_CORE_UTILS_JSON_H */
