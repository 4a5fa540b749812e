#pragma once

// =============================================================================
// robot_monitoring / geometry_math.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Small planar geometry helpers shared by the goal-distance monitor and the
// route manager:
//   - planar pose container
//   - angle wrapping
//   - yaw from a quaternion
//   - planar distance
//
// Design note
// -----------
// Kept independent from ROS message types. Nodes copy message fields into
// Pose2D / Quaternion.
// =============================================================================

#include <cmath>

namespace robot_monitoring
{

struct Pose2D
{
  double x {0.0};    // m
  double y {0.0};    // m
  double yaw {0.0};  // rad
};

struct Quaternion
{
  double x {0.0};
  double y {0.0};
  double z {0.0};
  double w {1.0};
};

class GeometryMath
{
public:
  static constexpr double kPi    = 3.1415926535897932384626433832795;
  static constexpr double kTwoPi = 2.0 * kPi;

  // Wrap any angle to [-pi, pi]
  static inline double wrap_angle_rad(double angle_rad)
  {
    if (!std::isfinite(angle_rad)) {
      return 0.0;
    }
    angle_rad = std::fmod(angle_rad + kPi, kTwoPi);
    if (angle_rad < 0.0) {
      angle_rad += kTwoPi;
    }
    return angle_rad - kPi;
  }

  // Yaw (rotation about z) of a unit quaternion.
  static inline double yaw_from_quaternion(const Quaternion & q)
  {
    const double siny_cosp = 2.0 * (q.w * q.z + q.x * q.y);
    const double cosy_cosp = 1.0 - 2.0 * (q.y * q.y + q.z * q.z);
    return std::atan2(siny_cosp, cosy_cosp);
  }

  static inline double planar_distance(const Pose2D & a, const Pose2D & b)
  {
    return std::hypot(b.x - a.x, b.y - a.y);
  }

  static inline bool is_finite_pose(const Pose2D & p)
  {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.yaw);
  }
};

}  // namespace robot_monitoring
