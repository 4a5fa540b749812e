#pragma once

// =============================================================================
// robot_monitoring / motion_monitors.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// ROS-independent computations behind the three motion telemetry nodes:
//
//   - SpeedMonitor            (odom twist -> linear / angular speed)
//   - nearest_obstacle_distance (laser ranges -> closest valid return)
//   - GoalDistanceMonitor     (goal + pose -> remaining planar distance)
//
// Design note
// -----------
// Nodes convert ROS messages into plain values, call these helpers, and turn
// the results into MetricDatum samples. Invalid input never produces a value;
// it yields std::nullopt and the node skips that publish cycle.
// =============================================================================

#include <cstdint>
#include <optional>
#include <vector>

#include "robot_monitoring/geometry_math.hpp"

namespace robot_monitoring
{

// -----------------------------------------------------------------------------
// Speed
// -----------------------------------------------------------------------------
struct SpeedSample
{
  double linear_speed_mps {0.0};    // hypot(vx, vy)
  double angular_speed_radps {0.0}; // |wz|
  double stamp_sec {0.0};
};

class SpeedMonitor
{
public:
  // Returns std::nullopt (and counts a rejection) if any input is non-finite.
  std::optional<SpeedSample> update(double vx, double vy, double wz, double now_sec);

  const std::optional<SpeedSample> & last() const { return last_; }
  double max_linear_speed_mps() const { return max_linear_speed_mps_; }
  std::uint64_t rejected_count() const { return rejected_count_; }

private:
  std::optional<SpeedSample> last_;
  double max_linear_speed_mps_ {0.0};
  std::uint64_t rejected_count_ {0};
};

// -----------------------------------------------------------------------------
// Obstacle distance
// -----------------------------------------------------------------------------
// Smallest finite range within [range_min, range_max]. Returns std::nullopt if
// the scan holds no valid return (all inf / nan / out of sensor limits).
std::optional<double> nearest_obstacle_distance(
  const std::vector<float> & ranges,
  float range_min,
  float range_max);

// -----------------------------------------------------------------------------
// Goal distance
// -----------------------------------------------------------------------------
struct GoalDistanceConfig
{
  double goal_reached_tolerance_m {0.25};
};

struct GoalDistanceStatus
{
  bool has_goal {false};
  bool has_pose {false};
  bool reached {false};
  bool became_reached {false};  // true only on the evaluate() that crossed the tolerance
  std::optional<double> distance_m;
};

class GoalDistanceMonitor
{
public:
  GoalDistanceMonitor() = default;
  explicit GoalDistanceMonitor(const GoalDistanceConfig & cfg);

  void set_config(const GoalDistanceConfig & cfg);

  // Replaces the active goal and clears the reached latch.
  // Returns false (goal unchanged) if the pose is not finite.
  bool set_goal(const Pose2D & goal);
  bool update_pose(const Pose2D & pose);
  void clear_goal();

  // Reached goals report distance 0 on the crossing update, then no distance
  // until a new goal is set.
  GoalDistanceStatus evaluate();

  const std::optional<Pose2D> & goal() const { return goal_; }

private:
  GoalDistanceConfig config_ {};
  std::optional<Pose2D> goal_;
  std::optional<Pose2D> pose_;
  bool reached_ {false};
};

}  // namespace robot_monitoring
