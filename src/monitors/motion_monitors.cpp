// =============================================================================
// robot_monitoring / src/monitors/motion_monitors.cpp (ROS 2 Jazzy)
// =============================================================================

#include "robot_monitoring/motion_monitors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace robot_monitoring
{

// -----------------------------------------------------------------------------
// SpeedMonitor
// -----------------------------------------------------------------------------
std::optional<SpeedSample> SpeedMonitor::update(double vx, double vy, double wz, double now_sec)
{
  if (!std::isfinite(vx) || !std::isfinite(vy) || !std::isfinite(wz)) {
    ++rejected_count_;
    return std::nullopt;
  }

  SpeedSample s;
  s.linear_speed_mps = std::hypot(vx, vy);
  s.angular_speed_radps = std::abs(wz);
  s.stamp_sec = now_sec;

  max_linear_speed_mps_ = std::max(max_linear_speed_mps_, s.linear_speed_mps);
  last_ = s;
  return s;
}

// -----------------------------------------------------------------------------
// Obstacle distance
// -----------------------------------------------------------------------------
std::optional<double> nearest_obstacle_distance(
  const std::vector<float> & ranges,
  float range_min,
  float range_max)
{
  // Unknown sensor limits accept anything non-negative.
  const float lo = std::isfinite(range_min) ? std::max(0.0f, range_min) : 0.0f;
  const float hi = (std::isfinite(range_max) && range_max > lo)
    ? range_max : std::numeric_limits<float>::max();

  std::optional<double> best;
  for (const float r : ranges) {
    if (!std::isfinite(r) || r < lo || r > hi) {
      continue;
    }
    if (!best || r < *best) {
      best = static_cast<double>(r);
    }
  }
  return best;
}

// -----------------------------------------------------------------------------
// GoalDistanceMonitor
// -----------------------------------------------------------------------------
GoalDistanceMonitor::GoalDistanceMonitor(const GoalDistanceConfig & cfg)
{
  set_config(cfg);
}

void GoalDistanceMonitor::set_config(const GoalDistanceConfig & cfg)
{
  config_ = cfg;
  if (!std::isfinite(config_.goal_reached_tolerance_m) || config_.goal_reached_tolerance_m < 0.0) {
    config_.goal_reached_tolerance_m = 0.25;
  }
}

bool GoalDistanceMonitor::set_goal(const Pose2D & goal)
{
  if (!GeometryMath::is_finite_pose(goal)) {
    return false;
  }
  goal_ = goal;
  reached_ = false;
  return true;
}

bool GoalDistanceMonitor::update_pose(const Pose2D & pose)
{
  if (!GeometryMath::is_finite_pose(pose)) {
    return false;
  }
  pose_ = pose;
  return true;
}

void GoalDistanceMonitor::clear_goal()
{
  goal_.reset();
  reached_ = false;
}

GoalDistanceStatus GoalDistanceMonitor::evaluate()
{
  GoalDistanceStatus s{};
  s.has_goal = goal_.has_value();
  s.has_pose = pose_.has_value();
  s.reached = reached_;

  if (!s.has_goal || !s.has_pose || reached_) {
    return s;
  }

  const double d = GeometryMath::planar_distance(*pose_, *goal_);
  if (d <= config_.goal_reached_tolerance_m) {
    reached_ = true;
    s.reached = true;
    s.became_reached = true;
    s.distance_m = 0.0;
    return s;
  }

  s.distance_m = d;
  return s;
}

}  // namespace robot_monitoring
