#pragma once

// =============================================================================
// robot_monitoring / topic_names.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Centralized topic, action and frame names for the `robot_monitoring`
// package. Every node reads its default topic from here and exposes it as a
// `topics.*` parameter so launch files can remap without code changes.
//
// Data flow
// ---------
//   /odom, /scan, /goal_pose  -> monitor_*_node      -> /metrics
//   /proc                     -> health_metric_node  -> /metrics
//   /metrics                  -> metrics_collector_node -> metrics spool
//   /rosout                   -> log_forwarder_node  -> log spool
//   /map, poses               -> route_manager_node  -> navigate_to_pose
// =============================================================================

namespace robot_monitoring
{
namespace topic_names
{

// -----------------------------------------------------------------------------
// Telemetry
// -----------------------------------------------------------------------------
inline constexpr const char * kMetrics = "/metrics";
inline constexpr const char * kRosout  = "/rosout";

// -----------------------------------------------------------------------------
// Robot state inputs
// -----------------------------------------------------------------------------
inline constexpr const char * kOdom     = "/odom";
inline constexpr const char * kScan     = "/scan";
inline constexpr const char * kGoalPose = "/goal_pose";
inline constexpr const char * kMap      = "/map";

// -----------------------------------------------------------------------------
// Navigation
// -----------------------------------------------------------------------------
inline constexpr const char * kNavigateToPoseAction = "navigate_to_pose";
inline constexpr const char * kRouteStatus          = "/route_manager/status";

// -----------------------------------------------------------------------------
// Frame IDs
// -----------------------------------------------------------------------------
inline constexpr const char * kFrameMap = "map";

}  // namespace topic_names
}  // namespace robot_monitoring
