// =============================================================================
// robot_monitoring / src/nodes/monitor_distance_to_goal_node.cpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Publishes the remaining planar distance between the robot and its current
// navigation goal.
//
//   /goal_pose (geometry_msgs/PoseStamped) --+
//                                            +-> monitor_distance_to_goal_node -> /metrics
//   /odom      (nav_msgs/Odometry)         --+
//
// Metric
// ------
//   distance_to_goal  Meters
//
// Behavior
// --------
// - No goal yet -> nothing published.
// - When the distance drops below goal_reached_tolerance_m a final 0.0 sample
//   is published and the node goes quiet until the next goal arrives.
// - The goal and the pose are expected in the same frame. A frame mismatch is
//   reported (throttled) but not transformed.
// =============================================================================

#include <chrono>
#include <cmath>
#include <cstdio>
#include <memory>
#include <string>

#include "geometry_msgs/msg/pose_stamped.hpp"
#include "nav_msgs/msg/odometry.hpp"
#include "rclcpp/rclcpp.hpp"

#include "robot_monitoring/geometry_math.hpp"
#include "robot_monitoring/metric.hpp"
#include "robot_monitoring/metric_msgs.hpp"
#include "robot_monitoring/motion_monitors.hpp"
#include "robot_monitoring/stream_watchdog.hpp"
#include "robot_monitoring/topic_names.hpp"

namespace robot_monitoring
{

namespace
{

Pose2D to_pose2d(const geometry_msgs::msg::Pose & p)
{
  Quaternion q;
  q.x = p.orientation.x;
  q.y = p.orientation.y;
  q.z = p.orientation.z;
  q.w = p.orientation.w;

  Pose2D out;
  out.x = p.position.x;
  out.y = p.position.y;
  out.yaw = GeometryMath::yaw_from_quaternion(q);
  return out;
}

}  // namespace

class MonitorDistanceToGoalNode : public rclcpp::Node
{
public:
  MonitorDistanceToGoalNode()
  : Node("monitor_distance_to_goal_node")
  {
    topic_goal_ = this->declare_parameter<std::string>("topics.goal_pose", topic_names::kGoalPose);
    topic_odom_ = this->declare_parameter<std::string>("topics.odom", topic_names::kOdom);
    topic_metrics_ = this->declare_parameter<std::string>("topics.metrics", topic_names::kMetrics);

    publish_rate_hz_ = this->declare_parameter<double>("publish_rate_hz", 1.0);
    input_timeout_sec_ = this->declare_parameter<double>("input_timeout_sec", 1.0);

    GoalDistanceConfig goal_cfg{};
    goal_cfg.goal_reached_tolerance_m =
      this->declare_parameter<double>("goal_reached_tolerance_m", goal_cfg.goal_reached_tolerance_m);
    monitor_.set_config(goal_cfg);

    log_stale_warn_throttle_ms_ = this->declare_parameter<int>("log.stale_warn_throttle_ms", 5000);

    sanitize_params_();
    builder_.set_config(declare_metric_builder_params(*this));

    StreamWatchdogConfig wd_cfg{};
    wd_cfg.timeout_sec = input_timeout_sec_;
    pose_watchdog_.set_config(wd_cfg);

    pub_metrics_ = this->create_publisher<msg::MetricList>(topic_metrics_, rclcpp::QoS(10));

    sub_goal_ = this->create_subscription<geometry_msgs::msg::PoseStamped>(
      topic_goal_, rclcpp::QoS(10),
      std::bind(&MonitorDistanceToGoalNode::on_goal_, this, std::placeholders::_1));

    sub_odom_ = this->create_subscription<nav_msgs::msg::Odometry>(
      topic_odom_, rclcpp::SensorDataQoS(),
      std::bind(&MonitorDistanceToGoalNode::on_odom_, this, std::placeholders::_1));

    const auto period = std::chrono::duration<double>(1.0 / publish_rate_hz_);
    timer_ = this->create_wall_timer(
      std::chrono::duration_cast<std::chrono::milliseconds>(period),
      std::bind(&MonitorDistanceToGoalNode::on_timer_, this));

    RCLCPP_INFO(
      this->get_logger(),
      "monitor_distance_to_goal_node started | goal=%s pose=%s out=%s | rate=%.2f Hz | tol=%.2fm",
      topic_goal_.c_str(), topic_odom_.c_str(), topic_metrics_.c_str(), publish_rate_hz_,
      goal_cfg.goal_reached_tolerance_m);
  }

private:
  void on_goal_(const geometry_msgs::msg::PoseStamped::SharedPtr msg)
  {
    if (!msg) {
      return;
    }
    const Pose2D goal = to_pose2d(msg->pose);
    if (!monitor_.set_goal(goal)) {
      RCLCPP_WARN(this->get_logger(), "ignoring goal with non-finite pose");
      return;
    }
    goal_frame_ = msg->header.frame_id;
    RCLCPP_INFO(
      this->get_logger(), "new goal (%.2f, %.2f) in frame '%s'",
      goal.x, goal.y, goal_frame_.c_str());
  }

  void on_odom_(const nav_msgs::msg::Odometry::SharedPtr msg)
  {
    if (!msg) {
      return;
    }
    if (monitor_.update_pose(to_pose2d(msg->pose.pose))) {
      pose_frame_ = msg->header.frame_id;
      pose_watchdog_.update(this->now().seconds());
    }
  }

  void on_timer_()
  {
    const double now_sec = this->now().seconds();
    if (!monitor_.goal()) {
      return;
    }

    if (!pose_watchdog_.is_fresh(now_sec)) {
      RCLCPP_WARN_THROTTLE(
        this->get_logger(), *this->get_clock(), log_stale_warn_throttle_ms_,
        "pose stale on %s while a goal is active, goal distance paused", topic_odom_.c_str());
      return;
    }

    if (!goal_frame_.empty() && !pose_frame_.empty() && goal_frame_ != pose_frame_) {
      RCLCPP_WARN_THROTTLE(
        this->get_logger(), *this->get_clock(), log_stale_warn_throttle_ms_,
        "goal frame '%s' differs from pose frame '%s', distance is approximate",
        goal_frame_.c_str(), pose_frame_.c_str());
    }

    const GoalDistanceStatus s = monitor_.evaluate();
    if (!s.distance_m) {
      return;
    }

    const auto d = builder_.make(metric_names::kDistanceToGoal, *s.distance_m, units::kMeters, now_sec);
    if (!d) {
      return;
    }
    pub_metrics_->publish(to_list_msg({*d}));

    if (s.became_reached) {
      RCLCPP_INFO(this->get_logger(), "goal reached, distance metric idle until next goal");
    }
  }

  void sanitize_params_()
  {
    if (!std::isfinite(publish_rate_hz_) || publish_rate_hz_ <= 0.0) {
      publish_rate_hz_ = 1.0;
    }
    if (!std::isfinite(input_timeout_sec_) || input_timeout_sec_ <= 0.0) {
      input_timeout_sec_ = 1.0;
    }
    if (log_stale_warn_throttle_ms_ < 0) {
      log_stale_warn_throttle_ms_ = 5000;
    }
    if (topic_goal_.empty()) topic_goal_ = topic_names::kGoalPose;
    if (topic_odom_.empty()) topic_odom_ = topic_names::kOdom;
    if (topic_metrics_.empty()) topic_metrics_ = topic_names::kMetrics;
  }

private:
  rclcpp::Publisher<msg::MetricList>::SharedPtr pub_metrics_;
  rclcpp::Subscription<geometry_msgs::msg::PoseStamped>::SharedPtr sub_goal_;
  rclcpp::Subscription<nav_msgs::msg::Odometry>::SharedPtr sub_odom_;
  rclcpp::TimerBase::SharedPtr timer_;

  std::string topic_goal_;
  std::string topic_odom_;
  std::string topic_metrics_;

  double publish_rate_hz_{1.0};
  double input_timeout_sec_{1.0};
  int log_stale_warn_throttle_ms_{5000};

  MetricBuilder builder_{};
  GoalDistanceMonitor monitor_{};
  StreamWatchdog pose_watchdog_{};
  std::string goal_frame_;
  std::string pose_frame_;
};

}  // namespace robot_monitoring

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  int rc = 0;
  try {
    rclcpp::spin(std::make_shared<robot_monitoring::MonitorDistanceToGoalNode>());
  } catch (const std::exception & e) {
    std::fprintf(stderr, "[monitor_distance_to_goal_node] FATAL: %s\n", e.what());
    rc = 1;
  }
  rclcpp::shutdown();
  return rc;
}
