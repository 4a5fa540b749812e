// =============================================================================
// robot_monitoring / src/nodes/monitor_speed_node.cpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Publishes robot speed telemetry derived from odometry.
//
//   /odom (nav_msgs/Odometry) -> monitor_speed_node -> /metrics
//
// Metrics
// -------
//   linear_speed   MetersPerSecond   hypot(twist.linear.x, twist.linear.y)
//   angular_speed  RadiansPerSecond  |twist.angular.z|
//
// Notes
// -----
// - Metrics are published on a timer, not per odom message, so a 50 Hz odom
//   source does not flood the metrics store.
// - Nothing is published while /odom is stale.
// =============================================================================

#include <chrono>
#include <cmath>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "nav_msgs/msg/odometry.hpp"
#include "rclcpp/rclcpp.hpp"

#include "robot_monitoring/metric.hpp"
#include "robot_monitoring/metric_msgs.hpp"
#include "robot_monitoring/motion_monitors.hpp"
#include "robot_monitoring/stream_watchdog.hpp"
#include "robot_monitoring/topic_names.hpp"

namespace robot_monitoring
{

class MonitorSpeedNode : public rclcpp::Node
{
public:
  MonitorSpeedNode()
  : Node("monitor_speed_node")
  {
    topic_odom_ = this->declare_parameter<std::string>("topics.odom", topic_names::kOdom);
    topic_metrics_ = this->declare_parameter<std::string>("topics.metrics", topic_names::kMetrics);

    publish_rate_hz_ = this->declare_parameter<double>("publish_rate_hz", 1.0);
    input_timeout_sec_ = this->declare_parameter<double>("input_timeout_sec", 1.0);
    publish_angular_speed_ = this->declare_parameter<bool>("publish_angular_speed", true);
    log_stale_warn_throttle_ms_ = this->declare_parameter<int>("log.stale_warn_throttle_ms", 5000);

    sanitize_params_();
    builder_.set_config(declare_metric_builder_params(*this));

    StreamWatchdogConfig wd_cfg{};
    wd_cfg.timeout_sec = input_timeout_sec_;
    wd_cfg.startup_grace_sec = 2.0;
    odom_watchdog_.set_config(wd_cfg);
    odom_watchdog_.start(this->now().seconds());

    pub_metrics_ = this->create_publisher<msg::MetricList>(topic_metrics_, rclcpp::QoS(10));

    sub_odom_ = this->create_subscription<nav_msgs::msg::Odometry>(
      topic_odom_, rclcpp::SensorDataQoS(),
      std::bind(&MonitorSpeedNode::on_odom_, this, std::placeholders::_1));

    const auto period = std::chrono::duration<double>(1.0 / publish_rate_hz_);
    timer_ = this->create_wall_timer(
      std::chrono::duration_cast<std::chrono::milliseconds>(period),
      std::bind(&MonitorSpeedNode::on_timer_, this));

    RCLCPP_INFO(
      this->get_logger(),
      "monitor_speed_node started | in=%s out=%s | rate=%.2f Hz | timeout=%.2fs | robot_id=%s",
      topic_odom_.c_str(), topic_metrics_.c_str(), publish_rate_hz_, input_timeout_sec_,
      builder_.config().robot_id.c_str());
  }

private:
  void on_odom_(const nav_msgs::msg::Odometry::SharedPtr msg)
  {
    if (!msg) {
      return;
    }
    last_twist_ = msg->twist.twist;
    odom_watchdog_.update(this->now().seconds());
  }

  void on_timer_()
  {
    const double now_sec = this->now().seconds();
    const StreamWatchdogStatus wd = odom_watchdog_.check(now_sec);

    if (wd.became_fresh) {
      RCLCPP_INFO(this->get_logger(), "odom stream is live on %s", topic_odom_.c_str());
    }
    if (!wd.fresh) {
      if (!wd.in_startup_grace) {
        RCLCPP_WARN_THROTTLE(
          this->get_logger(), *this->get_clock(), log_stale_warn_throttle_ms_,
          "odom %s on %s (timeout=%.2fs), speed metrics paused",
          wd.has_seen_update ? "stale" : "missing", topic_odom_.c_str(), input_timeout_sec_);
      }
      return;
    }

    const auto sample = monitor_.update(
      last_twist_.linear.x, last_twist_.linear.y, last_twist_.angular.z, now_sec);
    if (!sample) {
      RCLCPP_WARN_THROTTLE(
        this->get_logger(), *this->get_clock(), log_stale_warn_throttle_ms_,
        "non-finite odom twist ignored (%lu so far)",
        static_cast<unsigned long>(monitor_.rejected_count()));
      return;
    }

    std::vector<MetricDatum> out;
    if (auto d = builder_.make(
        metric_names::kLinearSpeed, sample->linear_speed_mps, units::kMetersPerSecond, now_sec))
    {
      out.push_back(*d);
    }
    if (publish_angular_speed_) {
      if (auto d = builder_.make(
          metric_names::kAngularSpeed, sample->angular_speed_radps, units::kRadiansPerSecond,
          now_sec))
      {
        out.push_back(*d);
      }
    }
    if (out.empty()) {
      return;
    }

    pub_metrics_->publish(to_list_msg(out));

    RCLCPP_DEBUG(
      this->get_logger(), "speed: linear=%.3f m/s angular=%.3f rad/s",
      sample->linear_speed_mps, sample->angular_speed_radps);
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
    if (topic_odom_.empty()) topic_odom_ = topic_names::kOdom;
    if (topic_metrics_.empty()) topic_metrics_ = topic_names::kMetrics;
  }

private:
  rclcpp::Publisher<msg::MetricList>::SharedPtr pub_metrics_;
  rclcpp::Subscription<nav_msgs::msg::Odometry>::SharedPtr sub_odom_;
  rclcpp::TimerBase::SharedPtr timer_;

  std::string topic_odom_;
  std::string topic_metrics_;

  double publish_rate_hz_{1.0};
  double input_timeout_sec_{1.0};
  bool publish_angular_speed_{true};
  int log_stale_warn_throttle_ms_{5000};

  MetricBuilder builder_{};
  SpeedMonitor monitor_{};
  StreamWatchdog odom_watchdog_{};
  geometry_msgs::msg::Twist last_twist_{};
};

}  // namespace robot_monitoring

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  int rc = 0;
  try {
    rclcpp::spin(std::make_shared<robot_monitoring::MonitorSpeedNode>());
  } catch (const std::exception & e) {
    std::fprintf(stderr, "[monitor_speed_node] FATAL: %s\n", e.what());
    rc = 1;
  }
  rclcpp::shutdown();
  return rc;
}
