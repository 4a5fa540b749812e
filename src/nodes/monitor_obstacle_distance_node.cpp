// =============================================================================
// robot_monitoring / src/nodes/monitor_obstacle_distance_node.cpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Publishes the distance to the nearest obstacle seen by the laser scanner.
//
//   /scan (sensor_msgs/LaserScan) -> monitor_obstacle_distance_node -> /metrics
//
// Metric
// ------
//   nearest_obstacle_distance  Meters  min valid range of the latest scan
//
// A scan with no valid return (open space, all inf) produces no sample.
// =============================================================================

#include <chrono>
#include <cmath>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>

#include "rclcpp/rclcpp.hpp"
#include "sensor_msgs/msg/laser_scan.hpp"

#include "robot_monitoring/metric.hpp"
#include "robot_monitoring/metric_msgs.hpp"
#include "robot_monitoring/motion_monitors.hpp"
#include "robot_monitoring/stream_watchdog.hpp"
#include "robot_monitoring/topic_names.hpp"

namespace robot_monitoring
{

class MonitorObstacleDistanceNode : public rclcpp::Node
{
public:
  MonitorObstacleDistanceNode()
  : Node("monitor_obstacle_distance_node")
  {
    topic_scan_ = this->declare_parameter<std::string>("topics.scan", topic_names::kScan);
    topic_metrics_ = this->declare_parameter<std::string>("topics.metrics", topic_names::kMetrics);

    publish_rate_hz_ = this->declare_parameter<double>("publish_rate_hz", 1.0);
    input_timeout_sec_ = this->declare_parameter<double>("input_timeout_sec", 1.0);
    log_stale_warn_throttle_ms_ = this->declare_parameter<int>("log.stale_warn_throttle_ms", 5000);

    sanitize_params_();
    builder_.set_config(declare_metric_builder_params(*this));

    StreamWatchdogConfig wd_cfg{};
    wd_cfg.timeout_sec = input_timeout_sec_;
    wd_cfg.startup_grace_sec = 2.0;
    scan_watchdog_.set_config(wd_cfg);
    scan_watchdog_.start(this->now().seconds());

    pub_metrics_ = this->create_publisher<msg::MetricList>(topic_metrics_, rclcpp::QoS(10));

    sub_scan_ = this->create_subscription<sensor_msgs::msg::LaserScan>(
      topic_scan_, rclcpp::SensorDataQoS(),
      std::bind(&MonitorObstacleDistanceNode::on_scan_, this, std::placeholders::_1));

    const auto period = std::chrono::duration<double>(1.0 / publish_rate_hz_);
    timer_ = this->create_wall_timer(
      std::chrono::duration_cast<std::chrono::milliseconds>(period),
      std::bind(&MonitorObstacleDistanceNode::on_timer_, this));

    RCLCPP_INFO(
      this->get_logger(),
      "monitor_obstacle_distance_node started | in=%s out=%s | rate=%.2f Hz | timeout=%.2fs",
      topic_scan_.c_str(), topic_metrics_.c_str(), publish_rate_hz_, input_timeout_sec_);
  }

private:
  void on_scan_(const sensor_msgs::msg::LaserScan::SharedPtr msg)
  {
    if (!msg) {
      return;
    }
    // Reduce immediately; the full scan is not needed past this point.
    nearest_m_ = nearest_obstacle_distance(msg->ranges, msg->range_min, msg->range_max);
    scan_watchdog_.update(this->now().seconds());
  }

  void on_timer_()
  {
    const double now_sec = this->now().seconds();
    const StreamWatchdogStatus wd = scan_watchdog_.check(now_sec);

    if (!wd.fresh) {
      if (!wd.in_startup_grace) {
        RCLCPP_WARN_THROTTLE(
          this->get_logger(), *this->get_clock(), log_stale_warn_throttle_ms_,
          "scan %s on %s (timeout=%.2fs), obstacle metric paused",
          wd.has_seen_update ? "stale" : "missing", topic_scan_.c_str(), input_timeout_sec_);
      }
      return;
    }

    if (!nearest_m_) {
      RCLCPP_DEBUG(this->get_logger(), "latest scan has no valid range, skipping");
      return;
    }

    const auto d = builder_.make(
      metric_names::kNearestObstacleDistance, *nearest_m_, units::kMeters, now_sec);
    if (!d) {
      return;
    }
    pub_metrics_->publish(to_list_msg({*d}));
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
    if (topic_scan_.empty()) topic_scan_ = topic_names::kScan;
    if (topic_metrics_.empty()) topic_metrics_ = topic_names::kMetrics;
  }

private:
  rclcpp::Publisher<msg::MetricList>::SharedPtr pub_metrics_;
  rclcpp::Subscription<sensor_msgs::msg::LaserScan>::SharedPtr sub_scan_;
  rclcpp::TimerBase::SharedPtr timer_;

  std::string topic_scan_;
  std::string topic_metrics_;

  double publish_rate_hz_{1.0};
  double input_timeout_sec_{1.0};
  int log_stale_warn_throttle_ms_{5000};

  MetricBuilder builder_{};
  StreamWatchdog scan_watchdog_{};
  std::optional<double> nearest_m_;
};

}  // namespace robot_monitoring

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  int rc = 0;
  try {
    rclcpp::spin(std::make_shared<robot_monitoring::MonitorObstacleDistanceNode>());
  } catch (const std::exception & e) {
    std::fprintf(stderr, "[monitor_obstacle_distance_node] FATAL: %s\n", e.what());
    rc = 1;
  }
  rclcpp::shutdown();
  return rc;
}
