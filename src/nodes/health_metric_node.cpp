// =============================================================================
// robot_monitoring / src/nodes/health_metric_node.cpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Samples host CPU and RAM usage from procfs and publishes them as metrics.
//
// Metrics
// -------
//   cpu_usage         Percent    (from the second sample on)
//   ram_used_percent  Percent
//   free_ram_mb       Megabytes  (MemAvailable)
//   total_ram_mb      Megabytes
//
// A failed sample (unreadable / unparsable procfs) is logged and skipped; the
// node keeps running.
// =============================================================================

#include <chrono>
#include <cmath>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "rclcpp/rclcpp.hpp"

#include "robot_monitoring/metric.hpp"
#include "robot_monitoring/metric_msgs.hpp"
#include "robot_monitoring/system_stats.hpp"
#include "robot_monitoring/topic_names.hpp"

namespace robot_monitoring
{

class HealthMetricNode : public rclcpp::Node
{
public:
  HealthMetricNode()
  : Node("health_metric_node")
  {
    topic_metrics_ = this->declare_parameter<std::string>("topics.metrics", topic_names::kMetrics);
    sample_rate_hz_ = this->declare_parameter<double>("sample_rate_hz", 0.2);
    proc_root_ = this->declare_parameter<std::string>("proc_root", "/proc");
    log_error_throttle_ms_ = this->declare_parameter<int>("log.error_throttle_ms", 10000);

    if (!std::isfinite(sample_rate_hz_) || sample_rate_hz_ <= 0.0) {
      sample_rate_hz_ = 0.2;
    }
    if (proc_root_.empty()) {
      proc_root_ = "/proc";
    }
    if (log_error_throttle_ms_ < 0) {
      log_error_throttle_ms_ = 10000;
    }

    builder_.set_config(declare_metric_builder_params(*this));
    sampler_ = std::make_unique<SystemStatsSampler>(std::make_unique<LinuxProcSource>(proc_root_));

    pub_metrics_ = this->create_publisher<msg::MetricList>(topic_metrics_, rclcpp::QoS(10));

    const auto period = std::chrono::duration<double>(1.0 / sample_rate_hz_);
    timer_ = this->create_wall_timer(
      std::chrono::duration_cast<std::chrono::milliseconds>(period),
      std::bind(&HealthMetricNode::on_timer_, this));

    RCLCPP_INFO(
      this->get_logger(),
      "health_metric_node started | out=%s | rate=%.2f Hz | proc=%s",
      topic_metrics_.c_str(), sample_rate_hz_, proc_root_.c_str());
  }

private:
  void on_timer_()
  {
    const double now_sec = this->now().seconds();

    SystemStatsSample s;
    try {
      s = sampler_->sample();
    } catch (const std::runtime_error & e) {
      RCLCPP_ERROR_THROTTLE(
        this->get_logger(), *this->get_clock(), log_error_throttle_ms_,
        "health sample failed: %s", e.what());
      return;
    }

    std::vector<MetricDatum> out;
    auto add = [&](const char * name, double value, const char * unit) {
        if (auto d = builder_.make(name, value, unit, now_sec)) {
          out.push_back(*d);
        }
      };

    if (s.cpu_usage_percent) {
      add(metric_names::kCpuUsage, *s.cpu_usage_percent, units::kPercent);
    }
    add(metric_names::kRamUsedPercent, s.ram_used_percent, units::kPercent);
    add(metric_names::kFreeRam, s.free_ram_mb, units::kMegabytes);
    add(metric_names::kTotalRam, s.total_ram_mb, units::kMegabytes);

    pub_metrics_->publish(to_list_msg(out));

    RCLCPP_DEBUG(
      this->get_logger(), "health: cpu=%.1f%% ram=%.1f%% free=%.0fMB",
      s.cpu_usage_percent.value_or(-1.0), s.ram_used_percent, s.free_ram_mb);
  }

private:
  rclcpp::Publisher<msg::MetricList>::SharedPtr pub_metrics_;
  rclcpp::TimerBase::SharedPtr timer_;

  std::string topic_metrics_;
  std::string proc_root_;
  double sample_rate_hz_{0.2};
  int log_error_throttle_ms_{10000};

  MetricBuilder builder_{};
  std::unique_ptr<SystemStatsSampler> sampler_;
};

}  // namespace robot_monitoring

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  int rc = 0;
  try {
    rclcpp::spin(std::make_shared<robot_monitoring::HealthMetricNode>());
  } catch (const std::exception & e) {
    std::fprintf(stderr, "[health_metric_node] FATAL: %s\n", e.what());
    rc = 1;
  }
  rclcpp::shutdown();
  return rc;
}
