// =============================================================================
// robot_monitoring / src/nodes/metrics_collector_node.cpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Metrics store sink. Collects every MetricList published on /metrics,
// aggregates samples into per-period statistic sets, and appends them as JSON
// lines to the metrics spool that the cloud uploader drains.
//
//   /metrics -> MetricAggregator -> to_json_line() -> SpoolWriter
//
// Failure handling
// ----------------
// A spool write error is logged and the batch is dropped; the next flush
// tries again with fresh data. Buffered samples are flushed on shutdown.
// =============================================================================

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "rclcpp/rclcpp.hpp"

#include "robot_monitoring/metric_aggregator.hpp"
#include "robot_monitoring/metric_json.hpp"
#include "robot_monitoring/metric_msgs.hpp"
#include "robot_monitoring/spool_writer.hpp"
#include "robot_monitoring/topic_names.hpp"

namespace robot_monitoring
{

class MetricsCollectorNode : public rclcpp::Node
{
public:
  MetricsCollectorNode()
  : Node("metrics_collector_node")
  {
    topic_metrics_ = this->declare_parameter<std::string>("topics.metrics", topic_names::kMetrics);
    metric_namespace_ = this->declare_parameter<std::string>("metric_namespace", "RobotMonitoring");

    MetricAggregatorConfig agg_cfg{};
    agg_cfg.flush_period_sec =
      this->declare_parameter<double>("aggregation.flush_period_sec", agg_cfg.flush_period_sec);
    agg_cfg.max_buckets = static_cast<std::size_t>(std::max<int64_t>(
        1, this->declare_parameter<int64_t>(
          "aggregation.max_buckets", static_cast<int64_t>(agg_cfg.max_buckets))));
    aggregator_.set_config(agg_cfg);

    SpoolWriterConfig spool_cfg{};
    spool_cfg.path = this->declare_parameter<std::string>(
      "spool.metrics_path", "/tmp/robot_monitoring/metrics.jsonl");
    spool_cfg.max_file_bytes = static_cast<std::uintmax_t>(std::max<int64_t>(
        1024, this->declare_parameter<int64_t>("spool.max_file_bytes", 10 * 1024 * 1024)));

    if (topic_metrics_.empty()) {
      topic_metrics_ = topic_names::kMetrics;
    }

    // Throws on an unusable spool location; main() reports it as FATAL.
    spool_ = std::make_unique<SpoolWriter>(spool_cfg);

    last_timer_sec_ = this->now().seconds();
    aggregator_.reset(last_timer_sec_);

    sub_metrics_ = this->create_subscription<msg::MetricList>(
      topic_metrics_, rclcpp::QoS(100),
      std::bind(&MetricsCollectorNode::on_metrics_, this, std::placeholders::_1));

    // Poll faster than the flush period so flushes land close to the boundary.
    const double poll_sec = std::clamp(aggregator_.config().flush_period_sec / 4.0, 0.05, 1.0);
    timer_ = this->create_wall_timer(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>(poll_sec)),
      std::bind(&MetricsCollectorNode::on_timer_, this));

    RCLCPP_INFO(
      this->get_logger(),
      "metrics_collector_node started | in=%s | namespace=%s | period=%.1fs | spool=%s",
      topic_metrics_.c_str(), metric_namespace_.c_str(),
      aggregator_.config().flush_period_sec, spool_->path().c_str());
  }

  ~MetricsCollectorNode() override
  {
    // The context may already be shut down here; use the last timer stamp.
    flush_(last_timer_sec_);
  }

private:
  void on_metrics_(const msg::MetricList::SharedPtr msg)
  {
    if (!msg) {
      return;
    }
    for (const auto & m : msg->metrics) {
      aggregator_.add(from_msg(m));
    }
  }

  void on_timer_()
  {
    const double now_sec = this->now().seconds();
    last_timer_sec_ = now_sec;
    if (aggregator_.due(now_sec)) {
      flush_(now_sec);
    }

    if (aggregator_.rejected_count() != last_rejected_ || aggregator_.dropped_count() != last_dropped_) {
      RCLCPP_WARN(
        this->get_logger(),
        "metrics rejected=%lu dropped(bucket limit)=%lu",
        static_cast<unsigned long>(aggregator_.rejected_count()),
        static_cast<unsigned long>(aggregator_.dropped_count()));
      last_rejected_ = aggregator_.rejected_count();
      last_dropped_ = aggregator_.dropped_count();
    }
  }

  void flush_(double now_sec)
  {
    const std::vector<AggregatedMetric> batch = aggregator_.flush(now_sec);
    if (batch.empty() || !spool_) {
      return;
    }

    std::vector<std::string> lines;
    lines.reserve(batch.size());
    for (const auto & m : batch) {
      lines.push_back(to_json_line(m, metric_namespace_));
    }

    try {
      spool_->append_lines(lines);
      RCLCPP_DEBUG(this->get_logger(), "flushed %zu aggregated metrics", lines.size());
    } catch (const std::runtime_error & e) {
      RCLCPP_ERROR(
        this->get_logger(), "dropping %zu aggregated metrics: %s", lines.size(), e.what());
    }
  }

private:
  rclcpp::Subscription<msg::MetricList>::SharedPtr sub_metrics_;
  rclcpp::TimerBase::SharedPtr timer_;

  std::string topic_metrics_;
  std::string metric_namespace_;

  MetricAggregator aggregator_{};
  std::unique_ptr<SpoolWriter> spool_;

  double last_timer_sec_{0.0};
  std::uint64_t last_rejected_{0};
  std::uint64_t last_dropped_{0};
};

}  // namespace robot_monitoring

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  int rc = 0;
  try {
    rclcpp::spin(std::make_shared<robot_monitoring::MetricsCollectorNode>());
  } catch (const std::exception & e) {
    std::fprintf(stderr, "[metrics_collector_node] FATAL: %s\n", e.what());
    rc = 1;
  }
  rclcpp::shutdown();
  return rc;
}
