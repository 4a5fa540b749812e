// =============================================================================
// robot_monitoring / src/nodes/log_forwarder_node.cpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Log store sink. Forwards the robot's /rosout stream to the log spool that
// the cloud log uploader drains.
//
//   /rosout (rcl_interfaces/Log) -> LogFilter -> LogBatcher -> SpoolWriter
//
// Parameters of note
// ------------------
//   min_severity    debug | info | warn | error | fatal   (default info)
//   ignore_loggers  logger names never forwarded
//
// This node's own logger is always ignored: a spool error logged here would
// otherwise come back through /rosout and be forwarded again.
// =============================================================================

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "rcl_interfaces/msg/log.hpp"
#include "rclcpp/rclcpp.hpp"

#include "robot_monitoring/log_forwarding.hpp"
#include "robot_monitoring/spool_writer.hpp"
#include "robot_monitoring/topic_names.hpp"

namespace robot_monitoring
{

class LogForwarderNode : public rclcpp::Node
{
public:
  LogForwarderNode()
  : Node("log_forwarder_node")
  {
    topic_rosout_ = this->declare_parameter<std::string>("topics.rosout", topic_names::kRosout);

    const std::string min_severity_text =
      this->declare_parameter<std::string>("min_severity", "info");
    const std::vector<std::string> ignore =
      this->declare_parameter<std::vector<std::string>>("ignore_loggers", std::vector<std::string>{});

    LogBatcherConfig batch_cfg{};
    batch_cfg.max_batch_size = static_cast<std::size_t>(std::max<int64_t>(
        1, this->declare_parameter<int64_t>(
          "batch.max_batch_size", static_cast<int64_t>(batch_cfg.max_batch_size))));
    batch_cfg.max_queue_size = static_cast<std::size_t>(std::max<int64_t>(
        1, this->declare_parameter<int64_t>(
          "batch.max_queue_size", static_cast<int64_t>(batch_cfg.max_queue_size))));
    batch_cfg.flush_period_sec =
      this->declare_parameter<double>("batch.flush_period_sec", batch_cfg.flush_period_sec);

    SpoolWriterConfig spool_cfg{};
    spool_cfg.path = this->declare_parameter<std::string>(
      "spool.logs_path", "/tmp/robot_monitoring/rosout.log");
    spool_cfg.max_file_bytes = static_cast<std::uintmax_t>(std::max<int64_t>(
        1024, this->declare_parameter<int64_t>("spool.max_file_bytes", 10 * 1024 * 1024)));

    LogFilterConfig filter_cfg{};
    const auto parsed = parse_severity(min_severity_text);
    if (!parsed) {
      throw std::runtime_error("unknown min_severity '" + min_severity_text + "'");
    }
    filter_cfg.min_severity = *parsed;
    filter_cfg.ignore_loggers = ignore;
    filter_cfg.self_logger = this->get_logger().get_name();
    filter_ = LogFilter(filter_cfg);
    batcher_ = LogBatcher(batch_cfg);

    if (topic_rosout_.empty()) {
      topic_rosout_ = topic_names::kRosout;
    }

    spool_ = std::make_unique<SpoolWriter>(spool_cfg);

    // Deep queue: /rosout bursts at startup.
    sub_rosout_ = this->create_subscription<rcl_interfaces::msg::Log>(
      topic_rosout_, rclcpp::QoS(1000),
      std::bind(&LogForwarderNode::on_log_, this, std::placeholders::_1));

    timer_ = this->create_wall_timer(
      std::chrono::milliseconds(250),
      std::bind(&LogForwarderNode::on_timer_, this));

    RCLCPP_INFO(
      this->get_logger(),
      "log_forwarder_node started | in=%s | min=%s ignore=%zu | batch=%zu/%.1fs | spool=%s",
      topic_rosout_.c_str(), severity_to_cstr(filter_cfg.min_severity), ignore.size(),
      batch_cfg.max_batch_size, batch_cfg.flush_period_sec, spool_->path().c_str());
  }

  ~LogForwarderNode() override
  {
    while (batcher_.size() > 0) {
      if (!write_batch_(batcher_.take())) {
        break;
      }
    }
  }

private:
  void on_log_(const rcl_interfaces::msg::Log::SharedPtr msg)
  {
    if (!msg) {
      return;
    }

    LogRecord r;
    r.stamp_sec = static_cast<double>(msg->stamp.sec) + static_cast<double>(msg->stamp.nanosec) * 1e-9;
    r.severity = severity_from_level(msg->level).value_or(LogSeverity::kInfo);
    r.logger_name = msg->name;
    r.message = msg->msg;
    r.file = msg->file;
    r.function = msg->function;
    r.line = msg->line;

    if (!filter_.accept(r)) {
      return;
    }
    batcher_.push(std::move(r), this->now().seconds());
  }

  void on_timer_()
  {
    const double now_sec = this->now().seconds();
    while (batcher_.ready(now_sec)) {
      if (!write_batch_(batcher_.take())) {
        break;
      }
    }

    if (batcher_.dropped_count() != last_dropped_) {
      RCLCPP_WARN(
        this->get_logger(), "log queue overflow, %lu records dropped so far",
        static_cast<unsigned long>(batcher_.dropped_count()));
      last_dropped_ = batcher_.dropped_count();
    }
  }

  bool write_batch_(const std::vector<LogRecord> & batch)
  {
    if (batch.empty()) {
      return true;
    }
    std::vector<std::string> lines;
    lines.reserve(batch.size());
    for (const auto & r : batch) {
      lines.push_back(format_log_line(r));
    }
    try {
      spool_->append_lines(lines);
    } catch (const std::runtime_error & e) {
      RCLCPP_ERROR(this->get_logger(), "dropping %zu log records: %s", lines.size(), e.what());
      return false;
    }
    return true;
  }

private:
  rclcpp::Subscription<rcl_interfaces::msg::Log>::SharedPtr sub_rosout_;
  rclcpp::TimerBase::SharedPtr timer_;

  std::string topic_rosout_;

  LogFilter filter_{};
  LogBatcher batcher_{};
  std::unique_ptr<SpoolWriter> spool_;
  std::uint64_t last_dropped_{0};
};

}  // namespace robot_monitoring

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  int rc = 0;
  try {
    rclcpp::spin(std::make_shared<robot_monitoring::LogForwarderNode>());
  } catch (const std::exception & e) {
    std::fprintf(stderr, "[log_forwarder_node] FATAL: %s\n", e.what());
    rc = 1;
  }
  rclcpp::shutdown();
  return rc;
}
