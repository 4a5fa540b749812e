#pragma once

// =============================================================================
// robot_monitoring / log_forwarding.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// ROS-independent pieces of the log store sink:
//
//   LogFilter   - severity threshold + logger ignore list
//   LogBatcher  - bounded buffer released by size or age
//   format_log_line - "<stamp> [<LEVEL>] <logger>: <message>"
//
// log_forwarder_node converts rcl_interfaces/msg/Log into LogRecord and wires
// these together with a SpoolWriter.
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace robot_monitoring
{

// Values match rcl_interfaces/msg/Log level constants.
enum class LogSeverity : std::uint8_t
{
  kDebug = 10,
  kInfo = 20,
  kWarn = 30,
  kError = 40,
  kFatal = 50
};

std::optional<LogSeverity> severity_from_level(std::uint8_t level);

// Case-insensitive: debug, info, warn, warning, error, fatal.
std::optional<LogSeverity> parse_severity(const std::string & text);

const char * severity_to_cstr(LogSeverity s);

struct LogRecord
{
  double stamp_sec {0.0};
  LogSeverity severity {LogSeverity::kInfo};
  std::string logger_name;
  std::string message;
  std::string file;
  std::string function;
  std::uint32_t line {0};
};

// -----------------------------------------------------------------------------
// Filter
// -----------------------------------------------------------------------------
struct LogFilterConfig
{
  LogSeverity min_severity {LogSeverity::kInfo};
  std::vector<std::string> ignore_loggers;

  // The forwarder's own logger. Always ignored so forwarding cannot feed itself.
  std::string self_logger;
};

class LogFilter
{
public:
  LogFilter() = default;
  explicit LogFilter(LogFilterConfig cfg);

  bool accept(const LogRecord & record) const;

private:
  LogFilterConfig config_ {};
};

// -----------------------------------------------------------------------------
// Batcher
// -----------------------------------------------------------------------------
struct LogBatcherConfig
{
  std::size_t max_batch_size {100};
  std::size_t max_queue_size {1000};
  double flush_period_sec {5.0};
};

class LogBatcher
{
public:
  LogBatcher() = default;
  explicit LogBatcher(const LogBatcherConfig & cfg);

  void push(LogRecord record, double now_sec);

  // True when a full batch is queued or the oldest queued record has waited
  // flush_period_sec.
  bool ready(double now_sec) const;

  // Removes and returns up to max_batch_size records, oldest first.
  std::vector<LogRecord> take();

  std::size_t size() const { return queue_.size(); }
  std::uint64_t dropped_count() const { return dropped_count_; }

private:
  void normalize_config_();

  LogBatcherConfig config_ {};
  std::deque<LogRecord> queue_;
  std::deque<double> enqueue_sec_;
  std::uint64_t dropped_count_ {0};
};

std::string format_log_line(const LogRecord & record);

}  // namespace robot_monitoring
