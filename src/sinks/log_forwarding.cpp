// =============================================================================
// robot_monitoring / src/sinks/log_forwarding.cpp (ROS 2 Jazzy)
// =============================================================================

#include "robot_monitoring/log_forwarding.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

namespace robot_monitoring
{

std::optional<LogSeverity> severity_from_level(std::uint8_t level)
{
  switch (level) {
    case 10: return LogSeverity::kDebug;
    case 20: return LogSeverity::kInfo;
    case 30: return LogSeverity::kWarn;
    case 40: return LogSeverity::kError;
    case 50: return LogSeverity::kFatal;
    default: return std::nullopt;
  }
}

std::optional<LogSeverity> parse_severity(const std::string & text)
{
  std::string t = text;
  std::transform(
    t.begin(), t.end(), t.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (t == "debug") return LogSeverity::kDebug;
  if (t == "info") return LogSeverity::kInfo;
  if (t == "warn" || t == "warning") return LogSeverity::kWarn;
  if (t == "error") return LogSeverity::kError;
  if (t == "fatal") return LogSeverity::kFatal;
  return std::nullopt;
}

const char * severity_to_cstr(LogSeverity s)
{
  switch (s) {
    case LogSeverity::kDebug: return "DEBUG";
    case LogSeverity::kInfo: return "INFO";
    case LogSeverity::kWarn: return "WARN";
    case LogSeverity::kError: return "ERROR";
    case LogSeverity::kFatal: return "FATAL";
    default: return "UNKNOWN";
  }
}

// -----------------------------------------------------------------------------
// LogFilter
// -----------------------------------------------------------------------------
LogFilter::LogFilter(LogFilterConfig cfg)
: config_(std::move(cfg))
{
}

bool LogFilter::accept(const LogRecord & record) const
{
  if (static_cast<std::uint8_t>(record.severity) <
    static_cast<std::uint8_t>(config_.min_severity))
  {
    return false;
  }
  if (!config_.self_logger.empty() && record.logger_name == config_.self_logger) {
    return false;
  }
  return std::find(
    config_.ignore_loggers.begin(), config_.ignore_loggers.end(),
    record.logger_name) == config_.ignore_loggers.end();
}

// -----------------------------------------------------------------------------
// LogBatcher
// -----------------------------------------------------------------------------
LogBatcher::LogBatcher(const LogBatcherConfig & cfg)
: config_(cfg)
{
  normalize_config_();
}

void LogBatcher::push(LogRecord record, double now_sec)
{
  queue_.push_back(std::move(record));
  enqueue_sec_.push_back(now_sec);

  while (queue_.size() > config_.max_queue_size) {
    queue_.pop_front();
    enqueue_sec_.pop_front();
    ++dropped_count_;
  }
}

bool LogBatcher::ready(double now_sec) const
{
  if (queue_.empty()) {
    return false;
  }
  if (queue_.size() >= config_.max_batch_size) {
    return true;
  }
  const double waited = now_sec - enqueue_sec_.front();
  return std::isfinite(waited) && waited >= config_.flush_period_sec;
}

std::vector<LogRecord> LogBatcher::take()
{
  const std::size_t n = std::min(queue_.size(), config_.max_batch_size);
  std::vector<LogRecord> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(std::move(queue_.front()));
    queue_.pop_front();
    enqueue_sec_.pop_front();
  }
  return out;
}

void LogBatcher::normalize_config_()
{
  if (config_.max_batch_size == 0) {
    config_.max_batch_size = 100;
  }
  if (config_.max_queue_size < config_.max_batch_size) {
    config_.max_queue_size = config_.max_batch_size;
  }
  if (!std::isfinite(config_.flush_period_sec) || config_.flush_period_sec < 0.0) {
    config_.flush_period_sec = 5.0;
  }
}

std::string format_log_line(const LogRecord & record)
{
  std::ostringstream ss;
  ss.setf(std::ios::fixed);
  ss.precision(3);
  ss << record.stamp_sec
     << " [" << severity_to_cstr(record.severity) << "] "
     << record.logger_name << ": " << record.message;
  return ss.str();
}

}  // namespace robot_monitoring
