#pragma once

// =============================================================================
// robot_monitoring / metric_msgs.hpp (ROS 2 Jazzy)
// =============================================================================
// ROS-facing glue for the metric model: MetricDatum <-> robot_monitoring/msg
// conversion and the shared `metrics.*` parameter block every telemetry node
// declares. Only node targets include this header.
// =============================================================================

#include <cmath>
#include <string>
#include <vector>

#include "rclcpp/rclcpp.hpp"

#include "robot_monitoring/metric.hpp"
#include "robot_monitoring/msg/metric_data.hpp"
#include "robot_monitoring/msg/metric_dimension.hpp"
#include "robot_monitoring/msg/metric_list.hpp"

namespace robot_monitoring
{

inline builtin_interfaces::msg::Time to_time_msg(double stamp_sec)
{
  builtin_interfaces::msg::Time t;
  if (!std::isfinite(stamp_sec) || stamp_sec < 0.0) {
    return t;
  }
  const double whole = std::floor(stamp_sec);
  t.sec = static_cast<int32_t>(whole);
  t.nanosec = static_cast<uint32_t>((stamp_sec - whole) * 1e9);
  return t;
}

inline double from_time_msg(const builtin_interfaces::msg::Time & t)
{
  return static_cast<double>(t.sec) + static_cast<double>(t.nanosec) * 1e-9;
}

inline msg::MetricData to_msg(const MetricDatum & d)
{
  msg::MetricData m;
  m.time_stamp = to_time_msg(d.timestamp_sec);
  m.metric_name = d.metric_name;
  m.value = d.value;
  m.unit = d.unit;
  m.storage_resolution = d.storage_resolution_sec;
  m.dimensions.reserve(d.dimensions.size());
  for (const auto & dim : d.dimensions) {
    msg::MetricDimension md;
    md.name = dim.name;
    md.value = dim.value;
    m.dimensions.push_back(md);
  }
  return m;
}

inline MetricDatum from_msg(const msg::MetricData & m)
{
  MetricDatum d;
  d.metric_name = m.metric_name;
  d.value = m.value;
  d.unit = m.unit.empty() ? units::kNone : m.unit;
  d.timestamp_sec = from_time_msg(m.time_stamp);
  d.storage_resolution_sec = is_valid_storage_resolution(m.storage_resolution)
    ? m.storage_resolution : kStorageResolutionStandard;
  d.dimensions.reserve(m.dimensions.size());
  for (const auto & md : m.dimensions) {
    d.dimensions.push_back({md.name, md.value});
  }
  return d;
}

inline msg::MetricList to_list_msg(const std::vector<MetricDatum> & data)
{
  msg::MetricList list;
  list.metrics.reserve(data.size());
  for (const auto & d : data) {
    list.metrics.push_back(to_msg(d));
  }
  return list;
}

// Declares the metrics.* block (robot_id, category, storage_resolution_sec,
// extra_dimensions as "name=value" strings) and returns the builder config.
inline MetricBuilderConfig declare_metric_builder_params(rclcpp::Node & node)
{
  MetricBuilderConfig cfg{};
  cfg.robot_id = node.declare_parameter<std::string>("metrics.robot_id", cfg.robot_id);
  cfg.category = node.declare_parameter<std::string>("metrics.category", cfg.category);
  cfg.storage_resolution_sec = static_cast<int>(
    node.declare_parameter<int>("metrics.storage_resolution_sec", cfg.storage_resolution_sec));

  if (!is_valid_storage_resolution(cfg.storage_resolution_sec)) {
    RCLCPP_WARN(
      node.get_logger(),
      "metrics.storage_resolution_sec=%d is not 1 or 60, using %d",
      cfg.storage_resolution_sec, kStorageResolutionStandard);
    cfg.storage_resolution_sec = kStorageResolutionStandard;
  }

  const std::vector<std::string> extra = node.declare_parameter<std::vector<std::string>>(
    "metrics.extra_dimensions", std::vector<std::string>{});
  for (const auto & text : extra) {
    const auto dim = parse_dimension(text);
    if (!dim) {
      RCLCPP_WARN(
        node.get_logger(), "ignoring metrics.extra_dimensions entry '%s' (expected name=value)",
        text.c_str());
      continue;
    }
    cfg.extra_dimensions.push_back(*dim);
  }
  return cfg;
}

}  // namespace robot_monitoring
