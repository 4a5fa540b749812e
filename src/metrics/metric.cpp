// =============================================================================
// robot_monitoring / src/metrics/metric.cpp (ROS 2 Jazzy)
// =============================================================================

#include "robot_monitoring/metric.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace robot_monitoring
{

bool is_valid_storage_resolution(int seconds)
{
  return seconds == kStorageResolutionHigh || seconds == kStorageResolutionStandard;
}

std::optional<MetricDimension> parse_dimension(const std::string & text)
{
  const std::size_t eq = text.find('=');
  if (eq == std::string::npos || eq == 0) {
    return std::nullopt;
  }
  return MetricDimension{text.substr(0, eq), text.substr(eq + 1)};
}

std::vector<MetricDimension> sorted_dimensions(std::vector<MetricDimension> dims)
{
  std::sort(
    dims.begin(), dims.end(),
    [](const MetricDimension & a, const MetricDimension & b) {
      if (a.name != b.name) {
        return a.name < b.name;
      }
      return a.value < b.value;
    });
  return dims;
}

MetricBuilder::MetricBuilder(const MetricBuilderConfig & cfg)
{
  set_config(cfg);
}

void MetricBuilder::set_config(const MetricBuilderConfig & cfg)
{
  config_ = cfg;
  if (!is_valid_storage_resolution(config_.storage_resolution_sec)) {
    config_.storage_resolution_sec = kStorageResolutionStandard;
  }
  rebuild_dimensions_();
}

void MetricBuilder::rebuild_dimensions_()
{
  default_dimensions_.clear();
  if (!config_.robot_id.empty()) {
    default_dimensions_.push_back({"robot_id", config_.robot_id});
  }
  if (!config_.category.empty()) {
    default_dimensions_.push_back({"category", config_.category});
  }
  for (const auto & d : config_.extra_dimensions) {
    if (!d.name.empty()) {
      default_dimensions_.push_back(d);
    }
  }
}

std::optional<MetricDatum> MetricBuilder::make(
  const std::string & name,
  double value,
  const std::string & unit,
  double now_sec) const
{
  if (name.empty() || !std::isfinite(value)) {
    return std::nullopt;
  }

  MetricDatum d;
  d.metric_name = name;
  d.value = value;
  d.unit = unit.empty() ? units::kNone : unit;
  d.timestamp_sec = now_sec;
  d.dimensions = default_dimensions_;
  d.storage_resolution_sec = config_.storage_resolution_sec;
  return d;
}

}  // namespace robot_monitoring
