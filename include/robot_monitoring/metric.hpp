#pragma once

// =============================================================================
// robot_monitoring / metric.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// ROS-independent telemetry metric model.
//
// A MetricDatum is one named, timestamped numeric measurement (speed, CPU
// usage, ...) together with its unit and the dimensions that identify where
// it came from. MetricBuilder stamps every datum with the robot-wide default
// dimensions so individual monitors only supply name/value/unit.
//
// Unit strings follow the monitoring backend naming; units the backend does
// not know natively (m/s, rad/s) are still carried as plain strings.
// =============================================================================

#include <optional>
#include <string>
#include <vector>

namespace robot_monitoring
{

namespace units
{
inline constexpr const char * kNone             = "None";
inline constexpr const char * kPercent          = "Percent";
inline constexpr const char * kCount            = "Count";
inline constexpr const char * kSeconds          = "Seconds";
inline constexpr const char * kBytes            = "Bytes";
inline constexpr const char * kMegabytes        = "Megabytes";
inline constexpr const char * kMeters           = "Meters";
inline constexpr const char * kMetersPerSecond  = "MetersPerSecond";
inline constexpr const char * kRadiansPerSecond = "RadiansPerSecond";
}  // namespace units

namespace metric_names
{
inline constexpr const char * kLinearSpeed             = "linear_speed";
inline constexpr const char * kAngularSpeed            = "angular_speed";
inline constexpr const char * kNearestObstacleDistance = "nearest_obstacle_distance";
inline constexpr const char * kDistanceToGoal          = "distance_to_goal";
inline constexpr const char * kCpuUsage                = "cpu_usage";
inline constexpr const char * kRamUsedPercent          = "ram_used_percent";
inline constexpr const char * kFreeRam                 = "free_ram_mb";
inline constexpr const char * kTotalRam                = "total_ram_mb";
}  // namespace metric_names

inline constexpr int kStorageResolutionHigh     = 1;
inline constexpr int kStorageResolutionStandard = 60;

struct MetricDimension
{
  std::string name;
  std::string value;
};

struct MetricDatum
{
  std::string metric_name;
  double value {0.0};
  std::string unit {units::kNone};
  double timestamp_sec {0.0};
  std::vector<MetricDimension> dimensions;
  int storage_resolution_sec {kStorageResolutionStandard};
};

struct MetricBuilderConfig
{
  std::string robot_id {"robot"};
  std::string category {"RobotApp"};
  int storage_resolution_sec {kStorageResolutionStandard};

  // Appended after robot_id / category. Entries with an empty name are dropped.
  std::vector<MetricDimension> extra_dimensions;
};

bool is_valid_storage_resolution(int seconds);

// Parses "name=value" (split at the first '='). std::nullopt when there is no
// '=' or the name is empty. The value may be empty or contain '='.
std::optional<MetricDimension> parse_dimension(const std::string & text);

// Dimensions ordered by name, then value. Used for bucketing and stable output.
std::vector<MetricDimension> sorted_dimensions(std::vector<MetricDimension> dims);

class MetricBuilder
{
public:
  MetricBuilder() = default;
  explicit MetricBuilder(const MetricBuilderConfig & cfg);

  void set_config(const MetricBuilderConfig & cfg);
  const MetricBuilderConfig & config() const { return config_; }

  // Returns std::nullopt for an empty name or a non-finite value.
  std::optional<MetricDatum> make(
    const std::string & name,
    double value,
    const std::string & unit,
    double now_sec) const;

private:
  void rebuild_dimensions_();

  MetricBuilderConfig config_ {};
  std::vector<MetricDimension> default_dimensions_ {
    {"robot_id", "robot"}, {"category", "RobotApp"}};
};

}  // namespace robot_monitoring
