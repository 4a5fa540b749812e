#pragma once

// =============================================================================
// robot_monitoring / metric_json.hpp (ROS 2 Jazzy)
// =============================================================================
// Serialization of aggregated metrics into the JSON-lines spool format read
// by the metrics store uploader (keys are emitted in sorted order):
//
//   {"dimensions":{"category":"RobotApp","robot_id":"robot_1"},
//    "metric":"cpu_usage","namespace":"RobotMonitoring",
//    "period_end":70.0,"period_start":10.0,
//    "statistics":{"max":20.0,"min":10.0,"sample_count":3,"sum":45.0},
//    "storage_resolution":60,"unit":"Percent"}
//
// Non-finite statistics are written as null. One object per line, no
// trailing newline in the returned string.
// =============================================================================

#include <string>

#include <nlohmann/json.hpp>

#include "robot_monitoring/metric_aggregator.hpp"

namespace robot_monitoring
{

nlohmann::json to_json(const AggregatedMetric & metric, const std::string & metric_namespace);

// Invalid UTF-8 in names or dimensions is replaced, never thrown.
std::string to_json_line(const AggregatedMetric & metric, const std::string & metric_namespace);

}  // namespace robot_monitoring
