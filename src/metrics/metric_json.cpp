// =============================================================================
// robot_monitoring / src/metrics/metric_json.cpp (ROS 2 Jazzy)
// =============================================================================

#include "robot_monitoring/metric_json.hpp"

namespace robot_monitoring
{

nlohmann::json to_json(const AggregatedMetric & metric, const std::string & metric_namespace)
{
  nlohmann::json dims = nlohmann::json::object();
  for (const auto & d : metric.dimensions) {
    dims[d.name] = d.value;
  }

  const StatisticSet & st = metric.statistics;
  return nlohmann::json{
    {"namespace", metric_namespace},
    {"metric", metric.metric_name},
    {"unit", metric.unit},
    {"dimensions", dims},
    {"storage_resolution", metric.storage_resolution_sec},
    {"period_start", metric.period_start_sec},
    {"period_end", metric.period_end_sec},
    {"statistics", {
      {"sample_count", st.sample_count},
      {"sum", st.sum},
      {"min", st.minimum},
      {"max", st.maximum}
    }}
  };
}

std::string to_json_line(const AggregatedMetric & metric, const std::string & metric_namespace)
{
  // Compact dump never contains a raw newline.
  return to_json(metric, metric_namespace).dump(
    -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace robot_monitoring
