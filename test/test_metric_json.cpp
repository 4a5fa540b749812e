// =============================================================================
// robot_monitoring / test/test_metric_json.cpp
// =============================================================================

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

#include "robot_monitoring/metric_json.hpp"

namespace robot_monitoring
{
namespace
{

AggregatedMetric cpu_metric()
{
  AggregatedMetric m;
  m.metric_name = "cpu_usage";
  m.unit = "Percent";
  m.dimensions = {{"category", "RobotApp"}, {"robot_id", "robot_1"}};
  m.statistics.add(10.0);
  m.statistics.add(20.0);
  m.statistics.add(15.0);
  m.period_start_sec = 10.0;
  m.period_end_sec = 70.0;
  m.storage_resolution_sec = 60;
  return m;
}

TEST(MetricJson, FormatsAggregatedMetric)
{
  const nlohmann::json j = nlohmann::json::parse(to_json_line(cpu_metric(), "RobotMonitoring"));

  EXPECT_EQ(j.at("namespace"), "RobotMonitoring");
  EXPECT_EQ(j.at("metric"), "cpu_usage");
  EXPECT_EQ(j.at("unit"), "Percent");
  EXPECT_EQ(j.at("dimensions").at("category"), "RobotApp");
  EXPECT_EQ(j.at("dimensions").at("robot_id"), "robot_1");
  EXPECT_EQ(j.at("storage_resolution").get<int>(), 60);
  EXPECT_DOUBLE_EQ(j.at("period_start").get<double>(), 10.0);
  EXPECT_DOUBLE_EQ(j.at("period_end").get<double>(), 70.0);

  const nlohmann::json & st = j.at("statistics");
  EXPECT_EQ(st.at("sample_count").get<std::uint64_t>(), 3u);
  EXPECT_DOUBLE_EQ(st.at("sum").get<double>(), 45.0);
  EXPECT_DOUBLE_EQ(st.at("min").get<double>(), 10.0);
  EXPECT_DOUBLE_EQ(st.at("max").get<double>(), 20.0);
}

TEST(MetricJson, EmptyDimensionsAreAnObject)
{
  AggregatedMetric m;
  m.metric_name = "linear_speed";
  m.unit = units::kMetersPerSecond;
  m.statistics.add(0.25);

  const nlohmann::json j = to_json(m, "ns");
  EXPECT_TRUE(j.at("dimensions").is_object());
  EXPECT_TRUE(j.at("dimensions").empty());
  EXPECT_DOUBLE_EQ(j.at("statistics").at("sum").get<double>(), 0.25);
}

TEST(MetricJson, OverflowedSumStaysParseable)
{
  AggregatedMetric m;
  m.metric_name = "m";
  m.statistics.add(std::numeric_limits<double>::max());
  m.statistics.add(std::numeric_limits<double>::max());

  const std::string line = to_json_line(m, "ns");
  nlohmann::json j;
  ASSERT_NO_THROW(j = nlohmann::json::parse(line));

  const nlohmann::json & st = j.at("statistics");
  EXPECT_TRUE(st.at("sum").is_null());
  EXPECT_EQ(st.at("max").get<double>(), std::numeric_limits<double>::max());
  EXPECT_EQ(st.at("min").get<double>(), std::numeric_limits<double>::max());
}

TEST(MetricJson, NaNStatisticIsNull)
{
  AggregatedMetric m;
  m.metric_name = "m";
  m.statistics.sample_count = 1;
  m.statistics.sum = std::numeric_limits<double>::quiet_NaN();

  const nlohmann::json j = nlohmann::json::parse(to_json_line(m, "ns"));
  EXPECT_TRUE(j.at("statistics").at("sum").is_null());
}

TEST(MetricJson, EscapesAndStaysSingleLine)
{
  AggregatedMetric m = cpu_metric();
  m.dimensions = {{"robot_id", "line\nbreak \"quoted\""}};

  const std::string line = to_json_line(m, "ns");
  EXPECT_EQ(line.find('\n'), std::string::npos);
  EXPECT_EQ(
    nlohmann::json::parse(line).at("dimensions").at("robot_id"), "line\nbreak \"quoted\"");
}

TEST(MetricJson, InvalidUtf8DoesNotThrow)
{
  AggregatedMetric m = cpu_metric();
  m.dimensions = {{"robot_id", std::string("bad\xff")}};

  std::string line;
  ASSERT_NO_THROW(line = to_json_line(m, "ns"));
  EXPECT_NO_THROW(nlohmann::json::parse(line));
}

}  // namespace
}  // namespace robot_monitoring
