// =============================================================================
// robot_monitoring / test/test_metric_aggregator.cpp
// =============================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "robot_monitoring/metric.hpp"
#include "robot_monitoring/metric_aggregator.hpp"

namespace robot_monitoring
{
namespace
{

MetricDatum datum(const char * name, double value, double stamp, const char * robot = "r1")
{
  MetricBuilderConfig cfg;
  cfg.robot_id = robot;
  MetricBuilder b(cfg);
  return *b.make(name, value, units::kPercent, stamp);
}

TEST(MetricBuilder, AddsDefaultDimensionsInOrder)
{
  MetricBuilderConfig cfg;
  cfg.robot_id = "robot_1";
  cfg.category = "RobotApp";
  cfg.extra_dimensions = {{"fleet", "a"}, {"", "dropped"}};
  MetricBuilder b(cfg);

  const auto d = b.make(metric_names::kCpuUsage, 12.5, units::kPercent, 3.0);
  ASSERT_TRUE(d.has_value());
  ASSERT_EQ(d->dimensions.size(), 3u);
  EXPECT_EQ(d->dimensions[0].name, "robot_id");
  EXPECT_EQ(d->dimensions[0].value, "robot_1");
  EXPECT_EQ(d->dimensions[1].name, "category");
  EXPECT_EQ(d->dimensions[2].name, "fleet");
  EXPECT_EQ(d->storage_resolution_sec, kStorageResolutionStandard);
  EXPECT_DOUBLE_EQ(d->timestamp_sec, 3.0);
}

TEST(MetricBuilder, ParsesDimensionText)
{
  const auto d = parse_dimension("site=lab_a");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->name, "site");
  EXPECT_EQ(d->value, "lab_a");

  const auto nested = parse_dimension("query=a=b");
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->name, "query");
  EXPECT_EQ(nested->value, "a=b");

  const auto empty_value = parse_dimension("tag=");
  ASSERT_TRUE(empty_value.has_value());
  EXPECT_EQ(empty_value->name, "tag");
  EXPECT_TRUE(empty_value->value.empty());

  EXPECT_FALSE(parse_dimension("no_separator").has_value());
  EXPECT_FALSE(parse_dimension("=value").has_value());
  EXPECT_FALSE(parse_dimension("").has_value());
}

TEST(MetricBuilder, ParsedDimensionsFollowDefaults)
{
  MetricBuilderConfig cfg;
  cfg.extra_dimensions.push_back(*parse_dimension("site=lab_a"));
  MetricBuilder b(cfg);

  const auto d = b.make(metric_names::kLinearSpeed, 0.4, units::kMetersPerSecond, 1.0);
  ASSERT_TRUE(d.has_value());
  ASSERT_EQ(d->dimensions.size(), 3u);
  EXPECT_EQ(d->dimensions[2].name, "site");
  EXPECT_EQ(d->dimensions[2].value, "lab_a");
}

TEST(MetricBuilder, RejectsInvalidSamples)
{
  MetricBuilder b;
  EXPECT_FALSE(b.make("", 1.0, units::kCount, 0.0).has_value());
  EXPECT_FALSE(b.make("x", std::numeric_limits<double>::quiet_NaN(), units::kCount, 0.0).has_value());
  EXPECT_FALSE(b.make("x", std::numeric_limits<double>::infinity(), units::kCount, 0.0).has_value());
}

TEST(MetricBuilder, EmptyUnitBecomesNoneAndBadResolutionFallsBack)
{
  MetricBuilderConfig cfg;
  cfg.storage_resolution_sec = 5;
  MetricBuilder b(cfg);
  EXPECT_EQ(b.config().storage_resolution_sec, kStorageResolutionStandard);

  const auto d = b.make("x", 1.0, "", 0.0);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->unit, units::kNone);
}

TEST(MetricAggregator, BuildsStatisticSetPerBucket)
{
  MetricAggregator agg;
  agg.reset(10.0);
  EXPECT_TRUE(agg.add(datum("cpu_usage", 10.0, 11.0)));
  EXPECT_TRUE(agg.add(datum("cpu_usage", 20.0, 12.0)));
  EXPECT_TRUE(agg.add(datum("cpu_usage", 15.0, 13.0)));
  EXPECT_EQ(agg.bucket_count(), 1u);

  const auto out = agg.flush(70.0);
  ASSERT_EQ(out.size(), 1u);
  const StatisticSet & st = out[0].statistics;
  EXPECT_EQ(st.sample_count, 3u);
  EXPECT_DOUBLE_EQ(st.sum, 45.0);
  EXPECT_DOUBLE_EQ(st.minimum, 10.0);
  EXPECT_DOUBLE_EQ(st.maximum, 20.0);
  EXPECT_DOUBLE_EQ(st.average(), 15.0);
  EXPECT_DOUBLE_EQ(out[0].period_start_sec, 10.0);
  EXPECT_DOUBLE_EQ(out[0].period_end_sec, 70.0);
  EXPECT_EQ(agg.bucket_count(), 0u);
}

TEST(MetricAggregator, DimensionsSplitBuckets)
{
  MetricAggregator agg;
  agg.reset(0.0);
  agg.add(datum("cpu_usage", 1.0, 0.0, "r1"));
  agg.add(datum("cpu_usage", 2.0, 0.0, "r2"));
  agg.add(datum("ram_used_percent", 3.0, 0.0, "r1"));
  EXPECT_EQ(agg.bucket_count(), 3u);
}

TEST(MetricAggregator, DimensionOrderDoesNotSplitBuckets)
{
  MetricDatum a;
  a.metric_name = "m";
  a.value = 1.0;
  a.dimensions = {{"a", "1"}, {"b", "2"}};
  MetricDatum b = a;
  b.dimensions = {{"b", "2"}, {"a", "1"}};

  MetricAggregator agg;
  agg.reset(0.0);
  agg.add(a);
  agg.add(b);
  EXPECT_EQ(agg.bucket_count(), 1u);

  const auto out = agg.flush(1.0);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].dimensions[0].name, "a");
  EXPECT_EQ(out[0].statistics.sample_count, 2u);
}

TEST(MetricAggregator, RejectsAndDropsAreCounted)
{
  MetricAggregatorConfig cfg;
  cfg.max_buckets = 1;
  MetricAggregator agg(cfg);
  agg.reset(0.0);

  MetricDatum bad;
  bad.metric_name = "x";
  bad.value = std::nan("");
  EXPECT_FALSE(agg.add(bad));
  EXPECT_EQ(agg.rejected_count(), 1u);

  EXPECT_TRUE(agg.add(datum("a", 1.0, 0.0)));
  EXPECT_FALSE(agg.add(datum("b", 1.0, 0.0)));
  EXPECT_EQ(agg.dropped_count(), 1u);
  // existing bucket still accepts samples
  EXPECT_TRUE(agg.add(datum("a", 2.0, 0.0)));
}

TEST(MetricAggregator, DueAfterFlushPeriod)
{
  MetricAggregatorConfig cfg;
  cfg.flush_period_sec = 60.0;
  MetricAggregator agg(cfg);
  EXPECT_FALSE(agg.due(100.0));

  agg.reset(100.0);
  EXPECT_FALSE(agg.due(159.9));
  EXPECT_TRUE(agg.due(160.0));

  agg.flush(160.0);
  EXPECT_FALSE(agg.due(161.0));
}

TEST(MetricAggregator, FirstSampleStartsPeriodWhenNotReset)
{
  MetricAggregator agg;
  agg.add(datum("a", 1.0, 42.0));
  const auto out = agg.flush(50.0);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_DOUBLE_EQ(out[0].period_start_sec, 42.0);
}

TEST(MetricAggregator, HighResolutionWinsWithinBucket)
{
  MetricDatum d = datum("a", 1.0, 0.0);
  MetricAggregator agg;
  agg.reset(0.0);
  agg.add(d);
  d.storage_resolution_sec = kStorageResolutionHigh;
  agg.add(d);

  const auto out = agg.flush(1.0);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].storage_resolution_sec, kStorageResolutionHigh);
}

TEST(MetricAggregator, NonPositiveConfigFallsBackToDefaults)
{
  MetricAggregatorConfig cfg;
  cfg.flush_period_sec = -1.0;
  cfg.max_buckets = 0;
  MetricAggregator agg(cfg);
  EXPECT_DOUBLE_EQ(agg.config().flush_period_sec, 60.0);
  EXPECT_EQ(agg.config().max_buckets, 1000u);
}

TEST(MetricAggregator, SeparatorCharactersDoNotMergeBuckets)
{
  MetricDatum a;
  a.metric_name = "m";
  a.value = 1.0;
  a.dimensions = {{"a", "b=c"}};
  MetricDatum b = a;
  b.value = 2.0;
  b.dimensions = {{"a=b", "c"}};
  MetricDatum c = a;
  c.value = 3.0;
  c.dimensions = {{"a", std::string("b\x1f") + "c"}};

  MetricAggregator agg;
  agg.reset(0.0);
  agg.add(a);
  agg.add(b);
  agg.add(c);
  EXPECT_EQ(agg.bucket_count(), 3u);

  for (const AggregatedMetric & m : agg.flush(1.0)) {
    ASSERT_EQ(m.dimensions.size(), 1u);
    EXPECT_EQ(m.statistics.sample_count, 1u);
  }
}

TEST(MetricAggregator, FlushIsOrderedAndStatisticsAreBounded)
{
  MetricAggregator agg;
  agg.reset(0.0);
  for (const double v : {3.0, -7.5, 0.0, 12.25, -0.5}) {
    agg.add(datum("b", v, 1.0));
    agg.add(datum("a", -v, 1.0));
    agg.add(datum("c", v * 2.0, 1.0));
  }

  const auto out = agg.flush(60.0);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].metric_name, "a");
  EXPECT_EQ(out[1].metric_name, "b");
  EXPECT_EQ(out[2].metric_name, "c");

  for (const AggregatedMetric & m : out) {
    const StatisticSet & st = m.statistics;
    EXPECT_EQ(st.sample_count, 5u);
    EXPECT_LE(st.minimum, st.average());
    EXPECT_LE(st.average(), st.maximum);
  }
  EXPECT_DOUBLE_EQ(out[1].statistics.minimum, -7.5);
  EXPECT_DOUBLE_EQ(out[1].statistics.maximum, 12.25);
  EXPECT_DOUBLE_EQ(out[0].statistics.minimum, -12.25);
  EXPECT_DOUBLE_EQ(out[2].statistics.sum, 14.5);
}

}  // namespace
}  // namespace robot_monitoring
