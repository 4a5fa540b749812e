#pragma once

// =============================================================================
// robot_monitoring / metric_aggregator.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Folds individual MetricDatum samples into per-period statistic sets
// (count / sum / min / max) before they are handed to the metrics store.
//
// Buckets are keyed by metric name, unit and the dimension set. Dimension
// order does not matter: {a=1, b=2} and {b=2, a=1} share a bucket.
//
// Usage (node side)
// -----------------
//   aggregator.reset(now);
//   on /metrics:  aggregator.add(datum);
//   on timer:     if (aggregator.due(now)) write(aggregator.flush(now));
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "robot_monitoring/metric.hpp"

namespace robot_monitoring
{

struct StatisticSet
{
  std::uint64_t sample_count {0};
  double sum {0.0};
  double minimum {0.0};
  double maximum {0.0};

  void add(double value);
  double average() const;
};

struct AggregatedMetric
{
  std::string metric_name;
  std::string unit;
  std::vector<MetricDimension> dimensions;  // sorted
  StatisticSet statistics;
  double period_start_sec {0.0};
  double period_end_sec {0.0};
  int storage_resolution_sec {kStorageResolutionStandard};
};

struct MetricAggregatorConfig
{
  double flush_period_sec {60.0};
  std::size_t max_buckets {1000};
};

class MetricAggregator
{
public:
  MetricAggregator() = default;
  explicit MetricAggregator(const MetricAggregatorConfig & cfg);

  void set_config(const MetricAggregatorConfig & cfg);
  const MetricAggregatorConfig & config() const { return config_; }

  // Starts a new period at now_sec and discards buffered samples.
  void reset(double now_sec);

  // Returns false if the datum was rejected (invalid) or dropped (bucket limit).
  bool add(const MetricDatum & datum);

  bool due(double now_sec) const;

  // Emits one entry per non-empty bucket, ordered by bucket key, and starts
  // the next period at now_sec.
  std::vector<AggregatedMetric> flush(double now_sec);

  std::size_t bucket_count() const { return buckets_.size(); }
  std::uint64_t rejected_count() const { return rejected_count_; }
  std::uint64_t dropped_count() const { return dropped_count_; }

private:
  // (name, unit, sorted dimension pairs). Compared field by field, so no
  // separator inside a name or value can merge two buckets.
  using BucketKey = std::tuple<
    std::string, std::string, std::vector<std::pair<std::string, std::string>>>;

  static BucketKey make_key_(
    const std::string & name,
    const std::string & unit,
    const std::vector<MetricDimension> & sorted_dims);

  void normalize_config_();

  MetricAggregatorConfig config_ {};
  std::map<BucketKey, AggregatedMetric> buckets_;

  bool started_ {false};
  double period_start_sec_ {0.0};

  std::uint64_t rejected_count_ {0};
  std::uint64_t dropped_count_ {0};
};

}  // namespace robot_monitoring
