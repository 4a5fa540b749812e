// =============================================================================
// robot_monitoring / src/metrics/metric_aggregator.cpp (ROS 2 Jazzy)
// =============================================================================

#include "robot_monitoring/metric_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace robot_monitoring
{

void StatisticSet::add(double value)
{
  if (sample_count == 0) {
    minimum = value;
    maximum = value;
  } else {
    minimum = std::min(minimum, value);
    maximum = std::max(maximum, value);
  }
  sum += value;
  ++sample_count;
}

double StatisticSet::average() const
{
  if (sample_count == 0) {
    return 0.0;
  }
  return sum / static_cast<double>(sample_count);
}

MetricAggregator::MetricAggregator(const MetricAggregatorConfig & cfg)
: config_(cfg)
{
  normalize_config_();
}

void MetricAggregator::set_config(const MetricAggregatorConfig & cfg)
{
  config_ = cfg;
  normalize_config_();
}

void MetricAggregator::reset(double now_sec)
{
  buckets_.clear();
  started_ = std::isfinite(now_sec);
  period_start_sec_ = started_ ? now_sec : 0.0;
}

bool MetricAggregator::add(const MetricDatum & datum)
{
  if (datum.metric_name.empty() || !std::isfinite(datum.value)) {
    ++rejected_count_;
    return false;
  }

  std::vector<MetricDimension> dims = sorted_dimensions(datum.dimensions);
  BucketKey key = make_key_(datum.metric_name, datum.unit, dims);

  auto it = buckets_.find(key);
  if (it == buckets_.end()) {
    if (buckets_.size() >= config_.max_buckets) {
      ++dropped_count_;
      return false;
    }
    AggregatedMetric fresh;
    fresh.metric_name = datum.metric_name;
    fresh.unit = datum.unit;
    fresh.dimensions = std::move(dims);
    fresh.storage_resolution_sec = datum.storage_resolution_sec;
    it = buckets_.emplace(std::move(key), std::move(fresh)).first;
  } else {
    // High resolution wins if any sample in the bucket asked for it.
    it->second.storage_resolution_sec =
      std::min(it->second.storage_resolution_sec, datum.storage_resolution_sec);
  }

  if (!started_ && std::isfinite(datum.timestamp_sec)) {
    started_ = true;
    period_start_sec_ = datum.timestamp_sec;
  }

  it->second.statistics.add(datum.value);
  return true;
}

bool MetricAggregator::due(double now_sec) const
{
  if (!started_ || !std::isfinite(now_sec)) {
    return false;
  }
  return (now_sec - period_start_sec_) >= config_.flush_period_sec;
}

std::vector<AggregatedMetric> MetricAggregator::flush(double now_sec)
{
  std::vector<AggregatedMetric> out;
  out.reserve(buckets_.size());

  const double start = started_ ? period_start_sec_ : now_sec;
  for (auto & kv : buckets_) {
    AggregatedMetric m = std::move(kv.second);
    if (m.statistics.sample_count == 0) {
      continue;
    }
    m.period_start_sec = start;
    m.period_end_sec = now_sec;
    out.push_back(std::move(m));
  }

  reset(now_sec);
  return out;
}

MetricAggregator::BucketKey MetricAggregator::make_key_(
  const std::string & name,
  const std::string & unit,
  const std::vector<MetricDimension> & sorted_dims)
{
  std::vector<std::pair<std::string, std::string>> dims;
  dims.reserve(sorted_dims.size());
  for (const auto & d : sorted_dims) {
    dims.emplace_back(d.name, d.value);
  }
  return BucketKey{name, unit, std::move(dims)};
}

void MetricAggregator::normalize_config_()
{
  if (!std::isfinite(config_.flush_period_sec) || config_.flush_period_sec <= 0.0) {
    config_.flush_period_sec = 60.0;
  }
  if (config_.max_buckets == 0) {
    config_.max_buckets = 1000;
  }
}

}  // namespace robot_monitoring
