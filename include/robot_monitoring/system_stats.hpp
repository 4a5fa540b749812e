#pragma once

// =============================================================================
// robot_monitoring / system_stats.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Host health sampling (CPU utilization, RAM usage) from Linux procfs.
//
//   /proc/stat     -> aggregate "cpu" jiffies -> usage % between two samples
//   /proc/meminfo  -> MemTotal / MemFree / MemAvailable (kB)
//
// Parsing is separated from file access: ProcSource is the seam, so tests
// feed fixed text and the node uses LinuxProcSource.
//
// Errors
// ------
// - parse_* helpers return std::nullopt on malformed input
// - LinuxProcSource throws std::runtime_error when a file cannot be read
// - SystemStatsSampler::sample() throws std::runtime_error when the text it
//   got cannot be parsed
// =============================================================================

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace robot_monitoring
{

struct CpuTimes
{
  std::uint64_t user {0};
  std::uint64_t nice {0};
  std::uint64_t system {0};
  std::uint64_t idle {0};
  std::uint64_t iowait {0};
  std::uint64_t irq {0};
  std::uint64_t softirq {0};
  std::uint64_t steal {0};

  std::uint64_t idle_total() const { return idle + iowait; }
  std::uint64_t total() const
  {
    return user + nice + system + idle + iowait + irq + softirq + steal;
  }
};

struct MemInfo
{
  std::uint64_t total_kb {0};
  std::uint64_t free_kb {0};
  std::uint64_t available_kb {0};

  double used_percent() const;
};

std::optional<CpuTimes> parse_cpu_times(const std::string & proc_stat);

// 100 * (1 - d_idle / d_total). std::nullopt if the counters did not advance.
std::optional<double> cpu_usage_percent(const CpuTimes & prev, const CpuTimes & curr);

std::optional<MemInfo> parse_meminfo(const std::string & proc_meminfo);

// -----------------------------------------------------------------------------
// Data source seam
// -----------------------------------------------------------------------------
class ProcSource
{
public:
  virtual ~ProcSource() = default;

  virtual std::string read_stat() = 0;
  virtual std::string read_meminfo() = 0;
};

class LinuxProcSource : public ProcSource
{
public:
  explicit LinuxProcSource(std::string proc_root = "/proc");

  std::string read_stat() override;
  std::string read_meminfo() override;

private:
  std::string read_file_(const std::string & name) const;

  std::string proc_root_;
};

// -----------------------------------------------------------------------------
// Sampler
// -----------------------------------------------------------------------------
struct SystemStatsSample
{
  std::optional<double> cpu_usage_percent;  // absent on the first sample
  double ram_used_percent {0.0};
  double free_ram_mb {0.0};
  double total_ram_mb {0.0};
};

class SystemStatsSampler
{
public:
  explicit SystemStatsSampler(std::unique_ptr<ProcSource> source);

  SystemStatsSample sample();

private:
  std::unique_ptr<ProcSource> source_;
  std::optional<CpuTimes> prev_cpu_;
};

}  // namespace robot_monitoring
