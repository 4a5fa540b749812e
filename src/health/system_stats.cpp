// =============================================================================
// robot_monitoring / src/health/system_stats.cpp (ROS 2 Jazzy)
// =============================================================================

#include "robot_monitoring/system_stats.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace robot_monitoring
{

double MemInfo::used_percent() const
{
  if (total_kb == 0) {
    return 0.0;
  }
  const std::uint64_t avail = (available_kb > total_kb) ? total_kb : available_kb;
  return 100.0 * static_cast<double>(total_kb - avail) / static_cast<double>(total_kb);
}

std::optional<CpuTimes> parse_cpu_times(const std::string & proc_stat)
{
  std::istringstream in(proc_stat);
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream ls(line);
    std::string label;
    ls >> label;
    if (label != "cpu") {
      continue;  // skip per-core "cpuN" lines and everything else
    }

    CpuTimes t;
    if (!(ls >> t.user >> t.nice >> t.system >> t.idle)) {
      return std::nullopt;
    }
    // Older kernels stop after idle; missing trailing fields stay 0.
    ls >> t.iowait >> t.irq >> t.softirq >> t.steal;
    return t;
  }
  return std::nullopt;
}

std::optional<double> cpu_usage_percent(const CpuTimes & prev, const CpuTimes & curr)
{
  const std::uint64_t total_prev = prev.total();
  const std::uint64_t total_curr = curr.total();
  if (total_curr <= total_prev) {
    return std::nullopt;
  }
  const std::uint64_t idle_prev = prev.idle_total();
  const std::uint64_t idle_curr = curr.idle_total();

  const double d_total = static_cast<double>(total_curr - total_prev);
  const double d_idle = (idle_curr >= idle_prev) ? static_cast<double>(idle_curr - idle_prev) : 0.0;

  double usage = 100.0 * (1.0 - d_idle / d_total);
  if (usage < 0.0) {
    usage = 0.0;
  } else if (usage > 100.0) {
    usage = 100.0;
  }
  return usage;
}

std::optional<MemInfo> parse_meminfo(const std::string & proc_meminfo)
{
  std::optional<std::uint64_t> total;
  std::optional<std::uint64_t> free;
  std::optional<std::uint64_t> available;
  std::uint64_t buffers = 0;
  std::uint64_t cached = 0;

  std::istringstream in(proc_meminfo);
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream ls(line);
    std::string key;
    std::uint64_t value = 0;
    if (!(ls >> key >> value)) {
      continue;
    }
    if (key == "MemTotal:") {
      total = value;
    } else if (key == "MemFree:") {
      free = value;
    } else if (key == "MemAvailable:") {
      available = value;
    } else if (key == "Buffers:") {
      buffers = value;
    } else if (key == "Cached:") {
      cached = value;
    }
  }

  if (!total || !free || *total == 0) {
    return std::nullopt;
  }

  MemInfo m;
  m.total_kb = *total;
  m.free_kb = *free;
  m.available_kb = available ? *available : (*free + buffers + cached);
  return m;
}

// -----------------------------------------------------------------------------
// LinuxProcSource
// -----------------------------------------------------------------------------
LinuxProcSource::LinuxProcSource(std::string proc_root)
: proc_root_(std::move(proc_root))
{
}

std::string LinuxProcSource::read_stat()
{
  return read_file_("stat");
}

std::string LinuxProcSource::read_meminfo()
{
  return read_file_("meminfo");
}

std::string LinuxProcSource::read_file_(const std::string & name) const
{
  const std::string path = proc_root_ + "/" + name;
  std::ifstream f(path);
  if (!f.is_open()) {
    throw std::runtime_error("Failed to open " + path);
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) {
    throw std::runtime_error("Failed to read " + path);
  }
  return ss.str();
}

// -----------------------------------------------------------------------------
// SystemStatsSampler
// -----------------------------------------------------------------------------
SystemStatsSampler::SystemStatsSampler(std::unique_ptr<ProcSource> source)
: source_(std::move(source))
{
  if (!source_) {
    throw std::runtime_error("SystemStatsSampler requires a ProcSource");
  }
}

SystemStatsSample SystemStatsSampler::sample()
{
  const std::optional<CpuTimes> cpu = parse_cpu_times(source_->read_stat());
  if (!cpu) {
    throw std::runtime_error("Unable to parse cpu line from stat");
  }
  const std::optional<MemInfo> mem = parse_meminfo(source_->read_meminfo());
  if (!mem) {
    throw std::runtime_error("Unable to parse MemTotal/MemFree from meminfo");
  }

  SystemStatsSample s;
  if (prev_cpu_) {
    s.cpu_usage_percent = cpu_usage_percent(*prev_cpu_, *cpu);
  }
  prev_cpu_ = cpu;

  s.ram_used_percent = mem->used_percent();
  s.free_ram_mb = static_cast<double>(mem->available_kb) / 1024.0;
  s.total_ram_mb = static_cast<double>(mem->total_kb) / 1024.0;
  return s;
}

}  // namespace robot_monitoring
