// =============================================================================
// robot_monitoring / src/sinks/spool_writer.cpp (ROS 2 Jazzy)
// =============================================================================

#include "robot_monitoring/spool_writer.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace robot_monitoring
{

SpoolWriter::SpoolWriter(const SpoolWriterConfig & cfg)
: config_(cfg)
{
  if (config_.path.empty()) {
    throw std::runtime_error("SpoolWriter: empty spool path");
  }
  if (config_.max_file_bytes == 0) {
    config_.max_file_bytes = 10u * 1024u * 1024u;
  }

  const fs::path parent = fs::path(config_.path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error(
        "SpoolWriter: cannot create directory " + parent.string() + ": " + ec.message());
    }
  }
}

void SpoolWriter::append_lines(const std::vector<std::string> & lines)
{
  if (lines.empty()) {
    return;
  }

  rotate_if_needed_();

  std::ofstream out(config_.path, std::ios::out | std::ios::app);
  if (!out.is_open()) {
    throw std::runtime_error("SpoolWriter: cannot open " + config_.path);
  }

  for (const auto & line : lines) {
    std::string clean = line;
    std::replace(clean.begin(), clean.end(), '\n', ' ');
    out << clean << '\n';
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("SpoolWriter: write failed for " + config_.path);
  }
  lines_written_ += lines.size();
}

void SpoolWriter::rotate_if_needed_()
{
  std::error_code ec;
  if (!fs::exists(config_.path, ec)) {
    return;
  }
  const std::uintmax_t size = fs::file_size(config_.path, ec);
  if (ec || size < config_.max_file_bytes) {
    return;
  }

  const std::string rotated = config_.path + ".1";
  fs::rename(config_.path, rotated, ec);
  if (ec) {
    throw std::runtime_error(
      "SpoolWriter: rotate " + config_.path + " -> " + rotated + " failed: " + ec.message());
  }
  ++rotations_;
}

}  // namespace robot_monitoring
