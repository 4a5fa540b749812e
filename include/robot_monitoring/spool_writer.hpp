#pragma once

// =============================================================================
// robot_monitoring / spool_writer.hpp (ROS 2 Jazzy)
// =============================================================================
// Append-only line spool used by the metrics and log store sinks. An external
// uploader ships the spool to the cloud backend; this class only guarantees
// that complete lines land on disk and that the file stays bounded.
//
// Rotation: once the file reaches max_file_bytes, it is renamed to
// "<path>.1" (replacing any previous one) and a new file is started.
//
// All I/O failures throw std::runtime_error.
// =============================================================================

#include <cstdint>
#include <string>
#include <vector>

namespace robot_monitoring
{

struct SpoolWriterConfig
{
  std::string path;
  std::uintmax_t max_file_bytes {10u * 1024u * 1024u};
};

class SpoolWriter
{
public:
  explicit SpoolWriter(const SpoolWriterConfig & cfg);

  // Writes each entry followed by '\n'. Entries must not contain newlines;
  // embedded ones are replaced by spaces.
  void append_lines(const std::vector<std::string> & lines);

  const std::string & path() const { return config_.path; }
  std::uint64_t lines_written() const { return lines_written_; }
  std::uint64_t rotations() const { return rotations_; }

private:
  void rotate_if_needed_();

  SpoolWriterConfig config_;
  std::uint64_t lines_written_ {0};
  std::uint64_t rotations_ {0};
};

}  // namespace robot_monitoring
