// =============================================================================
// robot_monitoring / test/test_spool_writer.cpp
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "robot_monitoring/spool_writer.hpp"

namespace fs = std::filesystem;

namespace robot_monitoring
{
namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream f(p);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

class SpoolWriterTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    const auto * info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() / "robot_monitoring_tests" / info->name();
    fs::remove_all(dir_);
  }

  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
};

TEST_F(SpoolWriterTest, CreatesParentDirectoriesAndAppends)
{
  SpoolWriterConfig cfg;
  cfg.path = (dir_ / "nested" / "metrics.jsonl").string();
  SpoolWriter w(cfg);

  w.append_lines({"a", "b"});
  w.append_lines({"c"});
  w.append_lines({});

  EXPECT_EQ(read_all(cfg.path), "a\nb\nc\n");
  EXPECT_EQ(w.lines_written(), 3u);
  EXPECT_EQ(w.rotations(), 0u);
}

TEST_F(SpoolWriterTest, EmbeddedNewlinesAreFlattened)
{
  SpoolWriterConfig cfg;
  cfg.path = (dir_ / "logs.log").string();
  SpoolWriter w(cfg);

  w.append_lines({"first\nsecond"});
  EXPECT_EQ(read_all(cfg.path), "first second\n");
}

TEST_F(SpoolWriterTest, RotatesWhenFull)
{
  SpoolWriterConfig cfg;
  cfg.path = (dir_ / "metrics.jsonl").string();
  cfg.max_file_bytes = 8;
  SpoolWriter w(cfg);

  w.append_lines({"0123456789"});
  w.append_lines({"next"});

  EXPECT_EQ(w.rotations(), 1u);
  EXPECT_EQ(read_all(cfg.path + ".1"), "0123456789\n");
  EXPECT_EQ(read_all(cfg.path), "next\n");
}

TEST(SpoolWriter, EmptyPathThrows)
{
  EXPECT_THROW(SpoolWriter w(SpoolWriterConfig{}), std::runtime_error);
}

TEST_F(SpoolWriterTest, UncreatableDirectoryThrows)
{
  fs::create_directories(dir_);
  const fs::path blocker = dir_ / "file";
  std::ofstream(blocker) << "x";

  SpoolWriterConfig cfg;
  cfg.path = (blocker / "sub" / "metrics.jsonl").string();
  EXPECT_THROW(SpoolWriter w(cfg), std::runtime_error);
}

}  // namespace
}  // namespace robot_monitoring
