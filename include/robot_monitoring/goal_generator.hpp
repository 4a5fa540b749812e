#pragma once

// =============================================================================
// robot_monitoring / goal_generator.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Produces random, reachable-looking goals from a static occupancy grid for
// the "dynamic" route mode.
//
// A candidate cell is accepted when it is free (0) and every cell in a small
// window around it is free as well. The window check filters out isolated
// free pixels that sensor noise leaves inside obstacles.
//
// Assumptions
// -----------
// - The map does not change after construction.
// - The grid->world transform is an x/y translation plus a yaw rotation
//   (the only components a map.yaml origin carries).
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "robot_monitoring/geometry_math.hpp"
#include "robot_monitoring/route_sequencer.hpp"

namespace robot_monitoring
{

struct OccupancyGridData
{
  std::uint32_t width {0};
  std::uint32_t height {0};
  double resolution {0.05};  // m / cell
  Pose2D origin {};          // world pose of cell (0, 0)
  std::vector<std::int8_t> data;  // row-major, -1 unknown, 0 free, 100 occupied
};

class GoalGenerator : public GoalSource
{
public:
  static constexpr int kDefaultMaxAttempts = 100;

  // Throws std::runtime_error if the grid is empty, the resolution is not
  // positive, or data.size() != width * height.
  GoalGenerator(OccupancyGridData grid, std::uint32_t seed, int max_attempts = kDefaultMaxAttempts);

  std::optional<Pose2D> next() override;

  std::size_t ravel_index(std::uint32_t x, std::uint32_t y) const;
  Pose2D grid_to_world(std::uint32_t x, std::uint32_t y) const;

  // False if any cell in [x - dx, x + dx) x [y - dy, y + dy), clipped to the
  // map, is not free.
  bool check_noise(std::uint32_t x, std::uint32_t y) const;

  const OccupancyGridData & grid() const { return grid_; }

private:
  OccupancyGridData grid_;
  int max_attempts_;
  std::mt19937 rng_;
};

}  // namespace robot_monitoring
