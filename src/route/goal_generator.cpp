// =============================================================================
// robot_monitoring / src/route/goal_generator.cpp (ROS 2 Jazzy)
// =============================================================================

#include "robot_monitoring/goal_generator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace robot_monitoring
{

GoalGenerator::GoalGenerator(OccupancyGridData grid, std::uint32_t seed, int max_attempts)
: grid_(std::move(grid)),
  max_attempts_(max_attempts > 0 ? max_attempts : kDefaultMaxAttempts),
  rng_(seed)
{
  if (grid_.width == 0 || grid_.height == 0) {
    throw std::runtime_error("GoalGenerator: occupancy grid is empty");
  }
  if (!std::isfinite(grid_.resolution) || grid_.resolution <= 0.0) {
    throw std::runtime_error("GoalGenerator: map resolution must be positive");
  }
  const std::size_t expected =
    static_cast<std::size_t>(grid_.width) * static_cast<std::size_t>(grid_.height);
  if (grid_.data.size() != expected) {
    throw std::runtime_error(
      "GoalGenerator: grid data has " + std::to_string(grid_.data.size()) +
      " cells, expected " + std::to_string(expected));
  }
}

std::size_t GoalGenerator::ravel_index(std::uint32_t x, std::uint32_t y) const
{
  return static_cast<std::size_t>(y) * grid_.width + x;
}

Pose2D GoalGenerator::grid_to_world(std::uint32_t x, std::uint32_t y) const
{
  const double gx = grid_.resolution * static_cast<double>(x);
  const double gy = grid_.resolution * static_cast<double>(y);
  const double c = std::cos(grid_.origin.yaw);
  const double s = std::sin(grid_.origin.yaw);

  Pose2D p;
  p.x = grid_.origin.x + (c * gx - s * gy);
  p.y = grid_.origin.y + (s * gx + c * gy);
  p.yaw = 0.0;
  return p;
}

bool GoalGenerator::check_noise(std::uint32_t x, std::uint32_t y) const
{
  // Window scales with map size so large maps are not judged pixel-by-pixel.
  const std::int64_t dx = std::max<std::int64_t>(2, grid_.width / 50);
  const std::int64_t dy = std::max<std::int64_t>(2, grid_.height / 50);

  const std::int64_t x0 = std::max<std::int64_t>(0, static_cast<std::int64_t>(x) - dx);
  const std::int64_t x1 = std::min<std::int64_t>(grid_.width - 1, static_cast<std::int64_t>(x) + dx);
  const std::int64_t y0 = std::max<std::int64_t>(0, static_cast<std::int64_t>(y) - dy);
  const std::int64_t y1 = std::min<std::int64_t>(grid_.height - 1, static_cast<std::int64_t>(y) + dy);

  for (std::int64_t ix = x0; ix < x1; ++ix) {
    for (std::int64_t iy = y0; iy < y1; ++iy) {
      const std::size_t idx =
        ravel_index(static_cast<std::uint32_t>(ix), static_cast<std::uint32_t>(iy));
      if (grid_.data[idx] != 0) {
        return false;
      }
    }
  }
  return true;
}

std::optional<Pose2D> GoalGenerator::next()
{
  std::uniform_int_distribution<std::uint32_t> pick_x(0, grid_.width - 1);
  std::uniform_int_distribution<std::uint32_t> pick_y(0, grid_.height - 1);

  for (int attempt = 0; attempt < max_attempts_; ++attempt) {
    const std::uint32_t x = pick_x(rng_);
    const std::uint32_t y = pick_y(rng_);
    if (grid_.data[ravel_index(x, y)] == 0 && check_noise(x, y)) {
      return grid_to_world(x, y);
    }
  }
  return std::nullopt;
}

}  // namespace robot_monitoring
