#pragma once

// =============================================================================
// robot_monitoring / route_sequencer.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Goal sources for the route manager.
//
//   inorder - cycle through the configured poses forever
//   random  - pick a configured pose uniformly at random, forever
//   dynamic - sample free cells from the occupancy map (see goal_generator.hpp)
//
// All three implement GoalSource so RouteManager does not care which one it
// is draining.
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "robot_monitoring/geometry_math.hpp"

namespace robot_monitoring
{

enum class RouteMode : std::uint8_t
{
  kInOrder = 0,
  kRandom,
  kDynamic
};

std::optional<RouteMode> parse_route_mode(const std::string & text);
const char * route_mode_to_cstr(RouteMode mode);

// Flat parameter layout [x0, y0, yaw0, x1, y1, yaw1, ...].
// Throws std::runtime_error if the length is not a multiple of 3 or a value
// is not finite.
std::vector<Pose2D> poses_from_flat(const std::vector<double> & flat);

class GoalSource
{
public:
  virtual ~GoalSource() = default;

  // std::nullopt means "no goal can be produced"; the route stops.
  virtual std::optional<Pose2D> next() = 0;
};

class StaticRouteSource : public GoalSource
{
public:
  // mode must be kInOrder or kRandom; throws std::runtime_error otherwise.
  StaticRouteSource(RouteMode mode, std::vector<Pose2D> poses, std::uint32_t seed);

  std::optional<Pose2D> next() override;

  std::size_t size() const { return poses_.size(); }

private:
  RouteMode mode_;
  std::vector<Pose2D> poses_;
  std::size_t cursor_ {0};
  std::mt19937 rng_;
};

}  // namespace robot_monitoring
