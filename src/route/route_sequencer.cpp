// =============================================================================
// robot_monitoring / src/route/route_sequencer.cpp (ROS 2 Jazzy)
// =============================================================================

#include "robot_monitoring/route_sequencer.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace robot_monitoring
{

std::optional<RouteMode> parse_route_mode(const std::string & text)
{
  if (text == "inorder") return RouteMode::kInOrder;
  if (text == "random") return RouteMode::kRandom;
  if (text == "dynamic") return RouteMode::kDynamic;
  return std::nullopt;
}

const char * route_mode_to_cstr(RouteMode mode)
{
  switch (mode) {
    case RouteMode::kInOrder: return "inorder";
    case RouteMode::kRandom: return "random";
    case RouteMode::kDynamic: return "dynamic";
    default: return "unknown";
  }
}

std::vector<Pose2D> poses_from_flat(const std::vector<double> & flat)
{
  if (flat.size() % 3 != 0) {
    throw std::runtime_error(
      "poses must hold [x, y, yaw] triples, got " + std::to_string(flat.size()) + " values");
  }

  std::vector<Pose2D> poses;
  poses.reserve(flat.size() / 3);
  for (std::size_t i = 0; i < flat.size(); i += 3) {
    Pose2D p;
    p.x = flat[i];
    p.y = flat[i + 1];
    p.yaw = flat[i + 2];
    if (!GeometryMath::is_finite_pose(p)) {
      throw std::runtime_error("pose " + std::to_string(i / 3) + " has a non-finite value");
    }
    poses.push_back(p);
  }
  return poses;
}

StaticRouteSource::StaticRouteSource(RouteMode mode, std::vector<Pose2D> poses, std::uint32_t seed)
: mode_(mode),
  poses_(std::move(poses)),
  rng_(seed)
{
  if (mode_ != RouteMode::kInOrder && mode_ != RouteMode::kRandom) {
    throw std::runtime_error(
      std::string("StaticRouteSource does not support mode ") + route_mode_to_cstr(mode_));
  }
}

std::optional<Pose2D> StaticRouteSource::next()
{
  if (poses_.empty()) {
    return std::nullopt;
  }

  if (mode_ == RouteMode::kRandom) {
    std::uniform_int_distribution<std::size_t> pick(0, poses_.size() - 1);
    return poses_[pick(rng_)];
  }

  const Pose2D p = poses_[cursor_];
  cursor_ = (cursor_ + 1) % poses_.size();
  return p;
}

}  // namespace robot_monitoring
