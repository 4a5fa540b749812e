// =============================================================================
// robot_monitoring / test/test_route_sequencer.cpp
// =============================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <set>
#include <stdexcept>
#include <vector>

#include "robot_monitoring/route_sequencer.hpp"

namespace robot_monitoring
{
namespace
{

std::vector<Pose2D> square()
{
  return {{0.0, 0.0, 0.0}, {1.0, 0.0, 1.57}, {1.0, 1.0, 3.14}, {0.0, 1.0, -1.57}};
}

TEST(RouteMode, ParsesKnownModes)
{
  EXPECT_EQ(parse_route_mode("inorder"), RouteMode::kInOrder);
  EXPECT_EQ(parse_route_mode("random"), RouteMode::kRandom);
  EXPECT_EQ(parse_route_mode("dynamic"), RouteMode::kDynamic);
  EXPECT_FALSE(parse_route_mode("InOrder").has_value());
  EXPECT_FALSE(parse_route_mode("").has_value());
  EXPECT_STREQ(route_mode_to_cstr(RouteMode::kRandom), "random");
}

TEST(PosesFromFlat, BuildsTriples)
{
  const auto poses = poses_from_flat({1.0, 2.0, 0.5, -1.0, -2.0, 3.0});
  ASSERT_EQ(poses.size(), 2u);
  EXPECT_DOUBLE_EQ(poses[1].x, -1.0);
  EXPECT_DOUBLE_EQ(poses[1].y, -2.0);
  EXPECT_DOUBLE_EQ(poses[1].yaw, 3.0);
  EXPECT_TRUE(poses_from_flat({}).empty());
}

TEST(PosesFromFlat, RejectsMalformedInput)
{
  EXPECT_THROW(poses_from_flat({1.0, 2.0}), std::runtime_error);
  EXPECT_THROW(poses_from_flat({1.0, std::nan(""), 0.0}), std::runtime_error);
}

TEST(StaticRouteSource, InOrderCyclesForever)
{
  StaticRouteSource src(RouteMode::kInOrder, square(), 0);
  for (int lap = 0; lap < 2; ++lap) {
    for (const Pose2D & expected : square()) {
      const auto p = src.next();
      ASSERT_TRUE(p.has_value());
      EXPECT_DOUBLE_EQ(p->x, expected.x);
      EXPECT_DOUBLE_EQ(p->y, expected.y);
      EXPECT_DOUBLE_EQ(p->yaw, expected.yaw);
    }
  }
}

TEST(StaticRouteSource, RandomOnlyReturnsConfiguredPoses)
{
  StaticRouteSource src(RouteMode::kRandom, square(), 7);
  std::set<double> yaws;
  for (int i = 0; i < 200; ++i) {
    const auto p = src.next();
    ASSERT_TRUE(p.has_value());
    yaws.insert(p->yaw);
  }
  // 200 draws over 4 poses visit every pose
  EXPECT_EQ(yaws.size(), 4u);
}

TEST(StaticRouteSource, RandomIsReproducibleForSeed)
{
  StaticRouteSource a(RouteMode::kRandom, square(), 42);
  StaticRouteSource b(RouteMode::kRandom, square(), 42);
  for (int i = 0; i < 20; ++i) {
    EXPECT_DOUBLE_EQ(a.next()->yaw, b.next()->yaw);
  }
}

TEST(StaticRouteSource, EmptyRouteHasNoGoal)
{
  StaticRouteSource src(RouteMode::kInOrder, {}, 0);
  EXPECT_FALSE(src.next().has_value());
}

TEST(StaticRouteSource, DynamicModeIsNotStatic)
{
  EXPECT_THROW(StaticRouteSource src(RouteMode::kDynamic, square(), 0), std::runtime_error);
}

}  // namespace
}  // namespace robot_monitoring
