// =============================================================================
// robot_monitoring / test/test_route_manager.cpp
// =============================================================================

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include "robot_monitoring/route_manager.hpp"

namespace robot_monitoring
{
namespace
{

// Hands out a fixed number of goals, then reports exhaustion.
class CountingSource : public GoalSource
{
public:
  explicit CountingSource(int available)
  : available_(available)
  {
  }

  std::optional<Pose2D> next() override
  {
    if (handed_out_ >= available_) {
      return std::nullopt;
    }
    Pose2D p;
    p.x = static_cast<double>(handed_out_++);
    return p;
  }

private:
  int available_;
  int handed_out_ {0};
};

RouteManager make_manager(int available, std::uint32_t max_bad = 10)
{
  RouteManagerConfig cfg;
  cfg.max_bad_goals = max_bad;
  return RouteManager(std::make_unique<CountingSource>(available), cfg);
}

TEST(RouteManager, OneGoalInFlight)
{
  RouteManager m = make_manager(100);
  const auto g = m.request_next_goal();
  ASSERT_TRUE(g.has_value());
  EXPECT_TRUE(m.awaiting_result());
  EXPECT_FALSE(m.request_next_goal().has_value());

  m.report_outcome(GoalOutcome::kSucceeded);
  EXPECT_EQ(m.status().phase, RoutePhase::kIdle);
  EXPECT_EQ(m.status().goals_succeeded, 1u);

  const auto g2 = m.request_next_goal();
  ASSERT_TRUE(g2.has_value());
  EXPECT_DOUBLE_EQ(g2->x, 1.0);
  EXPECT_EQ(m.status().goals_sent, 2u);
}

TEST(RouteManager, OutcomeWithoutGoalIsIgnored)
{
  RouteManager m = make_manager(100);
  m.report_outcome(GoalOutcome::kAborted);
  EXPECT_EQ(m.status().bad_goal_count, 0u);
  EXPECT_EQ(m.status().phase, RoutePhase::kIdle);
}

TEST(RouteManager, StopsAfterTooManyBadGoals)
{
  RouteManager m = make_manager(100, 2);

  const GoalOutcome bad[] = {GoalOutcome::kRejected, GoalOutcome::kAborted, GoalOutcome::kTimedOut};
  for (const GoalOutcome o : bad) {
    ASSERT_TRUE(m.request_next_goal().has_value());
    m.report_outcome(o);
  }
  EXPECT_EQ(m.status().bad_goal_count, 3u);

  EXPECT_FALSE(m.request_next_goal().has_value());
  EXPECT_TRUE(m.stopped());
  EXPECT_EQ(m.status().stop_reason, RouteStopReason::kTooManyBadGoals);

  // terminal
  EXPECT_FALSE(m.request_next_goal().has_value());
  EXPECT_EQ(m.status().goals_sent, 3u);
}

TEST(RouteManager, ExactlyMaxBadGoalsKeepsRouting)
{
  RouteManager m = make_manager(100, 2);
  for (int i = 0; i < 2; ++i) {
    ASSERT_TRUE(m.request_next_goal().has_value());
    m.report_outcome(GoalOutcome::kAborted);
  }
  EXPECT_TRUE(m.request_next_goal().has_value());
}

TEST(RouteManager, SuccessAndCancelDoNotCountAsBad)
{
  RouteManager m = make_manager(100, 0);
  ASSERT_TRUE(m.request_next_goal().has_value());
  m.report_outcome(GoalOutcome::kSucceeded);
  ASSERT_TRUE(m.request_next_goal().has_value());
  m.report_outcome(GoalOutcome::kCanceled);

  EXPECT_EQ(m.status().bad_goal_count, 0u);
  EXPECT_TRUE(m.request_next_goal().has_value());
}

TEST(RouteManager, BadGoalCountSurvivesSuccess)
{
  RouteManager m = make_manager(100, 1);
  m.request_next_goal();
  m.report_outcome(GoalOutcome::kAborted);
  m.request_next_goal();
  m.report_outcome(GoalOutcome::kSucceeded);
  m.request_next_goal();
  m.report_outcome(GoalOutcome::kAborted);

  EXPECT_FALSE(m.request_next_goal().has_value());
  EXPECT_TRUE(m.stopped());
}

TEST(RouteManager, StopsWhenSourceIsExhausted)
{
  RouteManager m = make_manager(1);
  ASSERT_TRUE(m.request_next_goal().has_value());
  m.report_outcome(GoalOutcome::kSucceeded);

  EXPECT_FALSE(m.request_next_goal().has_value());
  EXPECT_TRUE(m.stopped());
  EXPECT_EQ(m.status().stop_reason, RouteStopReason::kNoGoalAvailable);
  EXPECT_STREQ(route_stop_reason_to_cstr(m.status().stop_reason), "no_goal_available");
}

TEST(RouteManager, GoalIdsTrackTheGoalInFlight)
{
  RouteManager m = make_manager(100);
  EXPECT_EQ(m.current_goal_id(), 0u);

  ASSERT_TRUE(m.request_next_goal().has_value());
  EXPECT_EQ(m.current_goal_id(), 1u);
  EXPECT_TRUE(m.is_current_goal(1));
  EXPECT_TRUE(m.report_outcome(1, GoalOutcome::kSucceeded));
  EXPECT_EQ(m.current_goal_id(), 0u);
  EXPECT_FALSE(m.is_current_goal(1));

  ASSERT_TRUE(m.request_next_goal().has_value());
  EXPECT_EQ(m.current_goal_id(), 2u);
}

TEST(RouteManager, LateResultForTimedOutGoalIsIgnored)
{
  RouteManager m = make_manager(100);
  ASSERT_TRUE(m.request_next_goal().has_value());
  const std::uint64_t first = m.current_goal_id();
  ASSERT_TRUE(m.report_outcome(first, GoalOutcome::kTimedOut));
  EXPECT_FALSE(m.is_current_goal(first));

  // Nav2 answers the canceled goal after the next one was sent.
  ASSERT_TRUE(m.request_next_goal().has_value());
  EXPECT_FALSE(m.report_outcome(first, GoalOutcome::kSucceeded));
  EXPECT_FALSE(m.report_outcome(first, GoalOutcome::kAborted));

  EXPECT_TRUE(m.awaiting_result());
  EXPECT_EQ(m.status().goals_succeeded, 0u);
  EXPECT_EQ(m.status().bad_goal_count, 1u);
  EXPECT_TRUE(m.is_current_goal(first + 1));
}

TEST(RouteManager, OutcomeForUnknownGoalIdIsIgnoredWhenIdle)
{
  RouteManager m = make_manager(100);
  EXPECT_FALSE(m.report_outcome(0, GoalOutcome::kAborted));
  EXPECT_FALSE(m.report_outcome(7, GoalOutcome::kRejected));
  EXPECT_EQ(m.status().bad_goal_count, 0u);
}

TEST(RouteManager, RequiresSource)
{
  EXPECT_THROW(RouteManager m(nullptr, RouteManagerConfig{}), std::runtime_error);
}

TEST(GoalOutcome, BadOutcomes)
{
  EXPECT_TRUE(is_bad_outcome(GoalOutcome::kRejected));
  EXPECT_TRUE(is_bad_outcome(GoalOutcome::kAborted));
  EXPECT_TRUE(is_bad_outcome(GoalOutcome::kTimedOut));
  EXPECT_FALSE(is_bad_outcome(GoalOutcome::kSucceeded));
  EXPECT_FALSE(is_bad_outcome(GoalOutcome::kCanceled));
  EXPECT_STREQ(goal_outcome_to_cstr(GoalOutcome::kTimedOut), "timed_out");
}

}  // namespace
}  // namespace robot_monitoring
