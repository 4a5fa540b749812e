// =============================================================================
// robot_monitoring / src/route/route_manager.cpp (ROS 2 Jazzy)
// =============================================================================

#include "robot_monitoring/route_manager.hpp"

#include <stdexcept>
#include <utility>

namespace robot_monitoring
{

const char * route_phase_to_cstr(RoutePhase phase)
{
  switch (phase) {
    case RoutePhase::kIdle: return "idle";
    case RoutePhase::kAwaitingResult: return "awaiting_result";
    case RoutePhase::kStopped: return "stopped";
    default: return "unknown";
  }
}

const char * route_stop_reason_to_cstr(RouteStopReason reason)
{
  switch (reason) {
    case RouteStopReason::kNone: return "none";
    case RouteStopReason::kTooManyBadGoals: return "too_many_bad_goals";
    case RouteStopReason::kNoGoalAvailable: return "no_goal_available";
    default: return "unknown";
  }
}

const char * goal_outcome_to_cstr(GoalOutcome outcome)
{
  switch (outcome) {
    case GoalOutcome::kSucceeded: return "succeeded";
    case GoalOutcome::kRejected: return "rejected";
    case GoalOutcome::kAborted: return "aborted";
    case GoalOutcome::kCanceled: return "canceled";
    case GoalOutcome::kTimedOut: return "timed_out";
    default: return "unknown";
  }
}

bool is_bad_outcome(GoalOutcome outcome)
{
  return outcome == GoalOutcome::kRejected ||
         outcome == GoalOutcome::kAborted ||
         outcome == GoalOutcome::kTimedOut;
}

RouteManager::RouteManager(std::unique_ptr<GoalSource> source, const RouteManagerConfig & cfg)
: source_(std::move(source)),
  config_(cfg)
{
  if (!source_) {
    throw std::runtime_error("RouteManager requires a goal source");
  }
}

std::optional<Pose2D> RouteManager::request_next_goal()
{
  if (status_.phase != RoutePhase::kIdle) {
    return std::nullopt;
  }

  if (status_.bad_goal_count > config_.max_bad_goals) {
    stop_(RouteStopReason::kTooManyBadGoals);
    return std::nullopt;
  }

  std::optional<Pose2D> goal = source_->next();
  if (!goal) {
    stop_(RouteStopReason::kNoGoalAvailable);
    return std::nullopt;
  }

  status_.phase = RoutePhase::kAwaitingResult;
  status_.current_goal = goal;
  ++status_.goals_sent;
  return goal;
}

void RouteManager::report_outcome(GoalOutcome outcome)
{
  if (status_.phase != RoutePhase::kAwaitingResult) {
    return;
  }

  if (is_bad_outcome(outcome)) {
    ++status_.bad_goal_count;
  } else if (outcome == GoalOutcome::kSucceeded) {
    ++status_.goals_succeeded;
  }

  status_.phase = RoutePhase::kIdle;
  status_.current_goal.reset();
}

bool RouteManager::report_outcome(std::uint64_t goal_id, GoalOutcome outcome)
{
  if (!is_current_goal(goal_id)) {
    return false;
  }
  report_outcome(outcome);
  return true;
}

void RouteManager::stop_(RouteStopReason reason)
{
  status_.phase = RoutePhase::kStopped;
  status_.stop_reason = reason;
  status_.current_goal.reset();
}

}  // namespace robot_monitoring
