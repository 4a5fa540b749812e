#pragma once

// =============================================================================
// robot_monitoring / route_manager.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Routing policy for route_manager_node: pulls goals from a GoalSource, keeps
// one goal in flight, and decides when to give up.
//
// State machine
// -------------
//   kIdle -- request_next_goal() --> kAwaitingResult
//   kAwaitingResult -- report_outcome() --> kIdle
//   any -- bad goals > max_bad_goals / source exhausted --> kStopped (terminal)
//
// Bad goals are rejected, aborted and timed-out goals. The counter is not
// reset by later successes: a map that keeps producing unreachable goals
// should eventually stop the robot from wandering.
//
// This class does NOT talk to Nav2. The node sends goals and reports results.
// =============================================================================

#include <cstdint>
#include <memory>
#include <optional>

#include "robot_monitoring/geometry_math.hpp"
#include "robot_monitoring/route_sequencer.hpp"

namespace robot_monitoring
{

enum class RoutePhase : std::uint8_t
{
  kIdle = 0,
  kAwaitingResult,
  kStopped
};

enum class RouteStopReason : std::uint8_t
{
  kNone = 0,
  kTooManyBadGoals,
  kNoGoalAvailable
};

enum class GoalOutcome : std::uint8_t
{
  kSucceeded = 0,
  kRejected,
  kAborted,
  kCanceled,
  kTimedOut
};

struct RouteManagerConfig
{
  std::uint32_t max_bad_goals {10};
};

struct RouteManagerStatus
{
  RoutePhase phase {RoutePhase::kIdle};
  RouteStopReason stop_reason {RouteStopReason::kNone};
  std::uint32_t bad_goal_count {0};
  std::uint64_t goals_sent {0};
  std::uint64_t goals_succeeded {0};
  std::optional<Pose2D> current_goal;
};

const char * route_phase_to_cstr(RoutePhase phase);
const char * route_stop_reason_to_cstr(RouteStopReason reason);
const char * goal_outcome_to_cstr(GoalOutcome outcome);
bool is_bad_outcome(GoalOutcome outcome);

class RouteManager
{
public:
  // Throws std::runtime_error if source is null.
  RouteManager(std::unique_ptr<GoalSource> source, const RouteManagerConfig & cfg);

  // Next goal to send. std::nullopt if a goal is already in flight or the
  // route has stopped (the call that triggers stopping also returns nullopt).
  std::optional<Pose2D> request_next_goal();

  // Ignored unless a goal is in flight.
  void report_outcome(GoalOutcome outcome);

  // Goals are numbered 1, 2, ... in the order request_next_goal() hands them
  // out. An outcome for any goal but the one in flight is ignored (returns
  // false), e.g. a late reply for a goal that already timed out.
  bool report_outcome(std::uint64_t goal_id, GoalOutcome outcome);

  bool is_current_goal(std::uint64_t goal_id) const
  {
    return awaiting_result() && goal_id == status_.goals_sent;
  }
  std::uint64_t current_goal_id() const { return awaiting_result() ? status_.goals_sent : 0; }

  bool stopped() const { return status_.phase == RoutePhase::kStopped; }
  bool awaiting_result() const { return status_.phase == RoutePhase::kAwaitingResult; }
  const RouteManagerStatus & status() const { return status_; }

private:
  void stop_(RouteStopReason reason);

  std::unique_ptr<GoalSource> source_;
  RouteManagerConfig config_ {};
  RouteManagerStatus status_ {};
};

}  // namespace robot_monitoring
