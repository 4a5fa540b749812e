// =============================================================================
// robot_monitoring / src/nodes/route_manager_node.cpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Keeps the robot driving so the monitors have something to report. Goals are
// taken from a GoalSource and sent one at a time to Nav2.
//
//   poses param / /map -> GoalSource -> RouteManager -> navigate_to_pose (Nav2)
//                                                    -> /route_manager/status
//
// Modes
// -----
//   inorder  cycle through `poses` ([x, y, yaw] triples, map frame)
//   random   pick from `poses` at random
//   dynamic  sample free cells from /map once it has been received
//
// Failure handling
// ----------------
// - Rejected, aborted and timed-out goals count as bad goals. After more than
//   max_bad_goals the route stops for good.
// - A goal that runs longer than goal_timeout_sec is canceled.
// - Results that belong to an older goal (late cancel replies) are ignored;
//   an older goal accepted late is canceled.
// - Unknown mode or malformed poses: error logged, routing never starts.
// =============================================================================

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "geometry_msgs/msg/pose_stamped.hpp"
#include "nav2_msgs/action/navigate_to_pose.hpp"
#include "nav_msgs/msg/occupancy_grid.hpp"
#include "rclcpp/rclcpp.hpp"
#include "rclcpp_action/rclcpp_action.hpp"
#include "std_msgs/msg/string.hpp"
#include "tf2/LinearMath/Matrix3x3.h"
#include "tf2/LinearMath/Quaternion.h"

#include "robot_monitoring/geometry_math.hpp"
#include "robot_monitoring/goal_generator.hpp"
#include "robot_monitoring/route_manager.hpp"
#include "robot_monitoring/route_sequencer.hpp"
#include "robot_monitoring/topic_names.hpp"

namespace robot_monitoring
{

class RouteManagerNode : public rclcpp::Node
{
public:
  using NavigateToPose = nav2_msgs::action::NavigateToPose;
  using GoalHandle = rclcpp_action::ClientGoalHandle<NavigateToPose>;

  RouteManagerNode()
  : Node("route_manager_node")
  {
    mode_text_ = this->declare_parameter<std::string>("mode", "inorder");
    const std::vector<double> flat_poses =
      this->declare_parameter<std::vector<double>>("poses", std::vector<double>{});
    seed_ = this->declare_parameter<int64_t>("seed", 0);
    max_bad_goals_ = this->declare_parameter<int64_t>("max_bad_goals", 10);
    route_rate_hz_ = this->declare_parameter<double>("route_rate_hz", 1.0);
    goal_timeout_sec_ = this->declare_parameter<double>("goal_timeout_sec", 300.0);
    frame_id_ = this->declare_parameter<std::string>("frame_id", topic_names::kFrameMap);

    topic_map_ = this->declare_parameter<std::string>("topics.map", topic_names::kMap);
    topic_status_ = this->declare_parameter<std::string>("topics.status", topic_names::kRouteStatus);
    action_name_ = this->declare_parameter<std::string>(
      "navigate_to_pose_action", topic_names::kNavigateToPoseAction);

    log_wait_throttle_ms_ = this->declare_parameter<int>("log.wait_throttle_ms", 5000);

    sanitize_params_();

    pub_status_ = this->create_publisher<std_msgs::msg::String>(topic_status_, rclcpp::QoS(10));
    nav_client_ = rclcpp_action::create_client<NavigateToPose>(this, action_name_);

    setup_route_(flat_poses);

    const auto period = std::chrono::duration<double>(1.0 / route_rate_hz_);
    timer_ = this->create_wall_timer(
      std::chrono::duration_cast<std::chrono::milliseconds>(period),
      std::bind(&RouteManagerNode::on_timer_, this));

    RCLCPP_INFO(
      this->get_logger(),
      "route_manager_node started | mode=%s poses=%zu | action=%s frame=%s | "
      "rate=%.2f Hz timeout=%.0fs max_bad=%ld",
      mode_text_.c_str(), flat_poses.size() / 3, action_name_.c_str(), frame_id_.c_str(),
      route_rate_hz_, goal_timeout_sec_, static_cast<long>(max_bad_goals_));
  }

private:
  // ---------------------------------------------------------------------------
  // Setup
  // ---------------------------------------------------------------------------
  void setup_route_(const std::vector<double> & flat_poses)
  {
    const auto mode = parse_route_mode(mode_text_);
    if (!mode) {
      RCLCPP_ERROR(
        this->get_logger(),
        "unknown route mode '%s' (expected inorder | random | dynamic), routing disabled",
        mode_text_.c_str());
      return;
    }
    mode_ = *mode;

    if (mode_ == RouteMode::kDynamic) {
      // Map servers publish once with transient_local durability.
      sub_map_ = this->create_subscription<nav_msgs::msg::OccupancyGrid>(
        topic_map_, rclcpp::QoS(1).transient_local().reliable(),
        std::bind(&RouteManagerNode::on_map_, this, std::placeholders::_1));
      return;
    }

    std::vector<Pose2D> poses;
    try {
      poses = poses_from_flat(flat_poses);
    } catch (const std::runtime_error & e) {
      RCLCPP_ERROR(this->get_logger(), "invalid poses parameter: %s, routing disabled", e.what());
      return;
    }
    if (poses.empty()) {
      RCLCPP_WARN(this->get_logger(), "mode '%s' with no poses, nothing to route", mode_text_.c_str());
    }

    manager_ = std::make_unique<RouteManager>(
      std::make_unique<StaticRouteSource>(mode_, std::move(poses), seed_u32_()),
      manager_config_());
  }

  void on_map_(const nav_msgs::msg::OccupancyGrid::SharedPtr msg)
  {
    if (!msg || manager_) {
      return;
    }

    OccupancyGridData grid;
    grid.width = msg->info.width;
    grid.height = msg->info.height;
    grid.resolution = static_cast<double>(msg->info.resolution);
    grid.origin.x = msg->info.origin.position.x;
    grid.origin.y = msg->info.origin.position.y;
    grid.origin.yaw = yaw_from_msg_(msg->info.origin.orientation);
    grid.data.assign(msg->data.begin(), msg->data.end());

    try {
      manager_ = std::make_unique<RouteManager>(
        std::make_unique<GoalGenerator>(std::move(grid), seed_u32_()),
        manager_config_());
    } catch (const std::runtime_error & e) {
      RCLCPP_ERROR_THROTTLE(
        this->get_logger(), *this->get_clock(), log_wait_throttle_ms_,
        "unusable map on %s: %s", topic_map_.c_str(), e.what());
      return;
    }

    RCLCPP_INFO(
      this->get_logger(), "map received (%ux%u @ %.3fm), dynamic routing enabled",
      msg->info.width, msg->info.height, static_cast<double>(msg->info.resolution));
  }

  // ---------------------------------------------------------------------------
  // Main loop
  // ---------------------------------------------------------------------------
  void on_timer_()
  {
    publish_status_();

    if (!manager_) {
      if (mode_ == RouteMode::kDynamic) {
        RCLCPP_INFO_THROTTLE(
          this->get_logger(), *this->get_clock(), log_wait_throttle_ms_,
          "waiting for map on %s", topic_map_.c_str());
      }
      return;
    }

    if (manager_->stopped()) {
      return;
    }

    const double now_sec = this->now().seconds();

    if (manager_->awaiting_result()) {
      if (now_sec - goal_sent_sec_ > goal_timeout_sec_) {
        RCLCPP_WARN(
          this->get_logger(), "goal timed out after %.0fs, canceling", goal_timeout_sec_);
        if (goal_handle_) {
          nav_client_->async_cancel_goal(goal_handle_);
        }
        on_outcome_(manager_->current_goal_id(), GoalOutcome::kTimedOut);
      }
      return;
    }

    if (!nav_client_->action_server_is_ready()) {
      RCLCPP_WARN_THROTTLE(
        this->get_logger(), *this->get_clock(), log_wait_throttle_ms_,
        "waiting for action server '%s'", action_name_.c_str());
      return;
    }

    const std::optional<Pose2D> goal = manager_->request_next_goal();
    if (!goal) {
      if (manager_->stopped()) {
        RCLCPP_ERROR(
          this->get_logger(), "route stopped: %s (bad goals=%u)",
          route_stop_reason_to_cstr(manager_->status().stop_reason),
          manager_->status().bad_goal_count);
        publish_status_();
      }
      return;
    }

    send_goal_(*goal, manager_->current_goal_id(), now_sec);
  }

  void send_goal_(const Pose2D & goal, std::uint64_t goal_id, double now_sec)
  {
    tf2::Quaternion q;
    q.setRPY(0.0, 0.0, goal.yaw);

    NavigateToPose::Goal nav_goal;
    nav_goal.pose.header.frame_id = frame_id_;
    nav_goal.pose.header.stamp = this->now();
    nav_goal.pose.pose.position.x = goal.x;
    nav_goal.pose.pose.position.y = goal.y;
    nav_goal.pose.pose.position.z = 0.0;
    nav_goal.pose.pose.orientation.x = q.x();
    nav_goal.pose.pose.orientation.y = q.y();
    nav_goal.pose.pose.orientation.z = q.z();
    nav_goal.pose.pose.orientation.w = q.w();

    goal_sent_sec_ = now_sec;
    goal_handle_.reset();

    rclcpp_action::Client<NavigateToPose>::SendGoalOptions options;
    options.goal_response_callback =
      [this, goal_id](GoalHandle::SharedPtr handle)
      {
        if (!handle) {
          on_outcome_(goal_id, GoalOutcome::kRejected);
          return;
        }
        if (!manager_->is_current_goal(goal_id)) {
          // Accepted after it already timed out: it must not keep driving.
          RCLCPP_WARN(this->get_logger(), "goal #%lu accepted after timeout, canceling",
            static_cast<unsigned long>(goal_id));
          nav_client_->async_cancel_goal(handle);
          return;
        }
        goal_handle_ = handle;
      };
    options.result_callback =
      [this, goal_id](const GoalHandle::WrappedResult & result)
      {
        switch (result.code) {
          case rclcpp_action::ResultCode::SUCCEEDED:
            on_outcome_(goal_id, GoalOutcome::kSucceeded);
            break;
          case rclcpp_action::ResultCode::CANCELED:
            on_outcome_(goal_id, GoalOutcome::kCanceled);
            break;
          case rclcpp_action::ResultCode::ABORTED:
          default:
            on_outcome_(goal_id, GoalOutcome::kAborted);
            break;
        }
      };

    nav_client_->async_send_goal(nav_goal, options);

    RCLCPP_INFO(
      this->get_logger(), "goal #%lu -> (%.2f, %.2f, yaw=%.2f) in '%s'",
      static_cast<unsigned long>(goal_id),
      goal.x, goal.y, goal.yaw, frame_id_.c_str());
  }

  void on_outcome_(std::uint64_t goal_id, GoalOutcome outcome)
  {
    if (!manager_ || !manager_->report_outcome(goal_id, outcome)) {
      RCLCPP_DEBUG(
        this->get_logger(), "ignoring %s for stale goal #%lu", goal_outcome_to_cstr(outcome),
        static_cast<unsigned long>(goal_id));
      return;
    }
    goal_handle_.reset();

    if (is_bad_outcome(outcome)) {
      RCLCPP_WARN(
        this->get_logger(), "goal %s (bad goals=%u/%ld)",
        goal_outcome_to_cstr(outcome), manager_->status().bad_goal_count,
        static_cast<long>(max_bad_goals_));
    } else {
      RCLCPP_INFO(this->get_logger(), "goal %s", goal_outcome_to_cstr(outcome));
    }
    publish_status_();
  }

  void publish_status_()
  {
    std::ostringstream ss;
    ss << "mode=" << mode_text_;
    if (!manager_) {
      ss << " phase=inactive";
    } else {
      const RouteManagerStatus & s = manager_->status();
      ss << " phase=" << route_phase_to_cstr(s.phase)
         << " stop_reason=" << route_stop_reason_to_cstr(s.stop_reason)
         << " sent=" << s.goals_sent
         << " succeeded=" << s.goals_succeeded
         << " bad=" << s.bad_goal_count;
    }

    std_msgs::msg::String msg;
    msg.data = ss.str();
    pub_status_->publish(msg);
  }

  // ---------------------------------------------------------------------------
  // Helpers
  // ---------------------------------------------------------------------------
  static double yaw_from_msg_(const geometry_msgs::msg::Quaternion & q_msg)
  {
    tf2::Quaternion q(q_msg.x, q_msg.y, q_msg.z, q_msg.w);
    if (q.length2() < 1e-12) {
      return 0.0;
    }
    q.normalize();
    double roll = 0.0;
    double pitch = 0.0;
    double yaw = 0.0;
    tf2::Matrix3x3(q).getRPY(roll, pitch, yaw);
    return GeometryMath::wrap_angle_rad(yaw);
  }

  std::uint32_t seed_u32_() const
  {
    return static_cast<std::uint32_t>(seed_);
  }

  RouteManagerConfig manager_config_() const
  {
    RouteManagerConfig cfg{};
    cfg.max_bad_goals = static_cast<std::uint32_t>(max_bad_goals_);
    return cfg;
  }

  void sanitize_params_()
  {
    if (!std::isfinite(route_rate_hz_) || route_rate_hz_ <= 0.0) {
      route_rate_hz_ = 1.0;
    }
    if (!std::isfinite(goal_timeout_sec_) || goal_timeout_sec_ <= 0.0) {
      goal_timeout_sec_ = 300.0;
    }
    if (max_bad_goals_ < 0) {
      max_bad_goals_ = 10;
    }
    if (seed_ < 0) {
      seed_ = 0;
    }
    if (log_wait_throttle_ms_ < 0) {
      log_wait_throttle_ms_ = 5000;
    }
    if (frame_id_.empty()) frame_id_ = topic_names::kFrameMap;
    if (topic_map_.empty()) topic_map_ = topic_names::kMap;
    if (topic_status_.empty()) topic_status_ = topic_names::kRouteStatus;
    if (action_name_.empty()) action_name_ = topic_names::kNavigateToPoseAction;
  }

private:
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_status_;
  rclcpp::Subscription<nav_msgs::msg::OccupancyGrid>::SharedPtr sub_map_;
  rclcpp_action::Client<NavigateToPose>::SharedPtr nav_client_;
  rclcpp::TimerBase::SharedPtr timer_;

  std::string mode_text_;
  std::string frame_id_;
  std::string topic_map_;
  std::string topic_status_;
  std::string action_name_;

  int64_t seed_{0};
  int64_t max_bad_goals_{10};
  double route_rate_hz_{1.0};
  double goal_timeout_sec_{300.0};
  int log_wait_throttle_ms_{5000};

  RouteMode mode_{RouteMode::kInOrder};
  std::unique_ptr<RouteManager> manager_;

  GoalHandle::SharedPtr goal_handle_;
  double goal_sent_sec_{0.0};
};

}  // namespace robot_monitoring

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  int rc = 0;
  try {
    rclcpp::spin(std::make_shared<robot_monitoring::RouteManagerNode>());
  } catch (const std::exception & e) {
    std::fprintf(stderr, "[route_manager_node] FATAL: %s\n", e.what());
    rc = 1;
  }
  rclcpp::shutdown();
  return rc;
}
