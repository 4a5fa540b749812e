#pragma once

// =============================================================================
// robot_monitoring / stream_watchdog.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Freshness tracker for the input stream of a monitor node (/odom, /scan,
// /goal_pose ...). A monitor only publishes a metric while its input is
// fresh; a stale sensor must not keep reporting its last value.
//
// What it provides
// ----------------
// - "last seen" bookkeeping and a received-message counter
// - fresh/stale decision with an optional startup grace window
// - edge flags (became_fresh / became_stale) for one-shot logging
//
// Time is passed in as seconds (double). Nodes convert `this->now()`.
// =============================================================================

#include <cmath>
#include <cstdint>

namespace robot_monitoring
{

struct StreamWatchdogConfig
{
  // Input older than this is stale. <= 0 disables the timeout.
  double timeout_sec {1.0};

  // Grace window after start() during which "never seen" is not stale.
  double startup_grace_sec {0.0};
};

struct StreamWatchdogStatus
{
  bool has_seen_update {false};
  bool fresh {false};
  bool stale {false};
  bool in_startup_grace {false};

  bool became_fresh {false};
  bool became_stale {false};

  double age_sec {0.0};
  std::uint64_t update_count {0};
};

class StreamWatchdog
{
public:
  StreamWatchdog() = default;

  explicit StreamWatchdog(const StreamWatchdogConfig & cfg)
  : config_(cfg)
  {
    normalize_config_();
  }

  void set_config(const StreamWatchdogConfig & cfg)
  {
    config_ = cfg;
    normalize_config_();
  }

  const StreamWatchdogConfig & config() const
  {
    return config_;
  }

  void start(double now_sec)
  {
    if (!std::isfinite(now_sec)) {
      return;
    }
    started_ = true;
    start_sec_ = now_sec;
    has_prev_ = false;
  }

  // Marks the stream as seen. Returns false if the timestamp is unusable.
  bool update(double now_sec)
  {
    if (!std::isfinite(now_sec)) {
      return false;
    }
    if (!started_) {
      start(now_sec);
    }
    last_update_sec_ = now_sec;
    has_seen_update_ = true;
    ++update_count_;
    return true;
  }

  bool is_fresh(double now_sec) const
  {
    return evaluate_(now_sec).fresh;
  }

  // Full status; also advances the edge-detection baseline.
  StreamWatchdogStatus check(double now_sec)
  {
    StreamWatchdogStatus s = evaluate_(now_sec);
    if (has_prev_) {
      s.became_fresh = !prev_fresh_ && s.fresh;
      s.became_stale = !prev_stale_ && s.stale;
    }
    prev_fresh_ = s.fresh;
    prev_stale_ = s.stale;
    has_prev_ = std::isfinite(now_sec);
    return s;
  }

private:
  StreamWatchdogStatus evaluate_(double now_sec) const
  {
    StreamWatchdogStatus s{};
    s.has_seen_update = has_seen_update_;
    s.update_count = update_count_;

    if (!std::isfinite(now_sec)) {
      s.stale = true;
      return s;
    }

    if (started_ && config_.startup_grace_sec > 0.0) {
      const double since_start = now_sec - start_sec_;
      s.in_startup_grace = since_start >= 0.0 && since_start < config_.startup_grace_sec;
    }

    if (!has_seen_update_) {
      s.stale = !s.in_startup_grace;
      return s;
    }

    s.age_sec = now_sec - last_update_sec_;
    if (s.age_sec < 0.0) {
      // clock went backwards
      s.stale = true;
      return s;
    }

    if (config_.timeout_sec <= 0.0) {
      s.fresh = true;
      return s;
    }

    s.stale = s.age_sec > config_.timeout_sec;
    s.fresh = !s.stale;
    return s;
  }

  void normalize_config_()
  {
    if (!std::isfinite(config_.timeout_sec)) {
      config_.timeout_sec = 1.0;
    }
    if (!std::isfinite(config_.startup_grace_sec) || config_.startup_grace_sec < 0.0) {
      config_.startup_grace_sec = 0.0;
    }
  }

private:
  StreamWatchdogConfig config_ {};

  bool started_ {false};
  double start_sec_ {0.0};

  bool has_seen_update_ {false};
  double last_update_sec_ {0.0};
  std::uint64_t update_count_ {0};

  bool prev_fresh_ {false};
  bool prev_stale_ {false};
  bool has_prev_ {false};
};

}  // namespace robot_monitoring
