#include "playback/step_timing.h"

namespace trackcast {

const char *timing_mode_to_string(TimingMode mode) {
  switch (mode) {
  case TimingMode::TIMESTAMPS:
    return "timestamps";
  case TimingMode::TARGET_DURATION:
    return "target_duration";
  case TimingMode::DEFAULT:
    return "default";
  }
  return "unknown";
}

StepTiming::StepTiming(const std::vector<TrackPoint> &points, double speed,
                       std::optional<double> target_duration,
                       const PlaybackConfig &config)
    : points_(points), speed_(speed), config_(config),
      constant_delay_(config.default_delay) {
  if (all_timestamped(points_)) {
    mode_ = TimingMode::TIMESTAMPS;
  } else if (target_duration && *target_duration > 0 && points_.size() > 1) {
    mode_ = TimingMode::TARGET_DURATION;
    constant_delay_ = *target_duration / static_cast<double>(points_.size());
  }
}

double StepTiming::delay(size_t index) const {
  double seconds = constant_delay_;

  // the last point has no successor and keeps the constant delay
  if (mode_ == TimingMode::TIMESTAMPS && index + 1 < points_.size()) {
    seconds = (*points_[index + 1].timestamp - *points_[index].timestamp) /
              speed_;
  }
  return clamp(seconds);
}

double StepTiming::clamp(double seconds) const {
  if (seconds > config_.max_delay) {
    return config_.capped_delay;
  }
  if (seconds < 0.0) {
    return 0.0;
  }
  return seconds;
}

double effective_speed(double speed, std::optional<double> target_duration,
                       double recorded_duration) {
  if (target_duration && *target_duration > 0 && recorded_duration > 0) {
    return recorded_duration / *target_duration;
  }
  return speed;
}

} // namespace trackcast
