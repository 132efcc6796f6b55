#pragma once

#include "track/track.h"
#include <optional>
#include <vector>

namespace trackcast {

struct PlaybackConfig {
  double jitter_radius{2e-5}; // degrees, per axis
  double default_delay{1.0};  // seconds
  double max_delay{300.0};
  double capped_delay{5.0};
};

enum class TimingMode { TIMESTAMPS, TARGET_DURATION, DEFAULT };

const char *timing_mode_to_string(TimingMode mode);

// Inter-step delays for one run. The mode is fixed from the points when the
// run starts; delay(i) is the wait after broadcasting point i.
class StepTiming {
public:
  StepTiming(const std::vector<TrackPoint> &points, double speed,
             std::optional<double> target_duration,
             const PlaybackConfig &config);

  TimingMode mode() const { return mode_; }
  double delay(size_t index) const;

private:
  double clamp(double seconds) const;

  const std::vector<TrackPoint> &points_;
  double speed_;
  PlaybackConfig config_;
  TimingMode mode_{TimingMode::DEFAULT};
  double constant_delay_;
};

// recorded / target when both are positive, otherwise speed
double effective_speed(double speed, std::optional<double> target_duration,
                       double recorded_duration);

} // namespace trackcast
