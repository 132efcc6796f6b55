#pragma once

#include <optional>
#include <vector>

namespace trackcast {

struct TrackPoint {
  double lat{0.0};
  double lon{0.0};
  std::optional<double> elevation;
  // seconds since the unix epoch, UTC
  std::optional<double> timestamp;
};

struct Track {
  std::vector<TrackPoint> points;
  double total_distance{0.0}; // meters
  double total_duration{0.0}; // seconds
};

inline bool all_timestamped(const std::vector<TrackPoint> &points) {
  if (points.empty()) {
    return false;
  }
  for (const auto &p : points) {
    if (!p.timestamp) {
      return false;
    }
  }
  return true;
}

} // namespace trackcast
