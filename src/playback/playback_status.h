#pragma once

#include <cstddef>
#include <optional>

namespace trackcast {

struct PlaybackStatus {
  bool running{false};
  size_t current_index{0};
  size_t total_points{0};
  double speed_multiplier{1.0};
  bool loop{false};
  std::optional<double> current_lat;
  std::optional<double> current_lon;
};

} // namespace trackcast
