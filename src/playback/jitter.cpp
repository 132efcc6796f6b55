#include "playback/jitter.h"

namespace trackcast {

Coordinate jitter(double lat, double lon, double radius, Rng &rng) {
  if (radius <= 0.0) {
    return {lat, lon};
  }
  return {lat + rng.uniform(-radius, radius), lon + rng.uniform(-radius, radius)};
}

} // namespace trackcast
