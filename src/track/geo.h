#pragma once

#include <optional>
#include <string>

namespace trackcast {
namespace geo {

constexpr double kEarthRadiusMeters = 6371000.0;

double to_radians(double degrees);

// great-circle distance, ignoring elevation
double haversine_meters(double lat1, double lon1, double lat2, double lon2);

// "2024-05-01T10:00:00Z", "2024-05-01T10:00:00.250+02:00"
std::optional<double> parse_iso8601(const std::string &text);
std::string format_iso8601(double epoch_seconds);

} // namespace geo
} // namespace trackcast
