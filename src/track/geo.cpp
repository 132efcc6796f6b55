#include "track/geo.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <spdlog/fmt/fmt.h>

namespace trackcast {
namespace geo {

double to_radians(double degrees) { return degrees * M_PI / 180.0; }

double haversine_meters(double lat1, double lon1, double lat2, double lon2) {
  double d_lat = to_radians(lat2 - lat1);
  double d_lon = to_radians(lon2 - lon1);

  double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
             std::cos(to_radians(lat1)) * std::cos(to_radians(lat2)) *
                 std::sin(d_lon / 2) * std::sin(d_lon / 2);

  double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return kEarthRadiusMeters * c;
}

std::optional<double> parse_iso8601(const std::string &text) {
  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year,
                  &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min,
                  &tm.tm_sec, &consumed) != 6) {
    return std::nullopt;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;

  double seconds = static_cast<double>(timegm(&tm));
  size_t pos = static_cast<size_t>(consumed);

  if (pos < text.size() && text[pos] == '.') {
    double scale = 0.1;
    for (++pos; pos < text.size() && std::isdigit(
                                         static_cast<unsigned char>(text[pos]));
         ++pos) {
      seconds += (text[pos] - '0') * scale;
      scale /= 10;
    }
  }

  if (pos == text.size() || text[pos] == 'Z' || text[pos] == 'z') {
    return seconds;
  }

  int off_h = 0;
  int off_m = 0;
  char sign = text[pos];
  if ((sign != '+' && sign != '-') ||
      std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &off_h, &off_m) != 2) {
    return std::nullopt;
  }
  double offset = off_h * 3600.0 + off_m * 60.0;
  return sign == '+' ? seconds - offset : seconds + offset;
}

std::string format_iso8601(double epoch_seconds) {
  auto whole = static_cast<std::time_t>(std::floor(epoch_seconds));
  int millis =
      static_cast<int>(std::lround((epoch_seconds - whole) * 1000.0));
  if (millis == 1000) {
    ++whole;
    millis = 0;
  }

  std::tm tm{};
  gmtime_r(&whole, &tm);

  if (millis == 0) {
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec);
  }
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, millis);
}

} // namespace geo
} // namespace trackcast
