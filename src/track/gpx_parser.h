#pragma once

#include "common/logger.h"
#include "track/track.h"
#include <iosfwd>
#include <string>

namespace trackcast {

// Reads trk/trkseg/trkpt points out of a GPX document. Throws Error with kind
// PARSE for unreadable input and EMPTY_TRACK when no point is present.
class GpxParser {
public:
  GpxParser();

  Track parse_file(const std::string &path) const;
  Track parse(std::istream &in, const std::string &source) const;

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trackcast
