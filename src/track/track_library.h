#pragma once

#include "common/logger.h"
#include <string>
#include <vector>

namespace trackcast {

// Flat directory of uploaded .gpx files addressed by basename.
class TrackLibrary {
public:
  explicit TrackLibrary(const std::string &dir);

  // returns the stored basename
  std::string save(const std::string &filename, const std::string &contents);

  std::vector<std::string> list() const;
  void remove(const std::string &filename);
  std::string path(const std::string &filename) const;

  const std::string &dir() const { return dir_; }

  static bool allowed(const std::string &filename);

private:
  std::string dir_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trackcast
