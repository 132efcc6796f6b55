#include "track/track_library.h"
#include "common/error.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace trackcast {

namespace {
std::string basename_of(const std::string &filename) {
  return fs::path(filename).filename().string();
}
} // namespace

TrackLibrary::TrackLibrary(const std::string &dir)
    : dir_(dir), logger_(Logger::get("track")) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    LOG_WARN(logger_, "cannot create upload dir {}: {}", dir_, ec.message());
  }
}

bool TrackLibrary::allowed(const std::string &filename) {
  auto ext = fs::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".gpx";
}

std::string TrackLibrary::save(const std::string &filename,
                               const std::string &contents) {
  auto name = basename_of(filename);
  if (name.empty() || name == "." || name == "..") {
    throw Error::validation("No file selected", "file");
  }
  if (!allowed(name)) {
    throw Error::invalid_file("Only .gpx files are allowed", name);
  }

  auto target = fs::path(dir_) / name;
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    LOG_ERROR(logger_, "failed to save file {}", target.string());
    throw Error::invalid_file("Failed to save file", name);
  }
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  if (!out) {
    throw Error::invalid_file("Failed to save file", name);
  }

  LOG_INFO(logger_, "stored {} ({} bytes)", name, contents.size());
  return name;
}

std::vector<std::string> TrackLibrary::list() const {
  std::vector<std::string> names;
  std::error_code ec;
  if (!fs::is_directory(dir_, ec)) {
    return names;
  }

  for (const auto &entry : fs::directory_iterator(dir_, ec)) {
    if (entry.is_regular_file() && allowed(entry.path().string())) {
      names.push_back(entry.path().filename().string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

void TrackLibrary::remove(const std::string &filename) {
  auto target = path(filename);
  std::error_code ec;
  if (!fs::remove(target, ec) || ec) {
    throw Error::not_found("GPX file", basename_of(filename));
  }
  LOG_INFO(logger_, "deleted {}", basename_of(filename));
}

std::string TrackLibrary::path(const std::string &filename) const {
  auto name = basename_of(filename);
  auto target = fs::path(dir_) / name;
  std::error_code ec;
  if (name.empty() || !fs::is_regular_file(target, ec)) {
    throw Error::not_found("GPX file", name);
  }
  return target.string();
}

} // namespace trackcast
