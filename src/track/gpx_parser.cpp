#include "track/gpx_parser.h"
#include "common/error.h"
#include "track/geo.h"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <filesystem>
#include <fstream>

namespace pt = boost::property_tree;

namespace trackcast {

namespace {
TrackPoint read_point(const pt::ptree &node) {
  TrackPoint p;
  p.lat = node.get<double>("<xmlattr>.lat");
  p.lon = node.get<double>("<xmlattr>.lon");

  if (auto ele = node.get_optional<double>("ele")) {
    p.elevation = *ele;
  }
  if (auto time = node.get_optional<std::string>("time")) {
    p.timestamp = geo::parse_iso8601(*time);
  }
  return p;
}
} // namespace

GpxParser::GpxParser() : logger_(Logger::get("track")) {}

Track GpxParser::parse_file(const std::string &path) const {
  LOG_INFO(logger_, "parsing gpx file: {}", path);

  if (!std::filesystem::exists(path)) {
    throw Error::parse(path, "File not found");
  }

  std::ifstream in(path);
  if (!in) {
    throw Error::parse(path, "cannot open file");
  }
  return parse(in, path);
}

Track GpxParser::parse(std::istream &in, const std::string &source) const {
  Track track;

  try {
    pt::ptree doc;
    pt::read_xml(in, doc, pt::xml_parser::trim_whitespace);

    auto root = doc.get_child_optional("gpx");
    if (!root) {
      throw Error::parse(source, "Invalid GPX format: missing <gpx> element");
    }

    for (const auto &trk : *root) {
      if (trk.first != "trk") {
        continue;
      }
      for (const auto &seg : trk.second) {
        if (seg.first != "trkseg") {
          continue;
        }

        const TrackPoint *prev = nullptr;
        std::optional<double> first_time;
        std::optional<double> last_time;
        size_t seg_start = track.points.size();

        for (const auto &pt_node : seg.second) {
          if (pt_node.first != "trkpt") {
            continue;
          }
          track.points.push_back(read_point(pt_node.second));
        }

        for (size_t i = seg_start; i < track.points.size(); i++) {
          const auto &p = track.points[i];
          if (prev) {
            track.total_distance +=
                geo::haversine_meters(prev->lat, prev->lon, p.lat, p.lon);
          }
          if (p.timestamp) {
            if (!first_time) {
              first_time = p.timestamp;
            }
            last_time = p.timestamp;
          }
          prev = &p;
        }

        if (first_time && last_time && *last_time > *first_time) {
          track.total_duration += *last_time - *first_time;
        }
      }
    }
  } catch (const pt::ptree_error &e) {
    LOG_ERROR(logger_, "invalid gpx format in {}: {}", source, e.what());
    throw Error::parse(source, std::string("Invalid GPX format: ") + e.what());
  }

  if (track.points.empty()) {
    LOG_WARN(logger_, "no track points found in {}", source);
    throw Error::empty_track(source);
  }

  LOG_INFO(logger_, "loaded {} points, dist: {:.2f}m, dur: {:.2f}s",
           track.points.size(), track.total_distance, track.total_duration);
  return track;
}

} // namespace trackcast
