#pragma once

#include "common/error.h"
#include "common/logger.h"
#include "device/device_pool.h"
#include "playback/playback_scheduler.h"
#include "track/gpx_parser.h"
#include "track/track_library.h"
#include <json/json.h>
#include <string>

namespace trackcast {

struct ApiRequest {
  std::string method;
  std::string target; // path plus optional query
  std::string body;
  std::string content_type;
};

struct ApiResponse {
  int status{200};
  std::string body;
  std::string content_type{"application/json"};
};

// Maps the JSON HTTP surface onto the pool, the scheduler and the track
// library. Errors come back as {"error", "message", "status"} bodies.
class ApiRouter {
public:
  ApiRouter(DevicePool &pool, PlaybackScheduler &scheduler,
            TrackLibrary &library);

  ApiResponse handle(const ApiRequest &request);

  static Json::Value error_body(const Error &error);
  static std::string url_decode(const std::string &text);
  static std::string write(const Json::Value &value);

private:
  Json::Value dispatch(const std::string &method, const std::string &path,
                       const std::string &query, const std::string &body,
                       const std::string &content_type);

  Json::Value list_devices(bool scan);
  Json::Value rename_device(const Json::Value &body);
  Json::Value upload(const std::string &query, const std::string &body,
                     const std::string &content_type);
  Json::Value list_tracks();
  Json::Value delete_track(const std::string &name);
  Json::Value track_details(const std::string &name);
  Json::Value start(const Json::Value &body);
  Json::Value stop();
  Json::Value reset();
  Json::Value status();

  DevicePool &pool_;
  PlaybackScheduler &scheduler_;
  TrackLibrary &library_;
  GpxParser parser_;
  Json::CharReaderBuilder reader_builder_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trackcast
