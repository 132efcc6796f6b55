#include "api/api_router.h"
#include "track/geo.h"
#include <cctype>
#include <map>
#include <memory>
#include <optional>

namespace trackcast {

namespace {
const std::string kDevices = "/api/devices";
const std::string kTracks = "/api/gpx_files";

std::map<std::string, std::string> parse_query(const std::string &query) {
  std::map<std::string, std::string> params;
  size_t pos = 0;
  while (pos <= query.size()) {
    auto amp = query.find('&', pos);
    if (amp == std::string::npos) {
      amp = query.size();
    }
    auto pair = query.substr(pos, amp - pos);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      if (eq == std::string::npos) {
        params[ApiRouter::url_decode(pair)] = "";
      } else {
        params[ApiRouter::url_decode(pair.substr(0, eq))] =
            ApiRouter::url_decode(pair.substr(eq + 1));
      }
    }
    pos = amp + 1;
  }
  return params;
}

struct FormFile {
  std::string filename;
  std::string contents;
};

// value of key="..." in a Content-Disposition line, matched as a whole
// parameter so that name= does not hit filename=
std::string disposition_param(const std::string &headers,
                              const std::string &key) {
  const std::string needle = key + "=\"";
  size_t pos = 0;
  while ((pos = headers.find(needle, pos)) != std::string::npos) {
    if (pos > 0 && (headers[pos - 1] == ' ' || headers[pos - 1] == ';')) {
      auto start = pos + needle.size();
      auto end = headers.find('"', start);
      if (end == std::string::npos) {
        return "";
      }
      return headers.substr(start, end - start);
    }
    pos += needle.size();
  }
  return "";
}

std::string multipart_boundary(const std::string &content_type) {
  auto pos = content_type.find("boundary=");
  if (pos == std::string::npos) {
    return "";
  }
  auto value = content_type.substr(pos + 9);
  value = value.substr(0, value.find(';'));
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

// multipart/form-data framing:
//   --B\r\n<headers>\r\n\r\n<data>\r\n--B ... --B--
std::optional<FormFile> multipart_file(const std::string &content_type,
                                       const std::string &body,
                                       const std::string &field) {
  auto boundary = multipart_boundary(content_type);
  if (boundary.empty()) {
    throw Error::validation("Multipart body without boundary", "file");
  }
  const std::string delimiter = "--" + boundary;

  auto pos = body.find(delimiter);
  while (pos != std::string::npos) {
    pos += delimiter.size();
    if (body.compare(pos, 2, "--") == 0) {
      break; // closing delimiter
    }

    auto headers_end = body.find("\r\n\r\n", pos);
    if (headers_end == std::string::npos) {
      break;
    }
    auto headers = body.substr(pos, headers_end - pos);
    auto data_start = headers_end + 4;
    auto next = body.find("\r\n" + delimiter, data_start);
    if (next == std::string::npos) {
      break;
    }

    if (disposition_param(headers, "name") == field) {
      return FormFile{disposition_param(headers, "filename"),
                      body.substr(data_start, next - data_start)};
    }
    pos = next + 2;
  }
  return std::nullopt;
}

std::string required_string(const Json::Value &body, const char *field) {
  const auto &value = body[field];
  if (!value.isString()) {
    throw Error::validation(std::string("Field '") + field + "' is required",
                            field);
  }
  return value.asString();
}

std::optional<double> optional_number(const Json::Value &body,
                                      const char *field) {
  const auto &value = body[field];
  if (value.isNull()) {
    return std::nullopt;
  }
  if (!value.isNumeric()) {
    throw Error::validation(
        std::string("Field '") + field + "' must be a number", field);
  }
  return value.asDouble();
}

Json::Value optional_json(const std::optional<double> &value) {
  return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Json::Value message(const std::string &text) {
  Json::Value body;
  body["message"] = text;
  return body;
}

Json::Value device_json(const DeviceHandle &device) {
  Json::Value d;
  d["udid"] = device.udid();
  d["name"] = device.display_name();
  auto real_name = device.factory_name();
  d["real_name"] = real_name ? Json::Value(*real_name)
                             : Json::Value(Json::nullValue);
  d["device_type"] = device_family_to_string(device.family());
  d["connection_type"] = connection_kind_to_string(device.connection_kind());
  d["connected"] = device.connected();
  return d;
}
} // namespace

ApiRouter::ApiRouter(DevicePool &pool, PlaybackScheduler &scheduler,
                     TrackLibrary &library)
    : pool_(pool), scheduler_(scheduler), library_(library),
      logger_(Logger::get("http")) {
  reader_builder_["collectComments"] = false;
}

ApiResponse ApiRouter::handle(const ApiRequest &request) {
  auto q = request.target.find('?');
  auto path = request.target.substr(0, q);
  auto query =
      q == std::string::npos ? std::string() : request.target.substr(q + 1);

  ApiResponse response;
  try {
    response.body = write(dispatch(request.method, path, query, request.body,
                                   request.content_type));
  } catch (const Error &e) {
    LOG_WARN(logger_, "{} {} failed: {} [{}]", request.method, path, e.what(),
             e.code());
    response.status = e.http_status();
    response.body = write(error_body(e));
  } catch (const Json::Exception &e) {
    auto err = Error::validation(e.what());
    response.status = err.http_status();
    response.body = write(error_body(err));
  } catch (const std::exception &e) {
    LOG_ERROR(logger_, "unexpected error on {} {}: {}", request.method, path,
              e.what());
    Json::Value body;
    body["error"] = "INTERNAL_SERVER_ERROR";
    body["message"] = "An unexpected error occurred. Please try again later.";
    body["status"] = 500;
    response.status = 500;
    response.body = write(body);
  }

  LOG_DEBUG(logger_, "{} {} -> {}", request.method, path, response.status);
  return response;
}

Json::Value ApiRouter::error_body(const Error &error) {
  Json::Value body;
  body["error"] = error.code();
  body["message"] = error.what();
  body["status"] = error.http_status();
  if (!error.device_udid().empty()) {
    body["device_udid"] = error.device_udid();
  }
  if (!error.field().empty()) {
    body["field"] = error.field();
  }
  if (!error.filename().empty()) {
    body["filename"] = error.filename();
  }
  return body;
}

std::string ApiRouter::url_decode(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); i++) {
    if (text[i] == '%' && i + 2 < text.size() &&
        std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out.push_back(
          static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else if (text[i] == '+') {
      out.push_back(' ');
    } else {
      out.push_back(text[i]);
    }
  }
  return out;
}

std::string ApiRouter::write(const Json::Value &value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

Json::Value ApiRouter::dispatch(const std::string &method,
                                const std::string &path,
                                const std::string &query,
                                const std::string &body,
                                const std::string &content_type) {
  auto parse_body = [this, &body]() {
    Json::Value doc(Json::objectValue);
    if (body.empty()) {
      return doc;
    }
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(reader_builder_.newCharReader());
    if (!reader->parse(body.data(), body.data() + body.size(), &doc,
                       &errors) ||
        !doc.isObject()) {
      throw Error::validation("Request body must be a JSON object", "body");
    }
    return doc;
  };

  if (method == "GET" && path == kDevices) {
    return list_devices(true);
  }
  if (method == "GET" && path == kDevices + "/all") {
    return list_devices(false);
  }
  if (method == "POST" && path == kDevices + "/rename") {
    return rename_device(parse_body());
  }
  if (method == "POST" && path == "/api/upload") {
    return upload(query, body, content_type);
  }
  if (method == "GET" && path == kTracks) {
    return list_tracks();
  }

  if (path.compare(0, kTracks.size() + 1, kTracks + "/") == 0) {
    auto rest = path.substr(kTracks.size() + 1);
    const std::string details = "/details";
    if (method == "GET" && rest.size() > details.size() &&
        rest.compare(rest.size() - details.size(), details.size(),
                     details) == 0) {
      return track_details(
          url_decode(rest.substr(0, rest.size() - details.size())));
    }
    if (method == "DELETE" && rest.find('/') == std::string::npos) {
      return delete_track(url_decode(rest));
    }
  }

  if (method == "POST" && path == "/api/start") {
    return start(parse_body());
  }
  if (method == "POST" && path == "/api/stop") {
    return stop();
  }
  if (method == "POST" && path == "/api/reset") {
    return reset();
  }
  if (method == "GET" && path == "/api/status") {
    return status();
  }

  throw Error::not_found("Route", method + " " + path);
}

Json::Value ApiRouter::list_devices(bool scan) {
  auto devices = scan ? pool_.scan() : pool_.all();
  Json::Value list(Json::arrayValue);
  for (const auto &device : devices) {
    list.append(device_json(*device));
  }
  return list;
}

Json::Value ApiRouter::rename_device(const Json::Value &body) {
  auto udid = required_string(body, "udid");
  auto name = required_string(body, "name");
  if (!pool_.rename(udid, name)) {
    throw Error::validation("Device name cannot be empty", "name");
  }
  return message("Device renamed successfully");
}

Json::Value ApiRouter::upload(const std::string &query,
                              const std::string &body,
                              const std::string &content_type) {
  std::string filename;
  std::string contents;

  if (content_type.compare(0, 19, "multipart/form-data") == 0) {
    auto file = multipart_file(content_type, body, "file");
    if (!file || file->filename.empty()) {
      throw Error::validation("No file selected", "file");
    }
    filename = std::move(file->filename);
    contents = std::move(file->contents);
  } else {
    // raw body, name in ?filename=
    auto params = parse_query(query);
    auto it = params.find("filename");
    if (it == params.end() || it->second.empty()) {
      throw Error::validation("No file selected", "file");
    }
    filename = it->second;
    contents = body;
  }

  auto result = message("File uploaded successfully");
  result["filename"] = library_.save(filename, contents);
  return result;
}

Json::Value ApiRouter::list_tracks() {
  Json::Value list(Json::arrayValue);
  for (const auto &name : library_.list()) {
    list.append(name);
  }
  return list;
}

Json::Value ApiRouter::delete_track(const std::string &name) {
  library_.remove(name);
  auto result = message("Deleted " + name);
  result["success"] = true;
  return result;
}

Json::Value ApiRouter::track_details(const std::string &name) {
  auto track = parser_.parse_file(library_.path(name));

  Json::Value points(Json::arrayValue);
  for (const auto &p : track.points) {
    Json::Value point;
    point["lat"] = p.lat;
    point["lon"] = p.lon;
    point["ele"] = optional_json(p.elevation);
    point["time"] = p.timestamp ? Json::Value(geo::format_iso8601(*p.timestamp))
                                : Json::Value(Json::nullValue);
    points.append(point);
  }

  Json::Value result;
  result["filename"] = name;
  result["total_distance"] = track.total_distance;
  result["total_duration"] = track.total_duration;
  result["point_count"] = static_cast<Json::UInt64>(track.points.size());
  result["points"] = points;
  return result;
}

Json::Value ApiRouter::start(const Json::Value &body) {
  auto filename = required_string(body, "filename");
  auto path = library_.path(filename);

  const auto &udids_json = body["udids"];
  if (!udids_json.isArray() || udids_json.empty()) {
    throw Error::validation("No devices selected for simulation", "udids");
  }
  std::vector<std::string> udids;
  for (const auto &udid : udids_json) {
    if (!udid.isString()) {
      throw Error::validation("Device ids must be strings", "udids");
    }
    udids.push_back(udid.asString());
  }

  const auto &loop_json = body["loop"];
  if (!loop_json.isNull() && !loop_json.isBool()) {
    throw Error::validation("Field 'loop' must be a boolean", "loop");
  }
  bool loop = loop_json.asBool();
  double speed = optional_number(body, "speed").value_or(1.0);
  auto target_duration = optional_number(body, "target_duration");

  auto track = parser_.parse_file(path);
  double speed_multiplier =
      effective_speed(speed, target_duration, track.total_duration);
  if (speed_multiplier != speed) {
    LOG_INFO(logger_, "calculated speed {:.2f} from target duration {:.2f}s",
             speed_multiplier, *target_duration);
  }

  scheduler_.start(std::move(track.points), udids, loop, speed_multiplier,
                   target_duration);

  auto result = message("Simulation started");
  result["device_count"] =
      static_cast<Json::UInt64>(scheduler_.active_devices().size());
  result["speed_multiplier"] = speed_multiplier;
  return result;
}

Json::Value ApiRouter::stop() {
  scheduler_.stop();
  return message("Simulation stopped");
}

Json::Value ApiRouter::reset() {
  scheduler_.reset();
  return message("Simulation reset and location cleared");
}

Json::Value ApiRouter::status() {
  auto s = scheduler_.status();
  Json::Value result;
  result["running"] = s.running;
  result["current_index"] = static_cast<Json::UInt64>(s.current_index);
  result["total_points"] = static_cast<Json::UInt64>(s.total_points);
  result["speed_multiplier"] = s.speed_multiplier;
  result["loop"] = s.loop;
  result["current_lat"] = optional_json(s.current_lat);
  result["current_lon"] = optional_json(s.current_lon);
  return result;
}

} // namespace trackcast
