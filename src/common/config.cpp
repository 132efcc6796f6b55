#include "common/config.h"
#include "common/error.h"
#include <string>

namespace trackcast {

namespace {
// a missing section yields the fallback instead of an InvalidNode throw
template <typename T>
T lookup(const YAML::Node &root, const std::string &section,
         const std::string &key, const T &fallback) {
  const YAML::Node node = root[section];
  if (!node || !node.IsMap()) {
    return fallback;
  }
  return node[key].as<T>(fallback);
}
} // namespace

Config &Config::instance() {
  static Config cfg;
  return cfg;
}

void Config::load(const std::string &path) {
  try {
    root_ = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw Error::configuration("Failed to load config: " +
                               std::string(e.what()));
  }
}

std::string Config::system_name() const {
  return lookup<std::string>(root_, "system", "name", "trackcast");
}

std::string Config::log_level() const {
  return lookup<std::string>(root_, "system", "log_level", "info");
}

std::string Config::log_dir() const {
  return lookup<std::string>(root_, "system", "log_dir", "logs");
}

std::string Config::db_path() const {
  return lookup<std::string>(root_, "storage", "db_path", "devices.db");
}

std::string Config::upload_dir() const {
  return lookup<std::string>(root_, "tracks", "upload_dir", "uploads");
}

std::string Config::http_address() const {
  return lookup<std::string>(root_, "http", "address", "0.0.0.0");
}

int Config::http_port() const {
  return lookup<int>(root_, "http", "port", 5005);
}

int Config::http_request_timeout_ms() const {
  return lookup<int>(root_, "http", "request_timeout_ms", 10000);
}

bool Config::transport_enabled(const std::string &name) const {
  const YAML::Node devices = root_["devices"];
  if (!devices || !devices.IsMap() || !devices[name]) {
    return true;
  }
  return devices[name]["enabled"].as<bool>(true);
}

} // namespace trackcast
