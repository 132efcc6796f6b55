#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

namespace trackcast {
class Config {
public:
  static Config &instance();

  void load(const std::string &path);

  YAML::Node root() const { return root_; }

  std::string system_name() const;
  std::string log_level() const;
  std::string log_dir() const;

  std::string db_path() const;
  std::string upload_dir() const;

  std::string http_address() const;
  int http_port() const;
  int http_request_timeout_ms() const;

  bool transport_enabled(const std::string &name) const;

private:
  Config() = default;
  YAML::Node root_;
};

} // namespace trackcast
