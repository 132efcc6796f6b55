#include "device/ios_device.h"
#include <iomanip>
#include <set>
#include <sstream>

namespace trackcast {

namespace {
std::string format_coord(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(7) << value;
  return oss.str();
}

std::string failure_reason(const CommandResult &result) {
  auto line = first_line(result.output);
  if (!line.empty()) {
    return line;
  }
  return "exit code " + std::to_string(result.exit_code);
}

int major_version(const std::string &version) {
  try {
    return std::stoi(version);
  } catch (const std::exception &) {
    return 0;
  }
}
} // namespace

IosTransport::IosTransport(std::shared_ptr<CommandRunner> runner,
                           IosTools tools, std::string udid)
    : runner_(std::move(runner)), tools_(std::move(tools)),
      udid_(std::move(udid)), logger_(Logger::get("ios")) {}

std::vector<std::string>
IosTransport::lockdown_args(const std::string &tool) const {
  std::vector<std::string> args{tool, "-u", udid_};
  if (endpoint_.kind == ConnectionKind::WIFI) {
    args.push_back("-n");
  }
  return args;
}

std::vector<std::string>
IosTransport::dvt_args(const std::string &action) const {
  std::vector<std::string> args{tools_.pymobiledevice3, "developer", "dvt",
                                "simulate-location", action};
  if (endpoint_.kind == ConnectionKind::WIFI) {
    args.insert(args.end(), {"--tunnel", udid_});
  } else {
    args.insert(args.end(), {"--udid", udid_});
  }
  return args;
}

bool IosTransport::connect(const Endpoint &endpoint, std::string &error) {
  endpoint_ = endpoint;
  LOG_INFO(logger_, "connecting to {} via {}", udid_,
           connection_kind_to_string(endpoint_.kind));

  auto args = lockdown_args(tools_.ideviceinfo);
  args.insert(args.end(), {"-k", "ProductVersion"});
  auto result = runner_->run(args);
  if (!result.ok()) {
    service_ = LocationService::NONE;
    error = failure_reason(result);
    return false;
  }

  auto version = first_line(result.output);
  if (major_version(version) >= kFirstDvtMajorVersion) {
    LOG_INFO(logger_, "{} runs iOS {}, using DVT location simulation", udid_,
             version);
    service_ = LocationService::DVT;
  } else {
    service_ = LocationService::LEGACY;
  }
  return true;
}

int IosTransport::release(CommandSession &session) {
  if (!session.write_line("")) {
    LOG_DEBUG(logger_, "location session on {} already gone", udid_);
  }
  return session.close();
}

bool IosTransport::hold_dvt_location(const std::vector<std::string> &args,
                                     std::string &error) {
  auto session = runner_->spawn(args);
  if (!session) {
    error = "failed to spawn " + tools_.pymobiledevice3;
    return false;
  }
  dvt_sessions_.push_back(std::move(session));

  if (dvt_sessions_.size() <= kHeldDvtSessions) {
    return true;
  }

  auto oldest = std::move(dvt_sessions_.front());
  dvt_sessions_.pop_front();
  int code = release(*oldest);
  if (code != 0) {
    error = "location session exited with code " + std::to_string(code);
    return false;
  }
  return true;
}

bool IosTransport::set_location(double lat, double lon, std::string &error) {
  std::vector<std::string> args;
  switch (service_) {
  case LocationService::NONE:
    error = "Service not available";
    return false;
  case LocationService::LEGACY:
    args = lockdown_args(tools_.idevicesetlocation);
    break;
  case LocationService::DVT:
    args = dvt_args("set");
    break;
  }
  args.insert(args.end(), {"--", format_coord(lat), format_coord(lon)});

  if (service_ == LocationService::DVT) {
    return hold_dvt_location(args, error);
  }

  auto result = runner_->run(args);
  if (!result.ok()) {
    error = failure_reason(result);
    return false;
  }
  return true;
}

void IosTransport::disconnect() {
  if (service_ == LocationService::NONE) {
    return;
  }

  std::vector<std::string> args;
  if (service_ == LocationService::LEGACY) {
    args = lockdown_args(tools_.idevicesetlocation);
    args.push_back("reset");
  } else {
    for (auto &session : dvt_sessions_) {
      int code = release(*session);
      if (code != 0) {
        LOG_DEBUG(logger_, "location session on {} exited with code {}",
                  udid_, code);
      }
    }
    dvt_sessions_.clear();
    args = dvt_args("clear");
  }

  auto result = runner_->run(args);
  if (!result.ok()) {
    LOG_WARN(logger_, "failed to clear location on {}: {}", udid_,
             failure_reason(result));
  }
  service_ = LocationService::NONE;
}

std::optional<std::string> IosTransport::fetch_factory_name() {
  auto args = lockdown_args(tools_.ideviceinfo);
  args.insert(args.end(), {"-k", "DeviceName"});
  auto result = runner_->run(args);
  if (!result.ok()) {
    return std::nullopt;
  }
  auto name = first_line(result.output);
  if (name.empty()) {
    return std::nullopt;
  }
  return name;
}

IosScanner::IosScanner(std::shared_ptr<CommandRunner> runner, IosTools tools)
    : runner_(std::move(runner)), tools_(std::move(tools)),
      logger_(Logger::get("ios")) {}

std::vector<std::string> IosScanner::list_udids(const std::string &flag) {
  std::vector<std::string> udids;
  auto result = runner_->run({tools_.idevice_id, flag});
  if (!result.ok()) {
    LOG_DEBUG(logger_, "{} {} failed: {}", tools_.idevice_id, flag,
              first_line(result.output));
    return udids;
  }

  std::istringstream lines(result.output);
  std::string line;
  while (std::getline(lines, line)) {
    auto udid = first_line(line);
    if (!udid.empty()) {
      udids.push_back(udid);
    }
  }
  return udids;
}

std::vector<DiscoveredDevice> IosScanner::scan() {
  std::vector<DiscoveredDevice> found;
  std::set<std::string> seen;

  for (const auto &udid : list_udids("-l")) {
    if (!seen.insert(udid).second)
      continue;
    found.push_back({udid, DeviceFamily::IOS, {udid, ConnectionKind::USB, ""}});
  }

  for (const auto &udid : list_udids("-n")) {
    if (!seen.insert(udid).second)
      continue;
    found.push_back(
        {udid, DeviceFamily::IOS, {udid, ConnectionKind::WIFI, ""}});
  }

  LOG_DEBUG(logger_, "ios scan found {} devices", found.size());
  return found;
}

std::unique_ptr<DeviceTransport>
IosScanner::make_transport(const DiscoveredDevice &record) {
  return std::make_unique<IosTransport>(runner_, tools_, record.udid);
}

std::string IosScanner::fallback_label(const std::string &udid) const {
  return "iPhone (" + udid.substr(0, 8) + "...)";
}

} // namespace trackcast
