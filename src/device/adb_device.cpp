#include "device/adb_device.h"
#include <iomanip>
#include <sstream>

namespace trackcast {

AdbTransport::AdbTransport(std::shared_ptr<CommandRunner> runner,
                           AdbTools tools, std::string serial)
    : runner_(std::move(runner)), tools_(std::move(tools)),
      serial_(std::move(serial)), logger_(Logger::get("adb")) {}

std::vector<std::string> AdbTransport::adb_args() const {
  return {tools_.adb, "-s", serial_};
}

bool AdbTransport::connect(const Endpoint &endpoint, std::string &error) {
  if (!endpoint.serial.empty()) {
    serial_ = endpoint.serial;
  }

  auto args = adb_args();
  args.push_back("get-state");
  auto result = runner_->run(args);
  auto state = first_line(result.output);
  if (!result.ok() || state != "device") {
    attached_ = false;
    error = state.empty() ? "ADB device " + serial_ + " not found" : state;
    return false;
  }

  attached_ = true;
  LOG_INFO(logger_, "android device {} attached", serial_);
  return true;
}

bool AdbTransport::set_location(double lat, double lon, std::string &error) {
  if (!attached_) {
    error = "device not attached";
    return false;
  }

  std::ostringstream cmd;
  cmd << std::fixed << std::setprecision(7) << "am startservice -a "
      << tools_.intent_action << " --ed lat " << lat << " --ed long " << lon;

  auto args = adb_args();
  args.insert(args.end(), {"shell", cmd.str()});
  auto result = runner_->run(args);
  if (!result.ok()) {
    error = first_line(result.output);
    if (error.empty()) {
      error = "exit code " + std::to_string(result.exit_code);
    }
    return false;
  }
  return true;
}

void AdbTransport::disconnect() { attached_ = false; }

std::optional<std::string> AdbTransport::fetch_factory_name() {
  auto args = adb_args();
  args.insert(args.end(), {"shell", "getprop ro.product.model"});
  auto result = runner_->run(args);
  if (!result.ok()) {
    return std::nullopt;
  }

  auto model = first_line(result.output);
  if (model.empty()) {
    model = "Unknown";
  }
  return model + " (" + serial_ + ")";
}

AdbScanner::AdbScanner(std::shared_ptr<CommandRunner> runner, AdbTools tools)
    : runner_(std::move(runner)), tools_(std::move(tools)),
      logger_(Logger::get("adb")) {}

std::vector<DiscoveredDevice> AdbScanner::scan() {
  std::vector<DiscoveredDevice> found;

  auto result = runner_->run({tools_.adb, "devices"});
  if (!result.ok()) {
    LOG_DEBUG(logger_, "adb scan failed: {}", first_line(result.output));
    return found;
  }

  // "List of devices attached" header, then "<serial>\t<state>" rows
  std::istringstream lines(result.output);
  std::string line;
  while (std::getline(lines, line)) {
    std::istringstream row(line);
    std::string serial;
    std::string state;
    if (!(row >> serial >> state) || state != "device") {
      continue;
    }
    found.push_back({serial,
                     DeviceFamily::ANDROID,
                     {serial, ConnectionKind::BRIDGED, ""}});
  }

  LOG_DEBUG(logger_, "adb scan found {} devices", found.size());
  return found;
}

std::unique_ptr<DeviceTransport>
AdbScanner::make_transport(const DiscoveredDevice &record) {
  return std::make_unique<AdbTransport>(runner_, tools_,
                                        record.endpoint.serial);
}

std::string AdbScanner::fallback_label(const std::string &udid) const {
  return "Android (" + udid.substr(0, 8) + "...)";
}

} // namespace trackcast
