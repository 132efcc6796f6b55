#pragma once

#include "common/logger.h"
#include "device/command_runner.h"
#include "device/device_scanner.h"
#include "device/device_transport.h"
#include <memory>

namespace trackcast {

struct AdbTools {
  std::string adb{"adb"};
  std::string intent_action{"com.lexa.fakegps.START"};
};

// Shell bridge to an Android device running a mock-location app that listens
// for a startservice intent carrying lat/long extras.
class AdbTransport : public DeviceTransport {
public:
  AdbTransport(std::shared_ptr<CommandRunner> runner, AdbTools tools,
               std::string serial);

  DeviceFamily family() const override { return DeviceFamily::ANDROID; }

  bool connect(const Endpoint &endpoint, std::string &error) override;
  bool set_location(double lat, double lon, std::string &error) override;
  void disconnect() override;
  std::optional<std::string> fetch_factory_name() override;

private:
  std::vector<std::string> adb_args() const;

  std::shared_ptr<CommandRunner> runner_;
  AdbTools tools_;
  std::string serial_;
  bool attached_{false};
  std::shared_ptr<spdlog::logger> logger_;
};

class AdbScanner : public DeviceScanner {
public:
  AdbScanner(std::shared_ptr<CommandRunner> runner, AdbTools tools);

  DeviceFamily family() const override { return DeviceFamily::ANDROID; }

  std::vector<DiscoveredDevice> scan() override;
  std::unique_ptr<DeviceTransport>
  make_transport(const DiscoveredDevice &record) override;
  std::string fallback_label(const std::string &udid) const override;

private:
  std::shared_ptr<CommandRunner> runner_;
  AdbTools tools_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trackcast
