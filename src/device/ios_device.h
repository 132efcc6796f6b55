#pragma once

#include "common/logger.h"
#include "device/command_runner.h"
#include "device/device_scanner.h"
#include "device/device_transport.h"
#include <deque>
#include <memory>

namespace trackcast {

struct IosTools {
  std::string idevice_id{"idevice_id"};
  std::string ideviceinfo{"ideviceinfo"};
  std::string idevicesetlocation{"idevicesetlocation"};
  std::string pymobiledevice3{"pymobiledevice3"};
};

// Lockdown session through the libimobiledevice tools. Devices before iOS 17
// take the legacy location service; newer ones go through the DVT secure
// proxy exposed by pymobiledevice3.
//
// A DVT location only holds while the `simulate-location set` process that
// placed it keeps its channel open, and that process waits for ENTER before
// exiting. Each step therefore spawns a new set process and holds it; the
// one before the previous is released once its successor has had a full
// step to take over. Disconnect releases them all and clears the location.
class IosTransport : public DeviceTransport {
public:
  enum class LocationService { NONE, LEGACY, DVT };

  static constexpr int kFirstDvtMajorVersion = 17;
  static constexpr size_t kHeldDvtSessions = 2;

  IosTransport(std::shared_ptr<CommandRunner> runner, IosTools tools,
               std::string udid);

  DeviceFamily family() const override { return DeviceFamily::IOS; }

  bool connect(const Endpoint &endpoint, std::string &error) override;
  bool set_location(double lat, double lon, std::string &error) override;
  void disconnect() override;
  std::optional<std::string> fetch_factory_name() override;

  LocationService service() const { return service_; }
  size_t held_sessions() const { return dvt_sessions_.size(); }

private:
  std::vector<std::string> lockdown_args(const std::string &tool) const;
  std::vector<std::string> dvt_args(const std::string &action) const;
  bool hold_dvt_location(const std::vector<std::string> &args,
                         std::string &error);
  // ENTER then wait; returns the exit code
  int release(CommandSession &session);

  std::shared_ptr<CommandRunner> runner_;
  IosTools tools_;
  std::string udid_;
  Endpoint endpoint_;
  LocationService service_{LocationService::NONE};
  std::deque<std::unique_ptr<CommandSession>> dvt_sessions_;
  std::shared_ptr<spdlog::logger> logger_;
};

class IosScanner : public DeviceScanner {
public:
  IosScanner(std::shared_ptr<CommandRunner> runner, IosTools tools);

  DeviceFamily family() const override { return DeviceFamily::IOS; }

  std::vector<DiscoveredDevice> scan() override;
  std::unique_ptr<DeviceTransport>
  make_transport(const DiscoveredDevice &record) override;
  std::string fallback_label(const std::string &udid) const override;

private:
  std::vector<std::string> list_udids(const std::string &flag);

  std::shared_ptr<CommandRunner> runner_;
  IosTools tools_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trackcast
