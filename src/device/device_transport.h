#pragma once

#include "device/device_types.h"
#include <optional>
#include <string>

namespace trackcast {

// Protocol side of one device. A transport owns the session it opens; the
// DeviceHandle that owns the transport decides what a failure means.
class DeviceTransport {
public:
  virtual ~DeviceTransport() = default;

  virtual DeviceFamily family() const = 0;

  // establish a session; on failure returns false and fills error
  virtual bool connect(const Endpoint &endpoint, std::string &error) = 0;

  virtual bool set_location(double lat, double lon, std::string &error) = 0;

  // clear the simulated location and release the session; never fails
  virtual void disconnect() = 0;

  virtual std::optional<std::string> fetch_factory_name() = 0;
};

} // namespace trackcast
