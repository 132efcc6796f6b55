#pragma once

#include "device/device_transport.h"
#include "device/device_types.h"
#include <memory>
#include <string>
#include <vector>

namespace trackcast {

// One discovery source per device family. The pool calls scan() on every
// configured scanner and asks the matching one for a transport when a udid
// is seen for the first time.
class DeviceScanner {
public:
  virtual ~DeviceScanner() = default;

  virtual DeviceFamily family() const = 0;

  virtual std::vector<DiscoveredDevice> scan() = 0;

  virtual std::unique_ptr<DeviceTransport>
  make_transport(const DiscoveredDevice &record) = 0;

  virtual std::string fallback_label(const std::string &udid) const = 0;
};

} // namespace trackcast
