#pragma once

#include "common/logger.h"
#include "device/device_handle.h"
#include "device/device_scanner.h"
#include "storage/name_store.h"
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace trackcast {

using DeviceHandlePtr = std::shared_ptr<DeviceHandle>;

// Process-wide set of known devices. A udid maps to one handle for the
// lifetime of the pool; rescans update that handle in place.
class DevicePool {
public:
  DevicePool(std::shared_ptr<NameStore> store,
             std::vector<std::shared_ptr<DeviceScanner>> scanners);

  // reconciles every scanner's records and returns the handles seen this time
  std::vector<DeviceHandlePtr> scan();

  DeviceHandlePtr get(const std::string &udid) const;

  // false for a blank name; the stored name is left unchanged
  bool rename(const std::string &udid, const std::string &name);

  std::vector<DeviceHandlePtr> all() const;
  size_t size() const;

private:
  std::shared_ptr<NameStore> store_;
  std::vector<std::shared_ptr<DeviceScanner>> scanners_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, DeviceHandlePtr> devices_;
  std::vector<std::string> order_;

  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trackcast
