#pragma once

#include "common/logger.h"
#include "device/device_transport.h"
#include "device/device_types.h"
#include "storage/name_store.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace trackcast {

// Identity and connection state of one physical device. The transport is
// owned exclusively by the handle; all transport calls are serialized on the
// session mutex, names and endpoint on the metadata mutex.
class DeviceHandle {
public:
  DeviceHandle(const DiscoveredDevice &record,
               std::unique_ptr<DeviceTransport> transport,
               std::shared_ptr<NameStore> store, std::string fallback_label);

  DeviceHandle(const DeviceHandle &) = delete;
  DeviceHandle &operator=(const DeviceHandle &) = delete;

  const std::string &udid() const { return udid_; }
  DeviceFamily family() const { return family_; }
  const std::string &fallback_label() const { return fallback_label_; }

  std::string serial() const;
  ConnectionKind connection_kind() const;
  Endpoint endpoint() const;

  // user name, then factory name, then fallback label
  std::string display_name() const;
  std::optional<std::string> factory_name() const;
  std::optional<std::string> user_name() const;

  bool connected() const { return connected_; }

  // throws Error (device-connection) when the transport refuses
  void connect();

  // throws Error (device-control); the handle is left disconnected
  void set_location(double lat, double lon);

  // clears the simulated location and releases the session, never throws
  void disconnect();

  void update_endpoint(const Endpoint &endpoint);
  void refresh_names();
  void set_user_name(const std::string &name);

private:
  const std::string udid_;
  const DeviceFamily family_;
  const std::string fallback_label_;

  mutable std::mutex meta_mutex_;
  Endpoint endpoint_;
  std::optional<std::string> factory_name_;
  std::optional<std::string> user_name_;

  std::mutex session_mutex_;
  std::unique_ptr<DeviceTransport> transport_;
  bool session_open_{false};
  std::atomic<bool> connected_{false};

  std::shared_ptr<NameStore> store_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trackcast
