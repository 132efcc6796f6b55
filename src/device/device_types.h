#pragma once

#include <string>

namespace trackcast {

enum class ConnectionKind { USB, WIFI, BRIDGED, UNKNOWN };

enum class DeviceFamily { IOS, ANDROID };

inline const char *connection_kind_to_string(ConnectionKind kind) {
  switch (kind) {
  case ConnectionKind::USB:
    return "usb";
  case ConnectionKind::WIFI:
    return "wifi";
  case ConnectionKind::BRIDGED:
    return "bridged";
  case ConnectionKind::UNKNOWN:
    return "unknown";
  }
  return "unknown";
}

inline const char *device_family_to_string(DeviceFamily family) {
  switch (family) {
  case DeviceFamily::IOS:
    return "iOS";
  case DeviceFamily::ANDROID:
    return "Android";
  }
  return "unknown";
}

// how to reach a device; refreshed on every scan that observes it
struct Endpoint {
  std::string serial;
  ConnectionKind kind{ConnectionKind::UNKNOWN};
  std::string address;
};

// one raw record produced by a discovery scan
struct DiscoveredDevice {
  std::string udid;
  DeviceFamily family{DeviceFamily::IOS};
  Endpoint endpoint;
};

} // namespace trackcast
