#include "device/device_handle.h"
#include "common/error.h"

namespace trackcast {

DeviceHandle::DeviceHandle(const DiscoveredDevice &record,
                           std::unique_ptr<DeviceTransport> transport,
                           std::shared_ptr<NameStore> store,
                           std::string fallback_label)
    : udid_(record.udid), family_(record.family),
      fallback_label_(std::move(fallback_label)), endpoint_(record.endpoint),
      transport_(std::move(transport)), store_(std::move(store)),
      logger_(Logger::get("devices")) {
  if (endpoint_.serial.empty()) {
    endpoint_.serial = udid_;
  }
  refresh_names();
}

std::string DeviceHandle::serial() const {
  std::lock_guard<std::mutex> lock(meta_mutex_);
  return endpoint_.serial;
}

ConnectionKind DeviceHandle::connection_kind() const {
  std::lock_guard<std::mutex> lock(meta_mutex_);
  return endpoint_.kind;
}

Endpoint DeviceHandle::endpoint() const {
  std::lock_guard<std::mutex> lock(meta_mutex_);
  return endpoint_;
}

std::string DeviceHandle::display_name() const {
  std::lock_guard<std::mutex> lock(meta_mutex_);
  if (user_name_ && !user_name_->empty()) {
    return *user_name_;
  }
  if (factory_name_ && !factory_name_->empty()) {
    return *factory_name_;
  }
  return fallback_label_;
}

std::optional<std::string> DeviceHandle::factory_name() const {
  std::lock_guard<std::mutex> lock(meta_mutex_);
  return factory_name_;
}

std::optional<std::string> DeviceHandle::user_name() const {
  std::lock_guard<std::mutex> lock(meta_mutex_);
  return user_name_;
}

void DeviceHandle::connect() {
  std::lock_guard<std::mutex> session(session_mutex_);
  if (connected_) {
    return;
  }

  std::string error;
  if (!transport_->connect(endpoint(), error)) {
    connected_ = false;
    LOG_ERROR(logger_, "failed to connect {}: {}", udid_, error);
    throw Error::device_connection(udid_, error);
  }

  session_open_ = true;
  connected_ = true;
  LOG_INFO(logger_, "connected to {}", udid_);

  // naming is best effort and never fails the connect
  try {
    auto name = transport_->fetch_factory_name();
    if (name && !name->empty()) {
      {
        std::lock_guard<std::mutex> lock(meta_mutex_);
        factory_name_ = *name;
      }
      if (store_) {
        store_->upsert(udid_, *name, std::nullopt);
      }
      LOG_DEBUG(logger_, "factory name for {}: {}", udid_, *name);
    }
  } catch (const std::exception &e) {
    LOG_WARN(logger_, "could not record factory name for {}: {}", udid_,
             e.what());
  }
}

void DeviceHandle::set_location(double lat, double lon) {
  std::lock_guard<std::mutex> session(session_mutex_);
  if (!connected_) {
    throw Error::device_control(udid_, "set location", "not connected");
  }

  std::string error;
  if (!transport_->set_location(lat, lon, error)) {
    connected_ = false;
    LOG_ERROR(logger_, "set location failed on {}: {}", udid_, error);
    throw Error::device_control(udid_, "set location", error);
  }
}

void DeviceHandle::disconnect() {
  std::lock_guard<std::mutex> session(session_mutex_);
  if (!session_open_) {
    connected_ = false;
    return;
  }

  try {
    transport_->disconnect();
  } catch (const std::exception &e) {
    LOG_WARN(logger_, "error while disconnecting {}: {}", udid_, e.what());
  }

  session_open_ = false;
  connected_ = false;
  LOG_INFO(logger_, "disconnected {}", udid_);
}

void DeviceHandle::update_endpoint(const Endpoint &endpoint) {
  std::lock_guard<std::mutex> lock(meta_mutex_);
  endpoint_ = endpoint;
  if (endpoint_.serial.empty()) {
    endpoint_.serial = udid_;
  }
}

void DeviceHandle::refresh_names() {
  if (!store_) {
    return;
  }

  auto record = store_->get(udid_);
  if (!record) {
    return;
  }

  std::lock_guard<std::mutex> lock(meta_mutex_);
  if (record->factory_name) {
    factory_name_ = record->factory_name;
  }
  if (record->user_name) {
    user_name_ = record->user_name;
  }
}

void DeviceHandle::set_user_name(const std::string &name) {
  std::lock_guard<std::mutex> lock(meta_mutex_);
  user_name_ = name;
}

} // namespace trackcast
