#include "device/device_pool.h"
#include <algorithm>
#include <cctype>

namespace trackcast {

namespace {
bool is_blank(const std::string &s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c); });
}
} // namespace

DevicePool::DevicePool(std::shared_ptr<NameStore> store,
                       std::vector<std::shared_ptr<DeviceScanner>> scanners)
    : store_(std::move(store)), scanners_(std::move(scanners)),
      logger_(Logger::get("pool")) {}

std::vector<DeviceHandlePtr> DevicePool::scan() {
  std::vector<DeviceHandlePtr> observed;

  for (auto &scanner : scanners_) {
    std::vector<DiscoveredDevice> records;
    try {
      records = scanner->scan();
    } catch (const std::exception &e) {
      LOG_WARN(logger_, "{} scan failed: {}",
               device_family_to_string(scanner->family()), e.what());
      continue;
    }

    for (const auto &record : records) {
      if (record.udid.empty()) {
        continue;
      }

      DeviceHandlePtr handle;
      bool created = false;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(record.udid);
        if (it != devices_.end()) {
          handle = it->second;
        } else {
          handle = std::make_shared<DeviceHandle>(
              record, scanner->make_transport(record), store_,
              scanner->fallback_label(record.udid));
          devices_.emplace(record.udid, handle);
          order_.push_back(record.udid);
          created = true;
        }
      }

      if (created) {
        LOG_INFO(logger_, "discovered {} device {} ({})",
                 device_family_to_string(record.family), record.udid,
                 connection_kind_to_string(record.endpoint.kind));
      } else {
        handle->update_endpoint(record.endpoint);
        handle->refresh_names();
      }

      if (std::find(observed.begin(), observed.end(), handle) ==
          observed.end()) {
        observed.push_back(handle);
      }
    }
  }

  LOG_DEBUG(logger_, "scan observed {} devices, {} known", observed.size(),
            size());
  return observed;
}

DeviceHandlePtr DevicePool::get(const std::string &udid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(udid);
  if (it == devices_.end()) {
    return nullptr;
  }
  return it->second;
}

bool DevicePool::rename(const std::string &udid, const std::string &name) {
  if (is_blank(name)) {
    LOG_WARN(logger_, "rejected blank name for {}", udid);
    return false;
  }

  if (store_) {
    store_->upsert(udid, std::nullopt, name);
  }

  if (auto handle = get(udid)) {
    handle->set_user_name(name);
  }

  LOG_INFO(logger_, "renamed {} to '{}'", udid, name);
  return true;
}

std::vector<DeviceHandlePtr> DevicePool::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DeviceHandlePtr> result;
  result.reserve(order_.size());
  for (const auto &udid : order_) {
    result.push_back(devices_.at(udid));
  }
  return result;
}

size_t DevicePool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

} // namespace trackcast
