#pragma once

#include "common/logger.h"
#include "services/service.h"
#include <memory>
#include <vector>

namespace trackcast {

// Brings services up in insertion order and down in reverse. A failed start
// stops the services already started.
class ServiceManager {
public:
  ServiceManager() : logger_(Logger::get("service_manager")) {}

  void add(std::shared_ptr<Service> service) { services_.push_back(service); }
  size_t size() const { return services_.size(); }

  bool init_all() {
    for (auto &svc : services_) {
      LOG_INFO(logger_, "initializing service: {}", svc->name());
      if (!svc->init()) {
        LOG_ERROR(logger_, "failed to init service: {}", svc->name());
        return false;
      }
    }
    return true;
  }

  bool start_all() {
    for (size_t i = 0; i < services_.size(); i++) {
      LOG_INFO(logger_, "starting service: {}", services_[i]->name());
      if (!services_[i]->start()) {
        LOG_ERROR(logger_, "failed to start service: {}",
                  services_[i]->name());
        while (i-- > 0) {
          services_[i]->stop();
        }
        return false;
      }
    }
    return true;
  }

  void stop_all() {
    for (auto it = services_.rbegin(); it != services_.rend(); ++it) {
      LOG_INFO(logger_, "stopping service: {}", (*it)->name());
      (*it)->stop();
    }
  }

  void shutdown_all() {
    for (auto it = services_.rbegin(); it != services_.rend(); ++it) {
      LOG_INFO(logger_, "shutting down service: {}", (*it)->name());
      (*it)->shutdown();
    }
  }

private:
  std::vector<std::shared_ptr<Service>> services_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trackcast
