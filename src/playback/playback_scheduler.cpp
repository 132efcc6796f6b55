#include "playback/playback_scheduler.h"
#include "common/error.h"
#include <chrono>

namespace trackcast {

PlaybackScheduler::PlaybackScheduler(DevicePool &pool, PlaybackConfig config,
                                     std::shared_ptr<Rng> rng)
    : pool_(pool), config_(config), rng_(std::move(rng)),
      logger_(Logger::get("playback")) {
  if (!rng_) {
    rng_ = std::make_shared<StandardRng>();
  }
}

PlaybackScheduler::~PlaybackScheduler() { stop(); }

void PlaybackScheduler::start(std::vector<TrackPoint> points,
                              const std::vector<std::string> &udids,
                              bool loop, double speed,
                              std::optional<double> target_duration) {
  std::lock_guard<std::mutex> control(control_mutex_);

  if (running_) {
    LOG_WARN(logger_, "simulation is already running");
    throw Error::already_running();
  }
  join_finished();

  if (points.empty()) {
    throw Error::validation("Track has no points", "points");
  }
  if (!(speed > 0.0)) {
    throw Error::validation("Speed must be positive", "speed");
  }

  std::vector<DeviceHandlePtr> devices;
  for (const auto &udid : udids) {
    auto handle = pool_.get(udid);
    if (!handle) {
      LOG_WARN(logger_, "device {} not found in pool", udid);
      continue;
    }

    if (!handle->connected()) {
      try {
        handle->connect();
      } catch (const Error &e) {
        // devices connected so far stay connected and are reset later
        std::lock_guard<std::mutex> lock(mutex_);
        active_devices_ = devices;
        LOG_ERROR(logger_, "could not connect to {}: {}", udid, e.what());
        throw;
      }
    }
    devices.push_back(handle);
  }

  if (devices.empty()) {
    LOG_ERROR(logger_, "no valid devices available for simulation");
    throw Error::no_devices_available();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_devices_ = devices;
    status_.running = true;
    status_.current_index = 0;
    status_.total_points = points.size();
    status_.speed_multiplier = speed;
    status_.loop = loop;
    status_.current_lat = points.front().lat;
    status_.current_lon = points.front().lon;
  }

  points_ = std::move(points);
  run_devices_ = std::move(devices);
  loop_ = loop;
  speed_ = speed;
  target_duration_ = target_duration;

  running_ = true;
  playback_thread_ = std::thread(&PlaybackScheduler::playback_loop, this);
  LOG_INFO(logger_, "simulation started for {} devices, {} points, {}x{}",
           run_devices_.size(), points_.size(), speed_,
           loop_ ? ", looping" : "");
}

void PlaybackScheduler::stop() {
  std::lock_guard<std::mutex> control(control_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    status_.running = false;
  }
  cv_.notify_all();

  if (playback_thread_.joinable()) {
    playback_thread_.join();
    LOG_INFO(logger_, "simulation stopped");
  }
}

void PlaybackScheduler::reset() {
  stop();

  std::lock_guard<std::mutex> control(control_mutex_);
  std::vector<DeviceHandlePtr> devices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    devices.swap(active_devices_);
  }

  LOG_INFO(logger_, "resetting locations for {} devices", devices.size());
  for (auto &device : devices) {
    device->disconnect();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.current_index = 0;
    status_.current_lat.reset();
    status_.current_lon.reset();
  }
  LOG_INFO(logger_, "simulation reset complete");
}

PlaybackStatus PlaybackScheduler::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

std::vector<DeviceHandlePtr> PlaybackScheduler::active_devices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_devices_;
}

void PlaybackScheduler::join_finished() {
  if (playback_thread_.joinable()) {
    playback_thread_.join();
  }
}

void PlaybackScheduler::playback_loop() {
  try {
    StepTiming timing(points_, speed_, target_duration_, config_);
    if (timing.mode() == TimingMode::DEFAULT) {
      LOG_WARN(logger_, "no timestamps and no target duration, defaulting to "
                        "{}s delay",
               config_.default_delay);
    } else {
      LOG_DEBUG(logger_, "step timing: {}", timing_mode_to_string(timing.mode()));
    }

    bool cancelled = false;
    while (running_ && !cancelled) {
      for (size_t i = 0; i < points_.size(); i++) {
        if (!running_) {
          cancelled = true;
          break;
        }

        const auto &point = points_[i];
        {
          std::lock_guard<std::mutex> lock(mutex_);
          status_.current_index = i;
          status_.current_lat = point.lat;
          status_.current_lon = point.lon;
        }

        broadcast(point);

        if (!wait_step(timing.delay(i))) {
          cancelled = true;
          break;
        }
      }

      if (!loop_) {
        break;
      }
    }

    if (!cancelled) {
      LOG_INFO(logger_, "simulation complete");
    }
  } catch (const std::exception &e) {
    LOG_ERROR(logger_, "simulation loop encountered an error: {}", e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
  status_.running = false;
}

void PlaybackScheduler::broadcast(const TrackPoint &point) {
  for (auto &device : run_devices_) {
    if (!device->connected()) {
      continue;
    }

    auto c = jitter(point.lat, point.lon, config_.jitter_radius, *rng_);
    try {
      device->set_location(c.lat, c.lon);
    } catch (const Error &e) {
      LOG_WARN(logger_, "device {} lost: {}", device->udid(), e.what());
    }
  }
}

bool PlaybackScheduler::wait_step(double seconds) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (seconds <= 0.0) {
    return running_;
  }
  return !cv_.wait_for(lock, std::chrono::duration<double>(seconds),
                       [this] { return !running_; });
}

} // namespace trackcast
