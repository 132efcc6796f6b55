#pragma once

#include "common/logger.h"
#include "device/device_pool.h"
#include "playback/jitter.h"
#include "playback/playback_status.h"
#include "playback/step_timing.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace trackcast {

// Single-flight playback of a point sequence onto a set of devices.
// Idle -> start -> Running -> stop / completion -> Idle. There is no pause;
// every start begins at index 0.
class PlaybackScheduler {
public:
  PlaybackScheduler(DevicePool &pool, PlaybackConfig config = {},
                    std::shared_ptr<Rng> rng = nullptr);
  ~PlaybackScheduler();

  PlaybackScheduler(const PlaybackScheduler &) = delete;
  PlaybackScheduler &operator=(const PlaybackScheduler &) = delete;

  // connects the requested devices and launches the playback thread.
  // throws Error: already-running, validation, device-connection,
  // no-devices-available
  void start(std::vector<TrackPoint> points,
             const std::vector<std::string> &udids, bool loop,
             double speed = 1.0,
             std::optional<double> target_duration = std::nullopt);

  // cancels the run and joins the thread; no device write happens afterwards
  void stop();

  // stop, then disconnect every device of the last run once
  void reset();

  PlaybackStatus status() const;
  bool running() const { return running_; }

  std::vector<DeviceHandlePtr> active_devices() const;

  const PlaybackConfig &config() const { return config_; }

private:
  void playback_loop();
  void broadcast(const TrackPoint &point);
  // waits for the step delay; false when the run was cancelled
  bool wait_step(double seconds);
  void join_finished();

  DevicePool &pool_;
  PlaybackConfig config_;
  std::shared_ptr<Rng> rng_;
  std::shared_ptr<spdlog::logger> logger_;

  std::mutex control_mutex_;

  std::atomic<bool> running_{false};
  std::thread playback_thread_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  PlaybackStatus status_;
  std::vector<DeviceHandlePtr> active_devices_;

  // owned by the playback thread while it runs
  std::vector<TrackPoint> points_;
  std::vector<DeviceHandlePtr> run_devices_;
  bool loop_{false};
  double speed_{1.0};
  std::optional<double> target_duration_;
};

} // namespace trackcast
