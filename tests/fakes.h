#pragma once

#include "device/command_runner.h"
#include "device/device_scanner.h"
#include "playback/jitter.h"
#include "storage/name_store.h"
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>

namespace trackcast {
namespace fakes {

// observable side of a fake device, shared between the test and the transport
struct FakeDeviceState {
  mutable std::mutex mutex;
  std::condition_variable cv;

  bool fail_connect{false};
  bool fail_set_location{false};
  bool throw_on_name{false};
  std::optional<std::string> factory_name;

  int connects{0};
  int disconnects{0};
  std::vector<Coordinate> locations;

  size_t location_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return locations.size();
  }

  std::vector<Coordinate> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return locations;
  }

  int disconnect_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return disconnects;
  }

  bool wait_for_locations(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout,
                       [&] { return locations.size() >= count; });
  }
};

class FakeTransport : public DeviceTransport {
public:
  FakeTransport(DeviceFamily family, std::shared_ptr<FakeDeviceState> state)
      : family_(family), state_(std::move(state)) {}

  DeviceFamily family() const override { return family_; }

  bool connect(const Endpoint &, std::string &error) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->connects++;
    if (state_->fail_connect) {
      error = "device refused";
      return false;
    }
    return true;
  }

  bool set_location(double lat, double lon, std::string &error) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->fail_set_location) {
      error = "push failed";
      return false;
    }
    state_->locations.push_back({lat, lon});
    state_->cv.notify_all();
    return true;
  }

  void disconnect() override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->disconnects++;
  }

  std::optional<std::string> fetch_factory_name() override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->throw_on_name) {
      throw std::runtime_error("lockdown query failed");
    }
    return state_->factory_name;
  }

private:
  DeviceFamily family_;
  std::shared_ptr<FakeDeviceState> state_;
};

class FakeScanner : public DeviceScanner {
public:
  explicit FakeScanner(DeviceFamily family = DeviceFamily::IOS)
      : family_(family) {}

  DeviceFamily family() const override { return family_; }

  std::shared_ptr<FakeDeviceState>
  add(const std::string &udid, ConnectionKind kind = ConnectionKind::USB) {
    auto &state = states_[udid];
    if (!state) {
      state = std::make_shared<FakeDeviceState>();
    }
    visible_[udid] = kind;
    return state;
  }

  void hide(const std::string &udid) { visible_.erase(udid); }

  std::vector<DiscoveredDevice> scan() override {
    scans++;
    std::vector<DiscoveredDevice> found;
    for (const auto &entry : visible_) {
      found.push_back({entry.first, family_, {entry.first, entry.second, ""}});
    }
    return found;
  }

  std::unique_ptr<DeviceTransport>
  make_transport(const DiscoveredDevice &record) override {
    transports_made++;
    return std::make_unique<FakeTransport>(family_, add(record.udid));
  }

  std::string fallback_label(const std::string &udid) const override {
    return "Fake (" + udid.substr(0, 8) + "...)";
  }

  int scans{0};
  int transports_made{0};

private:
  DeviceFamily family_;
  std::map<std::string, std::shared_ptr<FakeDeviceState>> states_;
  std::map<std::string, ConnectionKind> visible_;
};

class MemoryNameStore : public NameStore {
public:
  std::optional<NameRecord> get(const std::string &udid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(udid);
    if (it == records_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void upsert(const std::string &udid,
              const std::optional<std::string> &factory_name,
              const std::optional<std::string> &user_name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes) {
      throw std::runtime_error("disk full");
    }
    auto &record = records_[udid];
    if (factory_name) {
      record.factory_name = factory_name;
    }
    if (user_name) {
      record.user_name = user_name;
    }
    writes++;
  }

  bool fail_writes{false};
  int writes{0};

private:
  std::mutex mutex_;
  std::map<std::string, NameRecord> records_;
};

// scripted command output keyed by the joined argv
struct FakeSessionState {
  std::string command;
  std::vector<std::string> lines;
  bool closed{false};
  int exit_code{0};
};

class FakeCommandSession : public CommandSession {
public:
  explicit FakeCommandSession(std::shared_ptr<FakeSessionState> state)
      : state_(std::move(state)) {}

  bool write_line(const std::string &line) override {
    if (state_->closed) {
      return false;
    }
    state_->lines.push_back(line);
    return true;
  }

  int close() override {
    state_->closed = true;
    return state_->exit_code;
  }

private:
  std::shared_ptr<FakeSessionState> state_;
};

class FakeCommandRunner : public CommandRunner {
public:
  void script(const std::vector<std::string> &argv, int exit_code,
              const std::string &output) {
    results_[join(argv)] = CommandResult{exit_code, output};
  }

  CommandResult run(const std::vector<std::string> &argv) override {
    auto key = join(argv);
    calls.push_back(key);
    auto it = results_.find(key);
    if (it == results_.end()) {
      return CommandResult{127, "command not scripted"};
    }
    return it->second;
  }

  std::unique_ptr<CommandSession>
  spawn(const std::vector<std::string> &argv) override {
    auto state = std::make_shared<FakeSessionState>();
    state->command = join(argv);
    auto it = session_exit_codes_.find(state->command);
    if (it != session_exit_codes_.end()) {
      state->exit_code = it->second;
    }
    sessions.push_back(state);
    return std::make_unique<FakeCommandSession>(state);
  }

  void script_session(const std::vector<std::string> &argv, int exit_code) {
    session_exit_codes_[join(argv)] = exit_code;
  }

  bool called(const std::string &command) const {
    for (const auto &c : calls) {
      if (c == command) {
        return true;
      }
    }
    return false;
  }

  std::vector<std::string> calls;
  std::vector<std::shared_ptr<FakeSessionState>> sessions;

private:
  static std::string join(const std::vector<std::string> &argv) {
    std::string out;
    for (const auto &arg : argv) {
      if (!out.empty()) {
        out += ' ';
      }
      out += arg;
    }
    return out;
  }

  std::map<std::string, CommandResult> results_;
  std::map<std::string, int> session_exit_codes_;
};

class CenterRng : public Rng {
public:
  double uniform(double min, double max) override { return (min + max) / 2; }
};

class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("trackcast_test_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace fakes
} // namespace trackcast
