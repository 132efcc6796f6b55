#include "common/config.h"
#include "common/error.h"
#include "common/logger.h"
#include "fakes.h"
#include "services/service_manager.h"
#include <fstream>
#include <gtest/gtest.h>

using namespace trackcast;
using namespace trackcast::fakes;

namespace {
std::string write_yaml(const TempDir &dir, const std::string &text) {
  auto path = dir.file("config.yaml");
  std::ofstream out(path);
  out << text;
  return path;
}

class RecordingService : public Service {
public:
  RecordingService(const std::string &name, std::vector<std::string> &log,
                   bool start_ok = true)
      : Service(name), log_(log), start_ok_(start_ok) {}

  bool init() override { return record("init"); }
  bool start() override {
    record("start");
    return start_ok_;
  }
  bool stop() override { return record("stop"); }
  bool shutdown() override { return record("shutdown"); }

private:
  bool record(const std::string &step) {
    log_.push_back(name_ + ":" + step);
    return true;
  }

  std::vector<std::string> &log_;
  bool start_ok_;
};
} // namespace

TEST(ConfigTest, LoadsShippedDefaults) {
  auto &cfg = Config::instance();
  cfg.load("config/default.yaml");

  EXPECT_EQ(cfg.system_name(), "trackcast");
  EXPECT_EQ(cfg.http_port(), 5005);
  EXPECT_EQ(cfg.upload_dir(), "uploads");
  EXPECT_TRUE(cfg.transport_enabled("ios"));
  EXPECT_TRUE(cfg.transport_enabled("android"));
  EXPECT_DOUBLE_EQ(cfg.root()["playback"]["jitter_radius_deg"].as<double>(),
                   0.00002);
}

TEST(ConfigTest, MissingSectionsFallBack) {
  TempDir dir;
  auto &cfg = Config::instance();
  cfg.load(write_yaml(dir, "http:\n  port: 8080\n"
                           "devices:\n  android:\n    enabled: false\n"));

  EXPECT_EQ(cfg.http_port(), 8080);
  EXPECT_EQ(cfg.http_address(), "0.0.0.0");
  EXPECT_EQ(cfg.http_request_timeout_ms(), 10000);
  EXPECT_EQ(cfg.db_path(), "devices.db");
  EXPECT_EQ(cfg.log_level(), "info");
  EXPECT_TRUE(cfg.transport_enabled("ios"));
  EXPECT_FALSE(cfg.transport_enabled("android"));
}

TEST(ConfigTest, MissingFileIsConfigurationError) {
  TempDir dir;
  try {
    Config::instance().load(dir.file("absent.yaml"));
    FAIL() << "expected a configuration error";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::CONFIGURATION);
    EXPECT_STREQ(e.code(), "CONFIGURATION_ERROR");
  }
}

TEST(ErrorTest, CodesAndStatuses) {
  EXPECT_EQ(Error::validation("bad", "name").http_status(), 400);
  EXPECT_EQ(Error::not_found("Device", "x").http_status(), 404);
  EXPECT_EQ(Error::already_running().http_status(), 409);
  EXPECT_EQ(Error::no_devices_available().http_status(), 500);
  EXPECT_EQ(Error::parse("a.gpx").http_status(), 400);

  EXPECT_STREQ(Error::not_found("Device", "x").code(), "RESOURCE_NOT_FOUND");
  EXPECT_STREQ(Error::empty_track("a.gpx").code(), "GPX_EMPTY");
  EXPECT_STREQ(Error::device_control("u1", "set location").code(),
               "DEVICE_CONTROL_ERROR");
}

TEST(ErrorTest, CarriesContext) {
  auto connection = Error::device_connection("u1", "timeout");
  EXPECT_EQ(connection.device_udid(), "u1");
  EXPECT_STREQ(connection.what(), "Failed to connect to device u1: timeout");

  auto invalid = Error::invalid_file("Only .gpx files are allowed", "a.txt");
  EXPECT_EQ(invalid.kind(), ErrorKind::VALIDATION);
  EXPECT_EQ(invalid.field(), "file");
  EXPECT_EQ(invalid.filename(), "a.txt");

  EXPECT_STREQ(Error::not_found("GPX file", "b.gpx").what(),
               "GPX file 'b.gpx' not found");
  EXPECT_EQ(Error::parse("c.gpx", "bad").filename(), "c.gpx");
}

TEST(LoggerTest, NamedLoggersAreShared) {
  auto first = Logger::get("common_test");
  auto second = Logger::get("common_test");
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first, second);
  EXPECT_EQ(first->name(), "common_test");
  EXPECT_NE(Logger::get("other_test"), first);
}

TEST(ServiceManagerTest, StopsInReverseOrder) {
  std::vector<std::string> log;
  ServiceManager mgr;
  mgr.add(std::make_shared<RecordingService>("a", log));
  mgr.add(std::make_shared<RecordingService>("b", log));
  EXPECT_EQ(mgr.size(), 2u);

  ASSERT_TRUE(mgr.init_all());
  ASSERT_TRUE(mgr.start_all());
  mgr.stop_all();

  std::vector<std::string> expected{"a:init", "b:init", "a:start",
                                    "b:start", "b:stop", "a:stop"};
  EXPECT_EQ(log, expected);
}

TEST(ServiceManagerTest, FailedStartStopsEarlierServices) {
  std::vector<std::string> log;
  ServiceManager mgr;
  mgr.add(std::make_shared<RecordingService>("a", log));
  mgr.add(std::make_shared<RecordingService>("b", log, false));

  EXPECT_FALSE(mgr.start_all());
  std::vector<std::string> expected{"a:start", "b:start", "a:stop"};
  EXPECT_EQ(log, expected);
}
