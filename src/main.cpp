#include "api/api_router.h"
#include "api/http_server.h"
#include "common/config.h"
#include "common/error.h"
#include "common/logger.h"
#include "device/adb_device.h"
#include "device/device_pool.h"
#include "device/ios_device.h"
#include "playback/playback_scheduler.h"
#include "services/service_manager.h"
#include "storage/sqlite_name_store.h"
#include "track/track_library.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> running{true};

void signal_handler(int signal) { running = false; }
} // namespace

int main(int argc, char **argv) {
  using namespace trackcast;

  std::string config_path = "config/default.yaml";
  int port_override = -1;

  // parse args
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--port" && i + 1 < argc) {
      try {
        port_override = std::stoi(argv[++i]);
      } catch (const std::exception &) {
        std::cerr << "Invalid port: " << argv[i] << std::endl;
        return 1;
      }
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: trackcast [config.yaml] [--port <port>]\n";
      return 0;
    } else {
      config_path = arg;
    }
  }

  if (!std::filesystem::exists(config_path)) {
    config_path = "../config/default.yaml";
  }

  try {
    Config::instance().load(config_path);
  } catch (const std::exception &e) {
    std::cerr << "Config error: " << e.what() << std::endl;
    return 1;
  }

  auto &cfg = Config::instance();
  Logger::init(cfg.log_level(), cfg.log_dir());

  auto logger = Logger::get("main");
  LOG_INFO(logger, "{} starting", cfg.system_name());
  LOG_INFO(logger, "config loaded from: {}", config_path);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  // location sessions write to child stdin; a dead child must not kill us
  std::signal(SIGPIPE, SIG_IGN);

  auto store = std::make_shared<SqliteNameStore>(cfg.db_path());
  try {
    store->open();
  } catch (const Error &e) {
    LOG_ERROR(logger, "{}", e.what());
    return 1;
  }

  auto runner = std::make_shared<PopenCommandRunner>();
  std::vector<std::shared_ptr<DeviceScanner>> scanners;

  if (cfg.transport_enabled("ios")) {
    auto ios_cfg = cfg.root()["devices"]["ios"];
    IosTools tools;
    tools.idevice_id = ios_cfg["idevice_id"].as<std::string>(tools.idevice_id);
    tools.ideviceinfo =
        ios_cfg["ideviceinfo"].as<std::string>(tools.ideviceinfo);
    tools.idevicesetlocation =
        ios_cfg["idevicesetlocation"].as<std::string>(tools.idevicesetlocation);
    tools.pymobiledevice3 =
        ios_cfg["pymobiledevice3"].as<std::string>(tools.pymobiledevice3);
    scanners.push_back(std::make_shared<IosScanner>(runner, tools));
  }

  if (cfg.transport_enabled("android")) {
    auto adb_cfg = cfg.root()["devices"]["android"];
    AdbTools tools;
    tools.adb = adb_cfg["adb_path"].as<std::string>(tools.adb);
    tools.intent_action =
        adb_cfg["intent_action"].as<std::string>(tools.intent_action);
    scanners.push_back(std::make_shared<AdbScanner>(runner, tools));
  }

  if (scanners.empty()) {
    LOG_WARN(logger, "no device transports enabled");
  }

  PlaybackConfig playback_cfg;
  auto pb = cfg.root()["playback"];
  playback_cfg.jitter_radius =
      pb["jitter_radius_deg"].as<double>(playback_cfg.jitter_radius);
  playback_cfg.default_delay =
      pb["default_delay_s"].as<double>(playback_cfg.default_delay);
  playback_cfg.max_delay = pb["max_delay_s"].as<double>(playback_cfg.max_delay);
  playback_cfg.capped_delay =
      pb["capped_delay_s"].as<double>(playback_cfg.capped_delay);

  DevicePool pool(store, scanners);
  PlaybackScheduler scheduler(pool, playback_cfg);
  TrackLibrary library(cfg.upload_dir());
  ApiRouter router(pool, scheduler, library);

  int port = port_override >= 0 ? port_override : cfg.http_port();

  ServiceManager service_mgr;
  auto http_server =
      std::make_shared<HttpServer>(cfg.http_address(), port, router,
                                   std::chrono::milliseconds(
                                       cfg.http_request_timeout_ms()));
  service_mgr.add(http_server);

  if (!service_mgr.init_all()) {
    LOG_ERROR(logger, "service initialization failed");
    return 1;
  }

  if (!service_mgr.start_all()) {
    LOG_ERROR(logger, "service start failed");
    service_mgr.shutdown_all();
    return 1;
  }

  LOG_INFO(logger, "listening on http://{}:{}", cfg.http_address(),
           http_server->port());

  while (running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  LOG_INFO(logger, "shutting down...");
  service_mgr.stop_all();
  scheduler.stop();
  service_mgr.shutdown_all();
  store->close();

  LOG_INFO(logger, "{} stopped", cfg.system_name());
  return 0;
}
