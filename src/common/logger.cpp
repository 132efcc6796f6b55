#include "common/logger.h"
#include <filesystem>
#include <memory>
#include <mutex>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace trackcast {

bool Logger::initialized_ = false;
std::vector<spdlog::sink_ptr> Logger::sinks_;

namespace {
std::mutex logger_mutex;
}

void Logger::init(const std::string &level, const std::string &log_dir) {
  std::lock_guard<std::mutex> lock(logger_mutex);
  if (initialized_)
    return;

  sinks_.push_back(std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());

  if (!log_dir.empty()) {
    std::filesystem::create_directories(log_dir);
    auto path = (std::filesystem::path(log_dir) / "trackcast.log").string();
    sinks_.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path, kMaxFileBytes, kMaxFiles));
  }

  // loggers handed out before init switch over to the shared sinks
  spdlog::apply_all([](std::shared_ptr<spdlog::logger> logger) {
    logger->sinks().assign(sinks_.begin(), sinks_.end());
  });

  if (level == "trace")
    spdlog::set_level(spdlog::level::trace);
  if (level == "debug")
    spdlog::set_level(spdlog::level::debug);
  if (level == "info")
    spdlog::set_level(spdlog::level::info);
  if (level == "warn")
    spdlog::set_level(spdlog::level::warn);
  if (level == "error")
    spdlog::set_level(spdlog::level::err);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%t] [%^%l%$] [%n] %v");

  initialized_ = true;
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string &name) {
  std::lock_guard<std::mutex> lock(logger_mutex);
  auto logger = spdlog::get(name);
  if (!logger) {
    std::vector<spdlog::sink_ptr> sinks = sinks_;
    if (sinks.empty()) {
      sinks.push_back(
          std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
    }
    logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    spdlog::initialize_logger(logger);
  }

  return logger;
}

} // namespace trackcast
