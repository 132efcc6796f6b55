#include "common/error.h"

namespace trackcast {

namespace {
std::string with_reason(std::string message, const std::string &reason) {
  if (!reason.empty()) {
    message += ": " + reason;
  }
  return message;
}
} // namespace

Error::Error(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), kind_(kind) {}

const char *Error::code_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::VALIDATION:
    return "VALIDATION_ERROR";
  case ErrorKind::NOT_FOUND:
    return "RESOURCE_NOT_FOUND";
  case ErrorKind::DEVICE_CONNECTION:
    return "DEVICE_CONNECTION_ERROR";
  case ErrorKind::DEVICE_CONTROL:
    return "DEVICE_CONTROL_ERROR";
  case ErrorKind::NO_DEVICES_AVAILABLE:
    return "NO_DEVICES_AVAILABLE";
  case ErrorKind::ALREADY_RUNNING:
    return "SIMULATION_ALREADY_RUNNING";
  case ErrorKind::NOT_RUNNING:
    return "SIMULATION_NOT_RUNNING";
  case ErrorKind::PARSE:
    return "GPX_PARSE_ERROR";
  case ErrorKind::EMPTY_TRACK:
    return "GPX_EMPTY";
  case ErrorKind::PERSISTENCE:
    return "DATABASE_ERROR";
  case ErrorKind::CONFIGURATION:
    return "CONFIGURATION_ERROR";
  }
  return "UNKNOWN_ERROR";
}

int Error::status_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::VALIDATION:
  case ErrorKind::NOT_RUNNING:
  case ErrorKind::PARSE:
  case ErrorKind::EMPTY_TRACK:
    return 400;
  case ErrorKind::NOT_FOUND:
    return 404;
  case ErrorKind::ALREADY_RUNNING:
    return 409;
  case ErrorKind::DEVICE_CONNECTION:
  case ErrorKind::DEVICE_CONTROL:
  case ErrorKind::NO_DEVICES_AVAILABLE:
  case ErrorKind::PERSISTENCE:
  case ErrorKind::CONFIGURATION:
    return 500;
  }
  return 500;
}

Error Error::validation(const std::string &message, const std::string &field) {
  Error e(ErrorKind::VALIDATION, message);
  e.field_ = field;
  return e;
}

Error Error::invalid_file(const std::string &message,
                          const std::string &filename) {
  Error e(ErrorKind::VALIDATION, message);
  e.field_ = "file";
  e.filename_ = filename;
  return e;
}

Error Error::not_found(const std::string &resource_type,
                       const std::string &resource_id) {
  return Error(ErrorKind::NOT_FOUND,
               resource_type + " '" + resource_id + "' not found");
}

Error Error::device_connection(const std::string &udid,
                               const std::string &reason) {
  Error e(ErrorKind::DEVICE_CONNECTION,
          with_reason("Failed to connect to device " + udid, reason));
  e.device_udid_ = udid;
  return e;
}

Error Error::device_control(const std::string &udid, const std::string &action,
                            const std::string &reason) {
  Error e(ErrorKind::DEVICE_CONTROL,
          with_reason("Failed to " + action + " on device " + udid, reason));
  e.device_udid_ = udid;
  return e;
}

Error Error::no_devices_available() {
  return Error(ErrorKind::NO_DEVICES_AVAILABLE,
               "No devices available for simulation. Please connect devices "
               "and try again.");
}

Error Error::already_running() {
  return Error(ErrorKind::ALREADY_RUNNING,
               "Simulation is already running. Stop it before starting a new "
               "one.");
}

Error Error::not_running() {
  return Error(ErrorKind::NOT_RUNNING, "No simulation is currently running");
}

Error Error::parse(const std::string &filename, const std::string &reason) {
  Error e(ErrorKind::PARSE,
          with_reason("Failed to parse GPX file '" + filename + "'", reason));
  e.filename_ = filename;
  return e;
}

Error Error::empty_track(const std::string &filename) {
  Error e(ErrorKind::EMPTY_TRACK,
          "GPX file '" + filename + "' contains no track points");
  e.filename_ = filename;
  return e;
}

Error Error::persistence(const std::string &operation,
                         const std::string &reason) {
  return Error(ErrorKind::PERSISTENCE,
               with_reason("Database " + operation + " failed", reason));
}

Error Error::configuration(const std::string &message) {
  return Error(ErrorKind::CONFIGURATION, message);
}

} // namespace trackcast
