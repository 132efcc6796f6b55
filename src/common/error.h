#pragma once

#include <stdexcept>
#include <string>

namespace trackcast {

enum class ErrorKind {
  VALIDATION,
  NOT_FOUND,
  DEVICE_CONNECTION,
  DEVICE_CONTROL,
  NO_DEVICES_AVAILABLE,
  ALREADY_RUNNING,
  NOT_RUNNING,
  PARSE,
  EMPTY_TRACK,
  PERSISTENCE,
  CONFIGURATION,
};

// Every failure that crosses a component boundary is an Error; the kind
// decides the machine code and the HTTP status the API layer reports.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message);

  ErrorKind kind() const { return kind_; }
  const char *code() const { return code_for(kind_); }
  int http_status() const { return status_for(kind_); }

  const std::string &device_udid() const { return device_udid_; }
  const std::string &field() const { return field_; }
  const std::string &filename() const { return filename_; }

  static const char *code_for(ErrorKind kind);
  static int status_for(ErrorKind kind);

  static Error validation(const std::string &message,
                          const std::string &field = "");
  static Error invalid_file(const std::string &message,
                            const std::string &filename);
  static Error not_found(const std::string &resource_type,
                         const std::string &resource_id);
  static Error device_connection(const std::string &udid,
                                 const std::string &reason = "");
  static Error device_control(const std::string &udid,
                              const std::string &action,
                              const std::string &reason = "");
  static Error no_devices_available();
  static Error already_running();
  static Error not_running();
  static Error parse(const std::string &filename,
                     const std::string &reason = "");
  static Error empty_track(const std::string &filename);
  static Error persistence(const std::string &operation,
                           const std::string &reason = "");
  static Error configuration(const std::string &message);

private:
  ErrorKind kind_;
  std::string device_udid_;
  std::string field_;
  std::string filename_;
};

} // namespace trackcast
