#pragma once

#include <memory>
#include <string>
#include <vector>

namespace trackcast {

struct CommandResult {
  int exit_code{-1};
  std::string output;

  bool ok() const { return exit_code == 0; }
};

// A child process left running with its stdin held open.
class CommandSession {
public:
  virtual ~CommandSession() = default;

  virtual bool write_line(const std::string &line) = 0;
  // closes stdin and waits for the child; -1 when the status is unknown
  virtual int close() = 0;
};

class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  // argv[0] is the program; stdout and stderr are captured together
  virtual CommandResult run(const std::vector<std::string> &argv) = 0;

  // starts argv without waiting for it; output is discarded.
  // nullptr when the process cannot be started
  virtual std::unique_ptr<CommandSession>
  spawn(const std::vector<std::string> &argv) = 0;
};

class PopenCommandRunner : public CommandRunner {
public:
  CommandResult run(const std::vector<std::string> &argv) override;
  std::unique_ptr<CommandSession>
  spawn(const std::vector<std::string> &argv) override;

  static std::string quote(const std::string &arg);
};

std::string first_line(const std::string &text);

} // namespace trackcast
