#include "device/command_runner.h"
#include <cstdio>
#include <sys/wait.h>

namespace trackcast {

namespace {
int exit_status(int status) {
  if (status != -1 && WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}

std::string shell_command(const std::vector<std::string> &argv) {
  std::string command;
  for (const auto &arg : argv) {
    if (!command.empty())
      command += ' ';
    command += PopenCommandRunner::quote(arg);
  }
  return command;
}

class PopenCommandSession : public CommandSession {
public:
  explicit PopenCommandSession(FILE *pipe) : pipe_(pipe) {}
  ~PopenCommandSession() override { close(); }

  bool write_line(const std::string &line) override {
    if (!pipe_) {
      return false;
    }
    if (fputs(line.c_str(), pipe_) == EOF || fputc('\n', pipe_) == EOF) {
      return false;
    }
    return fflush(pipe_) == 0;
  }

  int close() override {
    if (pipe_) {
      exit_code_ = exit_status(pclose(pipe_));
      pipe_ = nullptr;
    }
    return exit_code_;
  }

private:
  FILE *pipe_;
  int exit_code_{-1};
};
} // namespace

std::string PopenCommandRunner::quote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

CommandResult PopenCommandRunner::run(const std::vector<std::string> &argv) {
  CommandResult result;
  if (argv.empty()) {
    result.output = "empty command";
    return result;
  }

  auto command = shell_command(argv) + " 2>&1";

  FILE *pipe = popen(command.c_str(), "r");
  if (!pipe) {
    result.output = "failed to spawn " + argv[0];
    return result;
  }

  char buffer[256];
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    result.output += buffer;
  }

  result.exit_code = exit_status(pclose(pipe));
  return result;
}

std::unique_ptr<CommandSession>
PopenCommandRunner::spawn(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    return nullptr;
  }

  auto command = shell_command(argv) + " >/dev/null 2>&1";
  FILE *pipe = popen(command.c_str(), "w");
  if (!pipe) {
    return nullptr;
  }
  return std::make_unique<PopenCommandSession>(pipe);
}

std::string first_line(const std::string &text) {
  auto end = text.find_first_of("\r\n");
  std::string line = text.substr(0, end);
  line.erase(0, line.find_first_not_of(" \t"));
  line.erase(line.find_last_not_of(" \t") + 1);
  return line;
}

} // namespace trackcast
