#include "launchpad/common/process.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

namespace launchpad::common {

Result<CommandOutput> run_capture(const std::vector<std::string> &argv) {
  if (argv.empty() || argv.front().empty()) {
    return Result<CommandOutput>::failure("command is required");
  }

  int from_child[2] = {-1, -1};
  if (pipe(from_child) != 0) {
    return Result<CommandOutput>::failure("failed to create pipe: " + std::string(strerror(errno)));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(from_child[0]);
    close(from_child[1]);
    return Result<CommandOutput>::failure("failed to fork: " + std::string(strerror(errno)));
  }

  if (pid == 0) {
    close(from_child[0]);
    dup2(from_child[1], STDOUT_FILENO);
    close(from_child[1]);
    const int devnull = open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
      dup2(devnull, STDERR_FILENO);
      close(devnull);
    }

    std::vector<const char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      args.push_back(arg.c_str());
    }
    args.push_back(nullptr);

    execvp(args.front(), const_cast<char *const *>(args.data()));
    _exit(127);
  }

  close(from_child[1]);

  CommandOutput output;
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t n = read(from_child[0], buffer.data(), buffer.size());
    if (n > 0) {
      output.stdout_text.append(buffer.data(), static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  close(from_child[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return Result<CommandOutput>::failure("failed to wait for " + argv.front() + ": " +
                                            std::string(strerror(errno)));
    }
  }

  if (WIFEXITED(status)) {
    output.exit_code = WEXITSTATUS(status);
  } else {
    output.exit_code = -1;
  }
  if (output.exit_code == 127) {
    return Result<CommandOutput>::failure(argv.front() + " could not be executed");
  }
  return Result<CommandOutput>::success(std::move(output));
}

bool command_exists(const std::string &command) {
  if (command.empty()) {
    return false;
  }
  if (command.find('/') != std::string::npos) {
    return access(command.c_str(), X_OK) == 0;
  }

  const char *path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return false;
  }
  std::string path = path_env;
  std::size_t start = 0;
  while (start <= path.size()) {
    const auto end = path.find(':', start);
    const std::string dir = path.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!dir.empty()) {
      const auto candidate = std::filesystem::path(dir) / command;
      if (access(candidate.c_str(), X_OK) == 0) {
        return true;
      }
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return false;
}

} // namespace launchpad::common
