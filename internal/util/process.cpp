#include "process.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>

namespace ito::util {

namespace {

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

} // namespace

CommandResult RunCommand(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
  CommandResult result;
  if (argv.empty()) {
    return result;
  }

  int out_pipe[2];
  if (pipe(out_pipe) != 0) {
    return result;
  }

  pid_t pid = fork();
  if (pid < 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    return result;
  }

  if (pid == 0) {
    dup2(out_pipe[1], STDOUT_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);

    int devnull = open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
      dup2(devnull, STDERR_FILENO);
      close(devnull);
    }

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      _exit(127);
    }

    std::vector<std::string> args = argv;
    std::vector<char*>       raw;
    raw.reserve(args.size() + 1);
    for (auto& a : args) raw.push_back(a.data());
    raw.push_back(nullptr);

    execvp(raw[0], raw.data());
    _exit(127);
  }

  close(out_pipe[1]);

  char buf[4096];
  for (;;) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    if (n > 0) {
      result.stdout_text.append(buf, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  close(out_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return result;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
    // execvp failure in the child is reported as 127.
    result.spawned = result.exit_code != 127;
  }
  return result;
}

std::optional<std::string> RunCommandTrimmed(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
  auto result = RunCommand(argv, cwd);
  if (!result.spawned || result.exit_code != 0) {
    return std::nullopt;
  }
  auto text = Trim(result.stdout_text);
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

} // namespace ito::util
