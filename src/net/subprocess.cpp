#include "net/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>

namespace netmon_agent::net {

CommandResult run_command(const std::vector<std::string>& argv, const std::chrono::milliseconds timeout) {
  CommandResult result{};
  if (argv.empty()) {
    result.exit_code = 127;
    return result;
  }

  int pipe_fds[2]{};
  if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
    result.exit_code = 127;
    return result;
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    result.exit_code = 127;
    return result;
  }

  if (pid == 0) {
    dup2(pipe_fds[1], STDOUT_FILENO);
    dup2(pipe_fds[1], STDERR_FILENO);
    execvp(args[0], args.data());
    _exit(127);
  }

  close(pipe_fds[1]);
  const int read_fd = pipe_fds[0];

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char chunk[4096]{};
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd descriptor{.fd = read_fd, .events = POLLIN, .revents = 0};
    const int ready = poll(&descriptor, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t bytes_read = ::read(read_fd, chunk, sizeof(chunk));
    if (bytes_read > 0) {
      result.output.append(chunk, static_cast<std::size_t>(bytes_read));
      continue;
    }
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    break;
  }

  close(read_fd);

  if (result.timed_out) {
    kill(pid, SIGKILL);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }

  if (!result.timed_out && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  return result;
}

}  // namespace netmon_agent::net
