#include "command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <system_error>

namespace artifact::service {

namespace {

constexpr std::size_t kMaxOutputBytes = 64 * 1024;

void Drain(int fd, std::string& output) {
  char buffer[4096];
  while (true) {
    const auto n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      const auto room = kMaxOutputBytes - std::min(kMaxOutputBytes, output.size());
      output.append(buffer, std::min<std::size_t>(room, static_cast<std::size_t>(n)));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    return;
  }
}

int ExitCodeOf(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

CommandResult RunCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    throw std::invalid_argument("RunCommand: empty argv");
  }

  // argv must be prepared before fork; only async-signal-safe calls in the child.
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
  c_argv.push_back(nullptr);

  int pipe_fds[2];
  if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }

  pid_t pid;
  do {
    pid = ::fork();
  } while (pid == -1 && errno == EINTR);

  if (pid == -1) {
    const int err = errno;
    ::close(pipe_fds[0]);
    ::close(pipe_fds[1]);
    throw std::system_error(err, std::generic_category(), "fork");
  }

  if (pid == 0) {
    ::dup2(pipe_fds[1], STDOUT_FILENO);
    ::dup2(pipe_fds[1], STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::execvp(c_argv[0], c_argv.data());
    ::_exit(127);
  }

  ::close(pipe_fds[1]);
  const int read_fd = pipe_fds[0];
  ::fcntl(read_fd, F_SETFL, ::fcntl(read_fd, F_GETFL) | O_NONBLOCK);

  CommandResult result;
  const auto    deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    int   status = 0;
    pid_t waited;
    do {
      waited = ::waitpid(pid, &status, WNOHANG);
    } while (waited == -1 && errno == EINTR);

    if (waited == pid) {
      Drain(read_fd, result.output);
      result.exit_code = ExitCodeOf(status);
      break;
    }
    if (waited == -1) {
      const int err = errno;
      ::close(read_fd);
      throw std::system_error(err, std::generic_category(), "waitpid");
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      ::kill(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
      }
      Drain(read_fd, result.output);
      result.timed_out = true;
      break;
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    pollfd     pfd{read_fd, POLLIN, 0};
    ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 50)));
    Drain(read_fd, result.output);
  }

  ::close(read_fd);
  return result;
}

} // namespace artifact::service
