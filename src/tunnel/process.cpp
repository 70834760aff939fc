#include "pairgate/tunnel/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pairgate::tunnel {

namespace {

void replace_all(std::string &value, const std::string &needle, const std::string &replacement) {
  std::size_t pos = 0;
  while ((pos = value.find(needle, pos)) != std::string::npos) {
    value.replace(pos, needle.size(), replacement);
    pos += replacement.size();
  }
}

// Closes every descriptor above stderr except `keep`.
void close_inherited_fds(const int keep) {
  long max_fd = sysconf(_SC_OPEN_MAX);
  if (max_fd < 0 || max_fd > 65536) {
    max_fd = 65536;
  }
  for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
    if (fd != keep) {
      close(fd);
    }
  }
}

void close_pair(int fds[2]) {
  if (fds[0] >= 0) {
    close(fds[0]);
  }
  if (fds[1] >= 0) {
    close(fds[1]);
  }
}

} // namespace

bool RelayProcess::is_running() const {
  if (pid <= 0) {
    return false;
  }
  if (kill(pid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

void RelayProcess::terminate(const std::chrono::milliseconds grace) {
  if (pid <= 0) {
    return;
  }
  kill(-pid, SIGTERM);
  const auto step = std::chrono::milliseconds(50);
  for (auto waited = std::chrono::milliseconds(0); waited < grace; waited += step) {
    int status = 0;
    const pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid || (done < 0 && errno == ECHILD)) {
      // leader gone; stragglers in the group still get the hard stop
      kill(-pid, SIGKILL);
      pid = 0;
      return;
    }
    usleep(static_cast<useconds_t>(step.count() * 1000));
  }
  kill(-pid, SIGKILL);
  int status = 0;
  (void)waitpid(pid, &status, 0);
  pid = 0;
}

common::Result<RelayProcess> spawn_relay(const std::string &command,
                                         const std::vector<std::string> &args) {
  // argv is built before fork; the child only makes async-signal-safe calls
  std::vector<char *> cargs;
  cargs.reserve(args.size() + 2);
  cargs.push_back(const_cast<char *>(command.c_str()));
  for (const auto &arg : args) {
    cargs.push_back(const_cast<char *>(arg.c_str()));
  }
  cargs.push_back(nullptr);

  int output[2] = {-1, -1};
  if (pipe2(output, O_CLOEXEC) != 0) {
    return common::Result<RelayProcess>::failure(std::string("failed to create pipe: ") +
                                                 std::strerror(errno));
  }
  int exec_status[2] = {-1, -1};
  if (pipe2(exec_status, O_CLOEXEC) != 0) {
    const int err = errno;
    close_pair(output);
    return common::Result<RelayProcess>::failure(std::string("failed to create pipe: ") +
                                                 std::strerror(err));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    close_pair(output);
    close_pair(exec_status);
    return common::Result<RelayProcess>::failure(std::string("failed to fork relay: ") +
                                                 std::strerror(err));
  }

  if (pid == 0) {
    setpgid(0, 0);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(output[1], STDOUT_FILENO);
    dup2(output[1], STDERR_FILENO);
    close_inherited_fds(exec_status[1]);

    execvp(command.c_str(), cargs.data());
    const int err = errno;
    (void)!write(exec_status[1], &err, sizeof(err));
    _exit(127);
  }

  // both sides call setpgid so the group exists before either signals it
  setpgid(pid, pid);
  close(output[1]);
  close(exec_status[1]);

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = read(exec_status[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(exec_status[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    close(output[0]);
    return common::Result<RelayProcess>::failure("failed to start " + command + ": " +
                                                 std::strerror(child_errno));
  }

  return common::Result<RelayProcess>::success(RelayProcess{.pid = pid, .output_fd = output[0]});
}

std::string substitute_placeholders(const std::string &input, const std::string &host,
                                    const std::uint16_t port) {
  std::string out = input;
  replace_all(out, "{host}", host);
  replace_all(out, "{port}", std::to_string(port));
  return out;
}

} // namespace pairgate::tunnel
