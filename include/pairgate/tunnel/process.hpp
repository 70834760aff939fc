#pragma once

#include "pairgate/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <sys/types.h>

namespace pairgate::tunnel {

/// A spawned relay: leader of its own process group, stdout and stderr merged into
/// `output_fd`.
struct RelayProcess {
  pid_t pid = 0;
  int output_fd = -1;

  [[nodiscard]] bool is_running() const;
  /// SIGTERM to the whole group, SIGKILL once `grace` has passed, then reaps the leader.
  void terminate(std::chrono::milliseconds grace);
};

/// Forks and execs `command`. Exec failures come back through a close-on-exec pipe,
/// so a missing binary is reported here rather than as an early exit.
[[nodiscard]] common::Result<RelayProcess> spawn_relay(const std::string &command,
                                                       const std::vector<std::string> &args);

/// Replaces {host} and {port} in a command or argument template.
[[nodiscard]] std::string substitute_placeholders(const std::string &input,
                                                  const std::string &host, std::uint16_t port);

} // namespace pairgate::tunnel
