#pragma once

#include "pairgate/config/schema.hpp"
#include "pairgate/tunnel/process.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <thread>

namespace pairgate::tunnel {

enum class TunnelStatus { Stopped, Starting, Running, Error };

[[nodiscard]] std::string_view tunnel_status_name(TunnelStatus status);

struct TunnelState {
  std::string url;
  TunnelStatus status = TunnelStatus::Stopped;
  std::optional<std::int64_t> start_time; // unix ms
  std::optional<std::string> error;
};

[[nodiscard]] std::string encode_tunnel_state_json(const TunnelState &state);

/// Owns at most one relay subprocess and publishes the public URL scraped from its
/// output.
///
///   stopped --start()--> starting --url seen--> running
///   any --process exit--> stopped
///   any --spawn failure--> error
///   starting/running --stop()--> stopped
class TunnelSupervisor {
public:
  explicit TunnelSupervisor(config::TunnelConfig config,
                            std::chrono::milliseconds stop_grace = std::chrono::seconds(2));
  ~TunnelSupervisor();

  TunnelSupervisor(const TunnelSupervisor &) = delete;
  TunnelSupervisor &operator=(const TunnelSupervisor &) = delete;

  /// Spawns the relay unless one is already owned. Returns once the spawn was attempted.
  TunnelState start(std::uint16_t local_port);
  /// Terminates the relay's process group; always ends in `stopped`.
  TunnelState stop();
  [[nodiscard]] TunnelState info() const;

private:
  void watch(RelayProcess process);
  void set_error(std::string message);

  config::TunnelConfig config_;
  std::chrono::milliseconds stop_grace_;
  std::optional<std::regex> url_pattern_;
  std::string pattern_error_;

  std::mutex lifecycle_mutex_;
  mutable std::mutex mutex_;
  TunnelState state_;
  std::optional<RelayProcess> process_;
  bool stopping_ = false;
  std::thread watcher_;
};

} // namespace pairgate::tunnel
