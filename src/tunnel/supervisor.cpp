#include "pairgate/tunnel/supervisor.hpp"

#include "pairgate/common/json_util.hpp"
#include "pairgate/common/time.hpp"
#include "pairgate/observability/global.hpp"

#include <cerrno>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pairgate::tunnel {

namespace {

constexpr std::size_t MAX_BUFFERED_OUTPUT = 64 * 1024;
constexpr std::size_t KEPT_OUTPUT_TAIL = 4 * 1024;

} // namespace

std::string_view tunnel_status_name(const TunnelStatus status) {
  switch (status) {
  case TunnelStatus::Stopped:
    return "stopped";
  case TunnelStatus::Starting:
    return "starting";
  case TunnelStatus::Running:
    return "running";
  case TunnelStatus::Error:
    return "error";
  }
  return "stopped";
}

std::string encode_tunnel_state_json(const TunnelState &state) {
  std::string out = "{\"url\":" + common::json_string(state.url) + ",\"status\":" +
                    common::json_string(std::string(tunnel_status_name(state.status)));
  if (state.start_time.has_value()) {
    out += ",\"startTime\":" + std::to_string(*state.start_time);
  }
  if (state.error.has_value()) {
    out += ",\"error\":" + common::json_string(*state.error);
  }
  out += "}";
  return out;
}

TunnelSupervisor::TunnelSupervisor(config::TunnelConfig config,
                                   const std::chrono::milliseconds stop_grace)
    : config_(std::move(config)), stop_grace_(stop_grace) {
  try {
    url_pattern_.emplace(config_.url_pattern);
  } catch (const std::regex_error &ex) {
    pattern_error_ = std::string("invalid tunnel url_pattern: ") + ex.what();
  }
}

TunnelSupervisor::~TunnelSupervisor() { (void)stop(); }

TunnelState TunnelSupervisor::start(const std::uint16_t local_port) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (process_.has_value()) {
      return state_;
    }
  }
  // a watcher that saw its process exit has already finished
  if (watcher_.joinable()) {
    watcher_.join();
  }

  if (!url_pattern_.has_value()) {
    set_error(pattern_error_);
    return info();
  }

  const std::string host = "localhost";
  const std::string command = substitute_placeholders(config_.command_path, host, local_port);
  std::vector<std::string> args;
  args.reserve(config_.args.size());
  for (const auto &arg : config_.args) {
    args.push_back(substitute_placeholders(arg, host, local_port));
  }

  auto spawned = spawn_relay(command, args);
  if (!spawned.ok()) {
    set_error(spawned.error());
    return info();
  }

  TunnelState snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    process_ = spawned.value();
    stopping_ = false;
    state_ = TunnelState{.url = "",
                         .status = TunnelStatus::Starting,
                         .start_time = common::now_unix_ms(),
                         .error = std::nullopt};
    snapshot = state_;
  }
  observability::record_tunnel_status("starting", "");
  watcher_ = std::thread([this, process = spawned.value()] { watch(process); });
  return snapshot;
}

TunnelState TunnelSupervisor::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  std::optional<RelayProcess> process;
  bool was_active = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    was_active = process_.has_value() || state_.status != TunnelStatus::Stopped;
    process = process_;
    process_.reset();
    stopping_ = true;
  }
  if (watcher_.joinable()) {
    watcher_.join();
  }
  if (process.has_value()) {
    process->terminate(stop_grace_);
  }

  TunnelState snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = TunnelState{};
    stopping_ = false;
    snapshot = state_;
  }
  if (was_active) {
    observability::record_tunnel_status("stopped", "");
  }
  return snapshot;
}

TunnelState TunnelSupervisor::info() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void TunnelSupervisor::set_error(std::string message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = TunnelState{.url = "", .status = TunnelStatus::Error, .error = message};
  }
  observability::record_tunnel_status("error", "");
  observability::record_error("tunnel", message);
}

void TunnelSupervisor::watch(RelayProcess process) {
  std::string output;
  bool eof = false;

  while (true) {
    if (!eof) {
      fd_set readfds;
      FD_ZERO(&readfds);
      FD_SET(process.output_fd, &readfds);
      timeval tv{};
      tv.tv_sec = 0;
      tv.tv_usec = 200 * 1000;

      const int sel = select(process.output_fd + 1, &readfds, nullptr, nullptr, &tv);
      if (sel > 0 && FD_ISSET(process.output_fd, &readfds)) {
        char buf[512];
        const ssize_t n = read(process.output_fd, buf, sizeof(buf));
        if (n > 0) {
          output.append(buf, static_cast<std::size_t>(n));
        } else if (n == 0 || errno != EINTR) {
          eof = true;
        }
      }
    } else {
      usleep(200 * 1000);
    }

    std::string found_url;
    bool exited = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        break;
      }
      if (state_.status == TunnelStatus::Starting) {
        std::smatch match;
        if (std::regex_search(output, match, *url_pattern_)) {
          state_.url = match[0].str();
          state_.status = TunnelStatus::Running;
          found_url = state_.url;
        }
      }
      int status = 0;
      const pid_t done = waitpid(process.pid, &status, WNOHANG);
      if (done == process.pid || (done < 0 && errno == ECHILD)) {
        state_ = TunnelState{};
        process_.reset();
        exited = true;
      }
    }

    if (!found_url.empty()) {
      observability::record_tunnel_status("running", found_url);
      output.clear();
    }
    if (exited) {
      observability::record_tunnel_status("stopped", "");
      break;
    }
    if (output.size() > MAX_BUFFERED_OUTPUT) {
      output.erase(0, output.size() - KEPT_OUTPUT_TAIL);
    }
  }

  close(process.output_fd);
}

} // namespace pairgate::tunnel
