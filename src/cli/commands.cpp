#include "pairgate/cli/commands.hpp"

#include "pairgate/auth/gateway.hpp"
#include "pairgate/cli/admin_client.hpp"
#include "pairgate/common/fs.hpp"
#include "pairgate/common/http_client.hpp"
#include "pairgate/common/json_util.hpp"
#include "pairgate/common/time.hpp"
#include "pairgate/config/config.hpp"
#include "pairgate/devices/requests.hpp"
#include "pairgate/devices/store.hpp"
#include "pairgate/devices/store_lock.hpp"
#include "pairgate/gateway/server.hpp"
#include "pairgate/observability/factory.hpp"
#include "pairgate/observability/global.hpp"
#include "pairgate/tunnel/supervisor.hpp"
#include "pairgate/version.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace pairgate::cli {

namespace {

std::string version_string() { return std::string("pairgate ") + VERSION; }

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool load_valid_config(config::Config &out) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return false;
  }
  const auto problems = config::validate_config(cfg.value());
  if (!problems.empty()) {
    for (const auto &problem : problems) {
      std::cerr << "config: " << problem << "\n";
    }
    return false;
  }
  out = std::move(cfg.value());
  return true;
}

std::string describe_device(const devices::DeviceRecord &device) {
  std::string line = device.id + "  " + device.name;
  if (!device.platform.empty() || !device.browser.empty()) {
    line += " (" + device.platform + (device.browser.empty() ? "" : " / " + device.browser) + ")";
  }
  if (device.is_host) {
    line += " [host]";
  }
  line += "  last seen " + common::format_rfc3339(device.last_seen_at);
  if (!device.ip.empty()) {
    line += " from " + device.ip;
  }
  return line;
}

std::string describe_request(const devices::PendingRequest &request) {
  std::string line = request.id + "  " + request.device.name;
  if (!request.device.platform.empty()) {
    line += " (" + request.device.platform + ")";
  }
  line += "  " + std::string(devices::request_status_name(request.status));
  line += "  created " + common::format_rfc3339(request.created_at);
  if (!request.ip.empty()) {
    line += " from " + request.ip;
  }
  return line;
}

int run_serve(std::vector<std::string> args) {
  config::Config cfg;
  if (!load_valid_config(cfg)) {
    return 1;
  }
  observability::set_global_observer(observability::create_observer(cfg));

  gateway::GatewayOptions options;
  std::string host;
  std::string port_raw;
  const bool with_tunnel = take_flag(args, "--tunnel") || cfg.tunnel.start_with_server;
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  options.host = host.empty() ? cfg.gateway.host : host;
  if (!port_raw.empty()) {
    try {
      const unsigned long parsed = std::stoul(port_raw);
      if (parsed > 65535) {
        std::cerr << "invalid port: " << port_raw << "\n";
        return 1;
      }
      options.port = static_cast<std::uint16_t>(parsed);
    } catch (const std::exception &) {
      std::cerr << "invalid port: " << port_raw << "\n";
      return 1;
    }
  } else {
    options.port = cfg.gateway.port;
  }

  const auto store_file = config::store_path(cfg);
  if (const auto owner = devices::StoreLock::owner(store_file)) {
    std::cerr << "device store " << store_file.string() << " is already served by pid "
              << owner->pid << " on port " << owner->port << "\n";
    return 1;
  }

  devices::DeviceStore store(store_file, config::token_ttl_seconds(cfg));
  devices::PendingRequestWorkflow workflow(store, config::request_window_ms(cfg));
  auth::AuthGateway auth(store, workflow);
  tunnel::TunnelSupervisor tunnel(cfg.tunnel);

  gateway::GatewayServer server(cfg, auth, store, tunnel);
  auto status = server.start(options);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  devices::StoreLock lock(store_file);
  if (const auto locked = lock.acquire(server.port()); !locked.ok()) {
    std::cerr << locked.error() << "\n";
    server.stop();
    return 1;
  }

  std::cout << "Gateway listening on " << options.host << ":" << server.port() << "\n";
  std::cout << "Device store: " << store.path().string() << "\n";
  std::cout << "Pairing code: " << store.access_code() << "\n";

  if (with_tunnel) {
    const auto state = tunnel.start(server.port());
    if (state.status == tunnel::TunnelStatus::Error) {
      std::cerr << "tunnel: " << state.error.value_or("failed to start") << "\n";
    } else {
      std::cout << "Tunnel starting (" << cfg.tunnel.command_path << ")\n";
    }
  }

  std::cout << "Press Enter to stop gateway...\n";
  std::string line;
  std::getline(std::cin, line);
  (void)tunnel.stop();
  server.stop();
  lock.release();
  return 0;
}

int run_code() {
  config::Config cfg;
  if (!load_valid_config(cfg)) {
    return 1;
  }
  auto client = open_admin_client(cfg);
  const auto code = client->access_code();
  if (!code.ok()) {
    std::cerr << code.error() << "\n";
    return 1;
  }
  std::cout << code.value() << "\n";
  return 0;
}

int run_rotate_secret() {
  config::Config cfg;
  if (!load_valid_config(cfg)) {
    return 1;
  }
  auto client = open_admin_client(cfg);
  const auto code = client->rotate_secret();
  if (!code.ok()) {
    std::cerr << code.error() << "\n";
    return 1;
  }
  std::cout << "Secret rotated. Existing sessions are invalidated.\n";
  std::cout << "New pairing code: " << code.value() << "\n";
  return 0;
}

int run_devices(std::vector<std::string> args) {
  config::Config cfg;
  if (!load_valid_config(cfg)) {
    return 1;
  }
  auto client = open_admin_client(cfg);

  if (args.empty() || args[0] == "list") {
    const auto all = client->list_devices();
    if (!all.ok()) {
      std::cerr << all.error() << "\n";
      return 1;
    }
    if (all.value().empty()) {
      std::cout << "No devices.\n";
      return 0;
    }
    for (const auto &device : all.value()) {
      std::cout << describe_device(device) << "\n";
    }
    return 0;
  }

  if (args[0] == "revoke") {
    if (args.size() < 2) {
      std::cerr << "usage: pairgate devices revoke <id>\n";
      return 1;
    }
    if (const auto revoked = client->revoke_device(args[1]); !revoked.ok()) {
      std::cerr << revoked.error() << "\n";
      return 1;
    }
    std::cout << "Revoked " << args[1] << "\n";
    return 0;
  }

  if (args[0] == "rename") {
    if (args.size() < 3) {
      std::cerr << "usage: pairgate devices rename <id> <name>\n";
      return 1;
    }
    const auto updated = client->rename_device(args[1], args[2]);
    if (!updated.ok()) {
      std::cerr << updated.error() << "\n";
      return 1;
    }
    std::cout << describe_device(updated.value()) << "\n";
    return 0;
  }

  if (args[0] == "revoke-others") {
    if (args.size() < 2) {
      std::cerr << "usage: pairgate devices revoke-others <id>\n";
      return 1;
    }
    const auto removed = client->revoke_others(args[1]);
    if (!removed.ok()) {
      std::cerr << removed.error() << "\n";
      return 1;
    }
    std::cout << "Revoked " << removed.value() << " device(s)\n";
    return 0;
  }

  std::cerr << "unknown devices command: " << args[0] << "\n";
  return 1;
}

int run_requests(std::vector<std::string> args) {
  config::Config cfg;
  if (!load_valid_config(cfg)) {
    return 1;
  }
  auto client = open_admin_client(cfg);

  if (args.empty() || args[0] == "list") {
    const auto pending = client->list_requests();
    if (!pending.ok()) {
      std::cerr << pending.error() << "\n";
      return 1;
    }
    if (pending.value().empty()) {
      std::cout << "No pending requests.\n";
      return 0;
    }
    for (const auto &request : pending.value()) {
      std::cout << describe_request(request) << "\n";
    }
    return 0;
  }

  if (args[0] == "approve" || args[0] == "deny") {
    if (args.size() < 2) {
      std::cerr << "usage: pairgate requests " << args[0] << " <id>\n";
      return 1;
    }
    const auto resolved = client->resolve_request(args[1], args[0] == "approve");
    if (!resolved.ok()) {
      std::cerr << resolved.error() << "\n";
      return 1;
    }
    std::cout << describe_request(resolved.value()) << "\n";
    return 0;
  }

  std::cerr << "unknown requests command: " << args[0] << "\n";
  return 1;
}

int run_status() {
  config::Config cfg;
  if (!load_valid_config(cfg)) {
    return 1;
  }

  const std::string base = "http://127.0.0.1:" + std::to_string(cfg.gateway.port);
  common::CurlHttpClient client;
  const auto health = client.get(base + "/health", {}, 3000);
  if (health.network_error) {
    std::cout << "Gateway: not reachable on port " << cfg.gateway.port << " ("
              << health.network_error_message << ")\n";
    return 1;
  }
  if (health.status != 200) {
    std::cout << "Gateway: unhealthy (HTTP " << health.status << ")\n";
    return 1;
  }

  const auto fields = common::json_parse_flat(health.body);
  const auto field = [&fields](const std::string &key) {
    const auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
  };
  std::cout << "Gateway: running on port " << cfg.gateway.port << " (version " << field("version")
            << ")\n";
  std::cout << "Devices: " << field("devices") << "\n";

  const auto tunnel = client.get(base + "/api/tunnel/status", {}, 3000);
  if (!tunnel.network_error && tunnel.status == 200) {
    const auto state = common::json_parse_flat(tunnel.body);
    const auto status_it = state.find("status");
    const auto url_it = state.find("url");
    std::cout << "Tunnel: " << (status_it == state.end() ? "unknown" : status_it->second);
    if (url_it != state.end() && !url_it->second.empty()) {
      std::cout << " " << url_it->second;
    }
    std::cout << "\n";
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (args[0] == "validate") {
    const auto problems = config::validate_config(cfg.value());
    if (problems.empty()) {
      std::cout << "Configuration OK\n";
      return 0;
    }
    for (const auto &problem : problems) {
      std::cerr << problem << "\n";
    }
    return 1;
  }

  if (args[0] == "init") {
    if (config::config_exists()) {
      std::cerr << "config already exists\n";
      return 1;
    }
    auto saved = config::save_config(cfg.value());
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  pairgate" << RESET << DIM
            << "  device pairing gateway for a local web app" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "pairgate [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  SERVER" << RESET << "\n";
  std::cout << "  " << GREEN << "serve" << RESET << DIM
            << "          Start the gateway (--host H, --port P, --tunnel)" << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << DIM << "         Query a running gateway"
            << RESET << "\n\n";

  std::cout << BOLD << "  PAIRING" << RESET << "\n";
  std::cout << "  " << GREEN << "code" << RESET << DIM << "           Print the pairing code"
            << RESET << "\n";
  std::cout << "  " << GREEN << "rotate-secret" << RESET << DIM
            << "  New secret; signs out every device" << RESET << "\n";
  std::cout << "  " << GREEN << "requests" << RESET << DIM
            << "       list | approve <id> | deny <id>" << RESET << "\n";
  std::cout << "  " << GREEN << "devices" << RESET << DIM
            << "        list | revoke <id> | rename <id> <name> | revoke-others <id>" << RESET
            << "\n\n";

  std::cout << BOLD << "  CONFIG" << RESET << "\n";
  std::cout << "  " << GREEN << "config" << RESET << DIM << "         path | show | validate | init"
            << RESET << "\n\n";

  std::cout << DIM << "  --help, --version" << RESET << "\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "code") {
    return run_code();
  }
  if (subcommand == "rotate-secret") {
    return run_rotate_secret();
  }
  if (subcommand == "devices") {
    return run_devices(std::move(args));
  }
  if (subcommand == "requests") {
    return run_requests(std::move(args));
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace pairgate::cli
