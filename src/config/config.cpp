#include "pairgate/config/config.hpp"

#include "pairgate/common/fs.hpp"
#include "pairgate/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>

namespace pairgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".pairgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("PAIRGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

void load_gateway_config(Config &config, const common::TomlDocument &doc) {
  config.gateway.host = doc.get_string("gateway.host", config.gateway.host);
  config.gateway.port =
      static_cast<std::uint16_t>(doc.get_int("gateway.port", config.gateway.port));
  config.gateway.max_body_bytes = static_cast<std::size_t>(
      doc.get_int("gateway.max_body_bytes", static_cast<std::int64_t>(config.gateway.max_body_bytes)));
}

void load_auth_config(Config &config, const common::TomlDocument &doc) {
  config.auth.store_path = doc.get_string("auth.store_path", config.auth.store_path);
  config.auth.token_ttl_days = doc.get_int("auth.token_ttl_days", config.auth.token_ttl_days);
  config.auth.request_window_seconds =
      doc.get_int("auth.request_window_seconds", config.auth.request_window_seconds);
}

void load_tunnel_config(Config &config, const common::TomlDocument &doc) {
  config.tunnel.command_path = doc.get_string("tunnel.command_path", config.tunnel.command_path);
  config.tunnel.args = doc.get_string_array("tunnel.args", config.tunnel.args);
  config.tunnel.url_pattern = doc.get_string("tunnel.url_pattern", config.tunnel.url_pattern);
  config.tunnel.start_with_server =
      doc.get_bool("tunnel.start_with_server", config.tunnel.start_with_server);
}

} // namespace

namespace {

struct ConfigLocation {
  std::filesystem::path dir;
  std::filesystem::path file;
};

// An override naming a directory (or ending in a separator) holds config.toml; any other
// override is the file itself.
common::Result<ConfigLocation> resolve_location() {
  const auto override_path = resolved_config_path_override();
  if (!override_path) {
    const auto home = common::home_dir();
    if (!home.ok()) {
      return common::Result<ConfigLocation>::failure(home.error());
    }
    const auto dir = home.value() / CONFIG_FOLDER;
    return common::Result<ConfigLocation>::success({dir, dir / CONFIG_FILENAME});
  }

  std::error_code ec;
  if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
    return common::Result<ConfigLocation>::success(
        {*override_path, *override_path / CONFIG_FILENAME});
  }
  auto dir = override_path->parent_path();
  if (dir.empty()) {
    dir = std::filesystem::current_path(ec);
    if (ec) {
      return common::Result<ConfigLocation>::failure("unable to resolve current directory");
    }
  }
  return common::Result<ConfigLocation>::success({dir, *override_path});
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  const auto location = resolve_location();
  if (!location.ok()) {
    return common::Result<std::filesystem::path>::failure(location.error());
  }
  return common::ensure_dir(location.value().dir);
}

common::Result<std::filesystem::path> config_path() {
  const auto location = resolve_location();
  if (!location.ok()) {
    return common::Result<std::filesystem::path>::failure(location.error());
  }
  return common::Result<std::filesystem::path>::success(location.value().file);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::filesystem::path store_path(const Config &config) {
  return std::filesystem::path(common::expand_path(config.auth.store_path));
}

std::int64_t token_ttl_seconds(const Config &config) {
  return config.auth.token_ttl_days * 24 * 60 * 60;
}

std::int64_t request_window_ms(const Config &config) {
  return config.auth.request_window_seconds * 1000;
}

void apply_env_overrides(Config &config) {
  if (const char *host = env_value("PAIRGATE_HOST"); host != nullptr) {
    config.gateway.host = host;
  }
  if (const char *port = env_value("PAIRGATE_PORT"); port != nullptr) {
    try {
      const unsigned long parsed = std::stoul(port);
      if (parsed <= 65535) {
        config.gateway.port = static_cast<std::uint16_t>(parsed);
      }
    } catch (const std::exception &) {
      // malformed PAIRGATE_PORT leaves the configured port in place
    }
  }
  if (const char *path = env_value("PAIRGATE_STORE_PATH"); path != nullptr) {
    config.auth.store_path = path;
  }
  if (const char *binary = env_value("PAIRGATE_CLOUDFLARED"); binary != nullptr) {
    config.tunnel.command_path = binary;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;
  load_gateway_config(config, doc);
  load_auth_config(config, doc);
  load_tunnel_config(config, doc);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  if (!config.tunnel.command_path.empty()) {
    config.tunnel.command_path = common::expand_path(config.tunnel.command_path);
  }
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto text = common::read_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(text.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[gateway]\n";
  out << "host = " << common::quote_toml_string(config.gateway.host) << "\n";
  out << "port = " << config.gateway.port << "\n";
  out << "max_body_bytes = " << config.gateway.max_body_bytes << "\n\n";

  out << "[auth]\n";
  out << "store_path = " << common::quote_toml_string(config.auth.store_path) << "\n";
  out << "token_ttl_days = " << config.auth.token_ttl_days << "\n";
  out << "request_window_seconds = " << config.auth.request_window_seconds << "\n\n";

  out << "[tunnel]\n";
  out << "command_path = " << common::quote_toml_string(config.tunnel.command_path) << "\n";
  out << "args = " << common::toml_string_array(config.tunnel.args) << "\n";
  out << "url_pattern = '" << config.tunnel.url_pattern << "'\n";
  out << "start_with_server = " << (config.tunnel.start_with_server ? "true" : "false")
      << "\n\n";

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }
  return common::write_file_atomic(cfg_path_result.value(), render_config(config));
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> problems;
  if (common::trim(config.gateway.host).empty()) {
    problems.emplace_back("gateway.host must not be empty");
  }
  if (config.gateway.port == 0) {
    problems.emplace_back("gateway.port must be between 1 and 65535");
  }
  if (config.gateway.max_body_bytes < 1024) {
    problems.emplace_back("gateway.max_body_bytes must be at least 1024");
  }
  if (common::trim(config.auth.store_path).empty()) {
    problems.emplace_back("auth.store_path must not be empty");
  }
  if (config.auth.token_ttl_days <= 0) {
    problems.emplace_back("auth.token_ttl_days must be positive");
  }
  if (config.auth.request_window_seconds <= 0) {
    problems.emplace_back("auth.request_window_seconds must be positive");
  }
  if (common::trim(config.tunnel.command_path).empty()) {
    problems.emplace_back("tunnel.command_path must not be empty");
  }
  try {
    const std::regex pattern(config.tunnel.url_pattern);
    (void)pattern;
  } catch (const std::regex_error &ex) {
    problems.emplace_back(std::string("tunnel.url_pattern is not a valid regex: ") + ex.what());
  }

  const std::string observability = common::to_lower(common::trim(config.observability.backend));
  std::stringstream stream(observability);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string p = common::trim(part);
    if (!p.empty() && p != "log" && p != "none" && p != "noop") {
      problems.emplace_back("observability.backend has unknown entry: " + p);
    }
  }
  return problems;
}

} // namespace pairgate::config
