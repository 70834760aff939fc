#include "test_framework.hpp"

#include "pairgate/common/toml.hpp"
#include "pairgate/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>

namespace {

namespace cfg = pairgate::config;

bool has_problem(const std::vector<std::string> &problems, const std::string &needle) {
  return std::any_of(problems.begin(), problems.end(), [&needle](const std::string &problem) {
    return problem.find(needle) != std::string::npos;
  });
}

// Clears the overrides a developer shell might carry into the run.
struct CleanEnv {
  pairgate::testing::EnvGuard host{"PAIRGATE_HOST", std::nullopt};
  pairgate::testing::EnvGuard port{"PAIRGATE_PORT", std::nullopt};
  pairgate::testing::EnvGuard store{"PAIRGATE_STORE_PATH", std::nullopt};
  pairgate::testing::EnvGuard relay{"PAIRGATE_CLOUDFLARED", std::nullopt};
  pairgate::testing::EnvGuard path{"PAIRGATE_CONFIG_PATH", std::nullopt};
};

} // namespace

void register_config_tests(std::vector<pairgate::tests::TestCase> &tests) {
  using pairgate::tests::require;

  tests.push_back({"config_defaults", [] {
                     const cfg::Config config;
                     require(config.gateway.host == "0.0.0.0", "default host");
                     require(config.gateway.port == 5174, "default port");
                     require(config.auth.token_ttl_days == 365, "default ttl");
                     require(config.auth.request_window_seconds == 300, "default window");
                     require(config.tunnel.command_path == "cloudflared", "default relay");
                     require(config.tunnel.args.size() == 3 &&
                                 config.tunnel.args[2] == "http://localhost:{port}",
                             "default relay args");
                     require(cfg::validate_config(config).empty(), "defaults are valid");
                   }});

  tests.push_back({"config_parse_sections", [] {
                     const auto parsed = cfg::parse_config(R"(
[gateway]
host = "127.0.0.1"
port = 8080
max_body_bytes = 4096

[auth]
store_path = "/tmp/pairgate-devices.json"
token_ttl_days = 30
request_window_seconds = 60

[tunnel]
command_path = "/usr/local/bin/cloudflared"
args = ["tunnel", "--url", "http://{host}:{port}"]
url_pattern = 'https://[a-z-]+\.example\.com'
start_with_server = true

[observability]
backend = "none"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &c = parsed.value();
                     require(c.gateway.host == "127.0.0.1", "host");
                     require(c.gateway.port == 8080, "port");
                     require(c.gateway.max_body_bytes == 4096, "body limit");
                     require(c.auth.store_path == "/tmp/pairgate-devices.json", "store path");
                     require(c.auth.token_ttl_days == 30, "ttl");
                     require(c.auth.request_window_seconds == 60, "window");
                     require(c.tunnel.args.size() == 3 && c.tunnel.args[2] == "http://{host}:{port}",
                             "args");
                     require(c.tunnel.url_pattern == R"(https://[a-z-]+\.example\.com)",
                             "literal string kept verbatim, got " + c.tunnel.url_pattern);
                     require(c.tunnel.start_with_server, "start with server");
                     require(c.observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_render_parses_back", [] {
                     cfg::Config config;
                     config.gateway.port = 9999;
                     config.auth.token_ttl_days = 7;
                     config.tunnel.args = {"--flag", "value with spaces"};
                     const auto parsed = cfg::parse_config(cfg::render_config(config));
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().gateway.port == 9999, "port");
                     require(parsed.value().auth.token_ttl_days == 7, "ttl");
                     require(parsed.value().tunnel.args == config.tunnel.args, "args");
                     require(parsed.value().tunnel.url_pattern == config.tunnel.url_pattern,
                             "pattern");
                   }});

  tests.push_back({"config_validation_reports_problems", [] {
                     cfg::Config config;
                     config.gateway.port = 0;
                     config.auth.token_ttl_days = 0;
                     config.auth.request_window_seconds = -5;
                     config.tunnel.url_pattern = "([";
                     config.observability.backend = "log,statsd";
                     const auto problems = cfg::validate_config(config);
                     require(has_problem(problems, "gateway.port"), "port reported");
                     require(has_problem(problems, "token_ttl_days"), "ttl reported");
                     require(has_problem(problems, "request_window_seconds"), "window reported");
                     require(has_problem(problems, "url_pattern"), "regex reported");
                     require(has_problem(problems, "statsd"), "unknown backend reported");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     CleanEnv clean;
                     pairgate::testing::EnvGuard host("PAIRGATE_HOST", "127.0.0.1");
                     pairgate::testing::EnvGuard port("PAIRGATE_PORT", "6001");
                     pairgate::testing::EnvGuard store("PAIRGATE_STORE_PATH", "/tmp/x.json");
                     pairgate::testing::EnvGuard relay("PAIRGATE_CLOUDFLARED", "/opt/cf");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.gateway.host == "127.0.0.1", "host override");
                     require(config.gateway.port == 6001, "port override");
                     require(config.auth.store_path == "/tmp/x.json", "store override");
                     require(config.tunnel.command_path == "/opt/cf", "relay override");
                   }});

  tests.push_back({"config_malformed_port_env_is_ignored", [] {
                     CleanEnv clean;
                     pairgate::testing::EnvGuard port("PAIRGATE_PORT", "not-a-port");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.gateway.port == 5174, "configured port kept");
                   }});

  tests.push_back({"config_load_from_override_path", [] {
                     CleanEnv clean;
                     pairgate::testing::TempDir dir;
                     dir.create_file("custom.toml", "[gateway]\nport = 7100\n");
                     cfg::set_config_path_override(dir.path() / "custom.toml");
                     const auto loaded = cfg::load_config();
                     const auto path = cfg::config_path();
                     cfg::clear_config_path_override();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().gateway.port == 7100, "file value used");
                     require(path.ok() && path.value() == dir.path() / "custom.toml",
                             "override path honoured");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     CleanEnv clean;
                     pairgate::testing::TempDir dir;
                     cfg::set_config_path_override(dir.path() / "absent.toml");
                     const auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().gateway.port == 5174, "defaults used");
                   }});

  tests.push_back({"config_save_then_load", [] {
                     CleanEnv clean;
                     pairgate::testing::TempDir dir;
                     cfg::set_config_path_override(dir.path() / "saved.toml");
                     cfg::Config config;
                     config.gateway.host = "127.0.0.1";
                     const auto saved = cfg::save_config(config);
                     const auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(saved.ok(), saved.error());
                     require(loaded.ok() && loaded.value().gateway.host == "127.0.0.1",
                             "saved values reload");
                   }});

  tests.push_back({"config_store_path_expands_home", [] {
                     pairgate::testing::EnvGuard home("HOME", "/home/pairgate-test");
                     cfg::Config config;
                     config.auth.store_path = "~/data/devices.json";
                     require(cfg::store_path(config) ==
                                 std::filesystem::path("/home/pairgate-test/data/devices.json"),
                             "tilde expands to HOME, got " + cfg::store_path(config).string());
                   }});
}
