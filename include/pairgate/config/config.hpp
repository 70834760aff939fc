#pragma once

#include "pairgate/common/result.hpp"
#include "pairgate/config/schema.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace pairgate::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Resolved on-disk location of the device registry.
[[nodiscard]] std::filesystem::path store_path(const Config &config);
[[nodiscard]] std::int64_t token_ttl_seconds(const Config &config);
[[nodiscard]] std::int64_t request_window_ms(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] std::string render_config(const Config &config);

/// Returns the list of problems; empty means valid.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace pairgate::config
