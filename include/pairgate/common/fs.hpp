#pragma once

#include "pairgate/common/result.hpp"

#include <filesystem>
#include <string>

namespace pairgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes `content` to a sibling temp file and renames it over `path`.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace pairgate::common
