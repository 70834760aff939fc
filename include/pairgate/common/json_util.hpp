#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pairgate::common {

/// Escaped and quoted JSON string literal.
[[nodiscard]] std::string json_string(const std::string &value);

/// True when the whole text is one balanced JSON object (surrounding whitespace allowed).
[[nodiscard]] bool json_is_object(const std::string &json);

/// Top-level string member of an object, or "" when absent or not a string.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Members of one object. String values are unescaped; nested objects, arrays and
/// literals are kept as raw text. Members whose value is JSON null are left out, so a
/// string "null" stays distinguishable from an absent field.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Strings of a raw `[...]` array. Non-string elements are skipped; nullopt when the
/// text is not an array.
[[nodiscard]] std::optional<std::vector<std::string>>
json_parse_string_array(const std::string &raw_array);

/// Raw text of each element of a `[...]` array (strings stay quoted); nullopt when the
/// text is not a well-formed array.
[[nodiscard]] std::optional<std::vector<std::string>>
json_parse_array(const std::string &raw_array);

[[nodiscard]] std::optional<std::int64_t> json_to_int64(const std::string &raw);

} // namespace pairgate::common
