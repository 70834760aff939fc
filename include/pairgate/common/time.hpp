#pragma once

#include <cstdint>
#include <string>

namespace pairgate::common {

[[nodiscard]] std::int64_t now_unix_ms();
[[nodiscard]] std::int64_t now_unix_seconds();
[[nodiscard]] std::string format_rfc3339(std::int64_t unix_ms);

} // namespace pairgate::common
