#pragma once

namespace pairgate {

#ifdef PAIRGATE_VERSION
inline constexpr const char *VERSION = PAIRGATE_VERSION;
#else
inline constexpr const char *VERSION = "0.1.0";
#endif

} // namespace pairgate
