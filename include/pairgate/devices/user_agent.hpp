#pragma once

#include "pairgate/devices/device.hpp"

#include <string>

namespace pairgate::devices {

[[nodiscard]] std::string detect_platform(const std::string &user_agent);
[[nodiscard]] std::string detect_browser(const std::string &user_agent);

/// Full descriptor derived from a User-Agent header; name is "<browser> on <platform>".
[[nodiscard]] DeviceDescriptor describe_user_agent(const std::string &user_agent);

/// Keeps the fields the client supplied and derives the rest from `user_agent`.
[[nodiscard]] DeviceDescriptor complete_descriptor(DeviceDescriptor supplied,
                                                   const std::string &user_agent);

} // namespace pairgate::devices
