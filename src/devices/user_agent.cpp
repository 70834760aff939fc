#include "pairgate/devices/user_agent.hpp"

namespace pairgate::devices {

namespace {

bool contains(const std::string &haystack, const char *needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

std::string detect_platform(const std::string &user_agent) {
  // mobile agents also carry desktop tokens (Mac OS X, Linux)
  if (contains(user_agent, "iPhone") || contains(user_agent, "iPad") ||
      contains(user_agent, "iPod")) {
    return "iOS";
  }
  if (contains(user_agent, "Android")) {
    return "Android";
  }
  if (contains(user_agent, "Macintosh") || contains(user_agent, "Mac OS X")) {
    return "macOS";
  }
  if (contains(user_agent, "Windows")) {
    return "Windows";
  }
  if (contains(user_agent, "Linux") || contains(user_agent, "X11")) {
    return "Linux";
  }
  return "Unknown";
}

std::string detect_browser(const std::string &user_agent) {
  if (contains(user_agent, "Electron/")) {
    return "Electron";
  }
  if (contains(user_agent, "Edg/") || contains(user_agent, "EdgA/") ||
      contains(user_agent, "EdgiOS/")) {
    return "Edge";
  }
  if (contains(user_agent, "Firefox/") || contains(user_agent, "FxiOS/")) {
    return "Firefox";
  }
  if (contains(user_agent, "Chrome/") || contains(user_agent, "CriOS/")) {
    return "Chrome";
  }
  if (contains(user_agent, "Safari/")) {
    return "Safari";
  }
  return "Unknown";
}

DeviceDescriptor describe_user_agent(const std::string &user_agent) {
  DeviceDescriptor descriptor;
  descriptor.platform = detect_platform(user_agent);
  descriptor.browser = detect_browser(user_agent);
  descriptor.name = descriptor.browser + " on " + descriptor.platform;
  return descriptor;
}

DeviceDescriptor complete_descriptor(DeviceDescriptor supplied, const std::string &user_agent) {
  const DeviceDescriptor derived = describe_user_agent(user_agent);
  if (supplied.platform.empty()) {
    supplied.platform = derived.platform;
  }
  if (supplied.browser.empty()) {
    supplied.browser = derived.browser;
  }
  if (supplied.name.empty()) {
    supplied.name = supplied.browser + " on " + supplied.platform;
  }
  return supplied;
}

} // namespace pairgate::devices
