#pragma once

#include "pairgate/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace pairgate::devices {

/// Process currently serving a registry file.
struct StoreOwner {
  int pid = 0;
  std::uint16_t port = 0;
};

/// "<store>.lock" holding "<pid> <port>" while a gateway owns the registry. Other
/// processes must not write the store while a live owner is recorded.
class StoreLock {
public:
  explicit StoreLock(const std::filesystem::path &store_path);
  ~StoreLock();

  StoreLock(const StoreLock &) = delete;
  StoreLock &operator=(const StoreLock &) = delete;

  /// Fails when another live process holds the lock. A stale file is replaced.
  [[nodiscard]] common::Status acquire(std::uint16_t port);
  void release();

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  /// Live owner of `store_path`, if any. Stale or unreadable lock files count as none.
  [[nodiscard]] static std::optional<StoreOwner> owner(const std::filesystem::path &store_path);
  [[nodiscard]] static std::filesystem::path lock_path(const std::filesystem::path &store_path);
  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace pairgate::devices
