#include "pairgate/devices/store_lock.hpp"

#include "pairgate/common/fs.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>

#include <signal.h>
#include <unistd.h>

namespace pairgate::devices {

namespace {

std::optional<StoreOwner> read_owner(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  StoreOwner owner;
  unsigned int port = 0;
  if (!(in >> owner.pid >> port) || owner.pid <= 0 || port > 65535) {
    return std::nullopt;
  }
  owner.port = static_cast<std::uint16_t>(port);
  return owner;
}

} // namespace

StoreLock::StoreLock(const std::filesystem::path &store_path) : path_(lock_path(store_path)) {}

StoreLock::~StoreLock() { release(); }

std::filesystem::path StoreLock::lock_path(const std::filesystem::path &store_path) {
  std::filesystem::path path = store_path;
  path += ".lock";
  return path;
}

common::Status StoreLock::acquire(const std::uint16_t port) {
  const int self = static_cast<int>(getpid());
  if (const auto existing = read_owner(path_);
      existing.has_value() && existing->pid != self && is_process_running(existing->pid)) {
    return common::Status::error("device store is in use by pid " +
                                 std::to_string(existing->pid) + " (port " +
                                 std::to_string(existing->port) + ")");
  }

  std::ostringstream content;
  content << self << " " << port << "\n";
  if (auto written = common::write_file_atomic(path_, content.str()); !written.ok()) {
    return common::Status::error("failed to write lock file: " + written.error());
  }
  acquired_ = true;
  return common::Status::success();
}

void StoreLock::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

std::optional<StoreOwner> StoreLock::owner(const std::filesystem::path &store_path) {
  auto found = read_owner(lock_path(store_path));
  if (!found.has_value() || !is_process_running(found->pid)) {
    return std::nullopt;
  }
  return found;
}

bool StoreLock::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace pairgate::devices
