#include "pairgate/devices/store.hpp"

#include "pairgate/common/fs.hpp"
#include "pairgate/common/json_util.hpp"
#include "pairgate/common/time.hpp"
#include "pairgate/observability/global.hpp"
#include "pairgate/security/access_code.hpp"
#include "pairgate/security/crypto.hpp"

#include <algorithm>
#include <sstream>

namespace pairgate::devices {

namespace {

constexpr std::size_t SECRET_BYTES = 32;

std::string generate_secret() { return security::random_hex(SECRET_BYTES); }

TokenCheckStatus from_codec(const security::TokenStatus status) {
  switch (status) {
  case security::TokenStatus::Valid:
    return TokenCheckStatus::Valid;
  case security::TokenStatus::Expired:
    return TokenCheckStatus::Expired;
  case security::TokenStatus::BadSignature:
    return TokenCheckStatus::BadSignature;
  case security::TokenStatus::Malformed:
    return TokenCheckStatus::Malformed;
  }
  return TokenCheckStatus::Malformed;
}

} // namespace

std::string_view token_check_name(const TokenCheckStatus status) {
  switch (status) {
  case TokenCheckStatus::Valid:
    return "valid";
  case TokenCheckStatus::Expired:
    return "expired";
  case TokenCheckStatus::BadSignature:
    return "bad_signature";
  case TokenCheckStatus::Malformed:
    return "malformed";
  case TokenCheckStatus::RevokedOrUnknownSubject:
    return "revoked_or_unknown_subject";
  }
  return "malformed";
}

DeviceStore::DeviceStore(std::filesystem::path path, const std::int64_t token_ttl_seconds)
    : path_(std::move(path)), token_ttl_seconds_(token_ttl_seconds) {
  load();
}

void DeviceStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto parent = path_.parent_path(); !parent.empty()) {
    if (const auto dir = common::ensure_dir(parent); !dir.ok()) {
      observability::record_error("devices", dir.error());
    }
  }

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    reset_locked();
    persist_locked();
    return;
  }

  const auto text = common::read_file(path_);
  const common::Status parsed =
      text.ok() ? parse_snapshot(text.value()) : common::Status::error(text.error());
  if (parsed.ok()) {
    return;
  }

  std::filesystem::path aside = path_;
  aside += ".corrupt";
  std::filesystem::rename(path_, aside, ec);
  observability::record_error("devices", "unreadable store " + path_.string() + " (" +
                                             parsed.error() + "), moved to " + aside.string() +
                                             (ec ? " failed: " + ec.message() : ""));
  reset_locked();
  persist_locked();
}

void DeviceStore::reset_locked() {
  devices_.clear();
  requests_.clear();
  revoked_tokens_.clear();
  secret_ = generate_secret();
}

common::Status DeviceStore::parse_snapshot(const std::string &text) {
  if (!common::json_is_object(text)) {
    return common::Status::error("not a JSON object");
  }
  const auto top = common::json_parse_flat(text);

  const auto secret_it = top.find("secret");
  if (secret_it == top.end() || common::trim(secret_it->second).empty()) {
    return common::Status::error("secret missing");
  }

  std::map<std::string, DeviceRecord> devices;
  if (const auto it = top.find("devices"); it != top.end()) {
    if (!common::json_is_object(it->second)) {
      return common::Status::error("devices is not an object");
    }
    for (const auto &[key, raw] : common::json_parse_flat(it->second)) {
      auto device = parse_device_json(raw);
      if (!device.ok()) {
        return common::Status::error("device " + key + ": " + device.error());
      }
      devices[device.value().id] = device.value();
    }
  }

  std::map<std::string, PendingRequest> requests;
  if (const auto it = top.find("pendingRequests"); it != top.end()) {
    if (!common::json_is_object(it->second)) {
      return common::Status::error("pendingRequests is not an object");
    }
    for (const auto &[key, raw] : common::json_parse_flat(it->second)) {
      auto request = parse_request_json(raw);
      if (!request.ok()) {
        return common::Status::error("request " + key + ": " + request.error());
      }
      requests[request.value().id] = request.value();
    }
  }

  std::set<std::string> revoked;
  if (const auto it = top.find("revokedTokens"); it != top.end()) {
    auto tokens = common::json_parse_string_array(it->second);
    if (!tokens) {
      return common::Status::error("revokedTokens is not an array");
    }
    for (auto &token : *tokens) {
      revoked.insert(std::move(token));
    }
  }

  devices_ = std::move(devices);
  requests_ = std::move(requests);
  revoked_tokens_ = std::move(revoked);
  secret_ = secret_it->second;
  return common::Status::success();
}

std::string DeviceStore::render_snapshot() const {
  std::ostringstream out;
  out << "{\n  \"devices\": {";
  bool first = true;
  for (const auto &[id, device] : devices_) {
    out << (first ? "\n    " : ",\n    ") << common::json_string(id) << ": "
        << encode_device_json(device);
    first = false;
  }
  out << (devices_.empty() ? "" : "\n  ") << "},\n  \"pendingRequests\": {";
  first = true;
  for (const auto &[id, request] : requests_) {
    out << (first ? "\n    " : ",\n    ") << common::json_string(id) << ": "
        << encode_request_json(request);
    first = false;
  }
  out << (requests_.empty() ? "" : "\n  ") << "},\n  \"revokedTokens\": [";
  first = true;
  for (const auto &token : revoked_tokens_) {
    out << (first ? "" : ", ") << common::json_string(token);
    first = false;
  }
  out << "],\n  \"secret\": " << common::json_string(secret_) << "\n}\n";
  return out.str();
}

void DeviceStore::persist_locked() {
  const auto status = common::write_file_atomic(path_, render_snapshot());
  if (!status.ok()) {
    observability::record_error("devices", "failed to persist store: " + status.error());
  }
}

DeviceRecord DeviceStore::create_device(const DeviceDescriptor &descriptor, const std::string &ip,
                                        const bool is_host) {
  const std::int64_t now = common::now_unix_ms();
  DeviceRecord device{.id = security::random_id(),
                      .name = descriptor.name,
                      .platform = descriptor.platform,
                      .browser = descriptor.browser,
                      .created_at = now,
                      .last_seen_at = now,
                      .ip = ip,
                      .is_host = is_host};

  std::lock_guard<std::mutex> lock(mutex_);
  while (devices_.contains(device.id)) {
    device.id = security::random_id();
  }
  devices_[device.id] = device;
  persist_locked();
  return device;
}

common::Status DeviceStore::add_device(const DeviceRecord &device) {
  if (device.id.empty()) {
    return common::Status::error("device id is required");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (devices_.contains(device.id)) {
    return common::Status::error("device already exists: " + device.id);
  }
  devices_[device.id] = device;
  persist_locked();
  return common::Status::success();
}

std::optional<DeviceRecord> DeviceStore::get_device(const std::string &device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<DeviceRecord> DeviceStore::update_device(const std::string &device_id,
                                                       const DeviceUpdate &update) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  DeviceRecord &device = it->second;
  if (update.name.has_value()) {
    device.name = *update.name;
  }
  if (update.platform.has_value()) {
    device.platform = *update.platform;
  }
  if (update.browser.has_value()) {
    device.browser = *update.browser;
  }
  if (update.ip.has_value()) {
    device.ip = *update.ip;
  }
  persist_locked();
  return device;
}

bool DeviceStore::update_last_seen(const std::string &device_id, const std::string &ip) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return false;
  }
  it->second.last_seen_at = common::now_unix_ms();
  if (!ip.empty()) {
    it->second.ip = ip;
  }
  persist_locked();
  return true;
}

bool DeviceStore::remove_device(const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (devices_.erase(device_id) == 0) {
    return false;
  }
  persist_locked();
  return true;
}

std::size_t DeviceStore::revoke_all_except(const std::string &keep_device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t removed = std::erase_if(
      devices_, [&keep_device_id](const auto &entry) { return entry.first != keep_device_id; });
  if (removed > 0) {
    persist_locked();
  }
  return removed;
}

std::vector<DeviceRecord> DeviceStore::list_devices() const {
  std::vector<DeviceRecord> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(devices_.size());
    for (const auto &[id, device] : devices_) {
      (void)id;
      out.push_back(device);
    }
  }
  std::sort(out.begin(), out.end(), [](const DeviceRecord &a, const DeviceRecord &b) {
    if (a.last_seen_at != b.last_seen_at) {
      return a.last_seen_at > b.last_seen_at;
    }
    if (a.created_at != b.created_at) {
      return a.created_at > b.created_at;
    }
    return a.id < b.id;
  });
  return out;
}

std::size_t DeviceStore::device_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

std::string DeviceStore::generate_token(const std::string &device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return security::TokenCodec::issue(device_id, secret_, token_ttl_seconds_);
}

TokenCheck DeviceStore::verify_token(const std::string &token) const {
  return verify_token(token, common::now_unix_seconds());
}

TokenCheck DeviceStore::verify_token(const std::string &token,
                                     const std::int64_t now_seconds) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto verification = security::TokenCodec::verify(token, secret_, now_seconds);
  TokenCheck check{.status = from_codec(verification.status)};
  if (verification.claims.has_value()) {
    check.device_id = verification.claims->device_id;
  }
  if (!verification.valid()) {
    return check;
  }
  if (revoked_tokens_.contains(token) || !devices_.contains(*check.device_id)) {
    check.status = TokenCheckStatus::RevokedOrUnknownSubject;
  }
  return check;
}

void DeviceStore::revoke_token(const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (revoked_tokens_.insert(token).second) {
    persist_locked();
  }
}

bool DeviceStore::is_token_revoked(const std::string &token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return revoked_tokens_.contains(token);
}

std::string DeviceStore::access_code() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return security::derive_access_code(secret_);
}

std::string DeviceStore::secret() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return secret_;
}

void DeviceStore::rotate_secret() {
  std::lock_guard<std::mutex> lock(mutex_);
  secret_ = generate_secret();
  // old tokens now fail on signature, so the list has nothing left to block
  revoked_tokens_.clear();
  persist_locked();
}

common::Status DeviceStore::add_request(const PendingRequest &request) {
  if (request.id.empty()) {
    return common::Status::error("request id is required");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (requests_.contains(request.id)) {
    return common::Status::error("request already exists: " + request.id);
  }
  requests_[request.id] = request;
  persist_locked();
  return common::Status::success();
}

std::optional<PendingRequest> DeviceStore::get_request(const std::string &request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = requests_.find(request_id);
  if (it == requests_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<PendingRequest> DeviceStore::all_requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PendingRequest> out;
  out.reserve(requests_.size());
  for (const auto &[id, request] : requests_) {
    (void)id;
    out.push_back(request);
  }
  return out;
}

std::optional<PendingRequest> DeviceStore::resolve_request(const std::string &request_id,
                                                           const RequestResolution &resolution) {
  if (resolution.status == RequestStatus::Pending || resolution.status == RequestStatus::Expired) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = requests_.find(request_id);
  if (it == requests_.end() || it->second.status != RequestStatus::Pending ||
      it->second.created_at <= resolution.expired_at_or_before) {
    return std::nullopt;
  }

  PendingRequest &request = it->second;
  request.status = resolution.status;
  request.resolved_at = resolution.resolved_at;
  if (resolution.device.has_value()) {
    devices_[resolution.device->id] = *resolution.device;
    request.device_id = resolution.device->id;
  }
  if (resolution.token.has_value()) {
    request.token = *resolution.token;
  }
  persist_locked();
  return request;
}

} // namespace pairgate::devices
