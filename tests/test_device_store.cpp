#include "test_framework.hpp"

#include "pairgate/common/time.hpp"
#include "pairgate/devices/store.hpp"
#include "pairgate/security/access_code.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

namespace dev = pairgate::devices;

dev::DeviceRecord make_record(const std::string &id, std::int64_t created, std::int64_t seen) {
  return dev::DeviceRecord{.id = id,
                           .name = "device " + id,
                           .platform = "Linux",
                           .browser = "Firefox",
                           .created_at = created,
                           .last_seen_at = seen,
                           .ip = "10.0.0.1",
                           .is_host = false};
}

} // namespace

void register_device_store_tests(std::vector<pairgate::tests::TestCase> &tests) {
  using pairgate::tests::require;
  using pairgate::testing::TempDir;

  tests.push_back({"store_bootstraps_file_with_secret", [] {
                     TempDir dir;
                     const auto path = dir.path() / "nested" / "devices.json";
                     dev::DeviceStore store(path);
                     require(std::filesystem::exists(path), "store file should be created");
                     require(store.secret().size() == 64, "secret should be 32 random bytes");
                     require(store.device_count() == 0, "fresh store has no devices");
                     require(store.access_code() ==
                                 pairgate::security::derive_access_code(store.secret()),
                             "code derives from the secret");
                   }});

  tests.push_back({"store_reload_keeps_secret_and_devices", [] {
                     TempDir dir;
                     const auto path = dir.path() / "devices.json";
                     std::string secret;
                     std::string device_id;
                     {
                       dev::DeviceStore store(path);
                       secret = store.secret();
                       device_id = store.create_device(pairgate::testing::sample_descriptor(),
                                                       "10.0.0.7", true)
                                       .id;
                     }
                     dev::DeviceStore reopened(path);
                     require(reopened.secret() == secret, "secret must survive reload");
                     const auto device = reopened.get_device(device_id);
                     require(device.has_value(), "device must survive reload");
                     require(device->name == "Test Phone", "name persisted");
                     require(device->ip == "10.0.0.7", "ip persisted");
                     require(device->is_host, "host flag persisted");
                   }});

  tests.push_back({"store_corrupt_file_is_set_aside", [] {
                     TempDir dir;
                     dir.create_file("devices.json", "{ this is not json");
                     dev::DeviceStore store(dir.path() / "devices.json");
                     require(std::filesystem::exists(dir.path() / "devices.json.corrupt"),
                             "corrupt snapshot should be kept aside");
                     require(dir.read_file("devices.json.corrupt") == "{ this is not json",
                             "aside copy keeps the original bytes");
                     require(!store.secret().empty(), "fresh secret generated");
                     require(dir.read_file("devices.json").find("\"secret\"") !=
                                 std::string::npos,
                             "fresh store persisted");
                   }});

  tests.push_back({"store_snapshot_without_secret_is_corrupt", [] {
                     TempDir dir;
                     dir.create_file("devices.json",
                                     R"({"devices":{},"pendingRequests":{},"revokedTokens":[]})");
                     dev::DeviceStore store(dir.path() / "devices.json");
                     require(std::filesystem::exists(dir.path() / "devices.json.corrupt"),
                             "missing secret should be treated as corrupt");
                     require(!store.secret().empty(), "secret regenerated");
                   }});

  tests.push_back({"store_lists_newest_activity_first", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     require(store.add_device(make_record("a", 100, 500)).ok(), "add a");
                     require(store.add_device(make_record("b", 200, 900)).ok(), "add b");
                     require(store.add_device(make_record("c", 300, 500)).ok(), "add c");
                     const auto listed = store.list_devices();
                     require(listed.size() == 3, "three devices");
                     require(listed[0].id == "b", "most recently seen first");
                     require(listed[1].id == "c", "tie broken by newer creation");
                     require(listed[2].id == "a", "oldest last");
                   }});

  tests.push_back({"store_add_device_rejects_duplicates", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     require(store.add_device(make_record("x", 1, 1)).ok(), "first add");
                     require(!store.add_device(make_record("x", 2, 2)).ok(), "duplicate id");
                     require(!store.add_device(make_record("", 2, 2)).ok(), "empty id");
                   }});

  tests.push_back({"store_update_device_is_partial", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     require(store.add_device(make_record("x", 1, 1)).ok(), "add");
                     const auto updated =
                         store.update_device("x", dev::DeviceUpdate{.name = "Kitchen iPad"});
                     require(updated.has_value(), "update should find the device");
                     require(updated->name == "Kitchen iPad", "name changed");
                     require(updated->platform == "Linux", "platform untouched");
                     require(!store.update_device("missing", dev::DeviceUpdate{.name = "n"})
                                  .has_value(),
                             "unknown device yields nullopt");
                   }});

  tests.push_back({"store_literal_null_strings_survive_reload", [] {
                     TempDir dir;
                     const auto path = dir.path() / "devices.json";
                     {
                       dev::DeviceStore store(path);
                       auto record = make_record("x", 1, 1);
                       record.name = "null";
                       record.browser = "null";
                       require(store.add_device(record).ok(), "add");
                     }
                     dev::DeviceStore reloaded(path);
                     const auto device = reloaded.get_device("x");
                     require(device.has_value(), "device reloaded");
                     require(device->name == "null", "name is the text null, got " + device->name);
                     require(device->browser == "null", "browser kept");
                     require(device->platform == "Linux", "other fields intact");
                   }});

  tests.push_back({"store_update_last_seen_refreshes_timestamp", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     require(store.add_device(make_record("x", 1, 1)).ok(), "add");
                     require(store.update_last_seen("x", "192.168.1.5"), "known device");
                     const auto device = store.get_device("x");
                     require(device->last_seen_at > 1, "last seen moved forward");
                     require(device->ip == "192.168.1.5", "ip refreshed");
                     require(!store.update_last_seen("nope", ""), "unknown device");
                   }});

  tests.push_back({"store_token_for_removed_device_is_rejected", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     const auto device =
                         store.create_device(pairgate::testing::sample_descriptor(), "", false);
                     const auto token = store.generate_token(device.id);
                     const auto check = store.verify_token(token);
                     require(check.valid(), "fresh token valid");
                     require(check.device_id == device.id, "token names its device");
                     require(store.remove_device(device.id), "remove");
                     require(!store.remove_device(device.id), "second remove is a no-op");
                     require(store.verify_token(token).status ==
                                 dev::TokenCheckStatus::RevokedOrUnknownSubject,
                             "subject gone");
                   }});

  tests.push_back({"store_revoked_token_stays_revoked_after_reload", [] {
                     TempDir dir;
                     const auto path = dir.path() / "devices.json";
                     std::string token;
                     {
                       dev::DeviceStore store(path);
                       const auto device = store.create_device(
                           pairgate::testing::sample_descriptor(), "", false);
                       token = store.generate_token(device.id);
                       store.revoke_token(token);
                       require(store.is_token_revoked(token), "revoked in memory");
                     }
                     dev::DeviceStore reopened(path);
                     require(reopened.is_token_revoked(token), "revocation persisted");
                     require(reopened.verify_token(token).status ==
                                 dev::TokenCheckStatus::RevokedOrUnknownSubject,
                             "revoked token fails");
                   }});

  tests.push_back({"store_token_expiry_uses_configured_ttl", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json", 10);
                     const auto device =
                         store.create_device(pairgate::testing::sample_descriptor(), "", false);
                     const auto token = store.generate_token(device.id);
                     const auto now = pairgate::common::now_unix_seconds();
                     require(store.verify_token(token, now).valid(), "valid now");
                     require(store.verify_token(token, now + 60).status ==
                                 dev::TokenCheckStatus::Expired,
                             "expired after ttl");
                   }});

  tests.push_back({"store_rotate_secret_invalidates_tokens_and_code", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     const auto device =
                         store.create_device(pairgate::testing::sample_descriptor(), "", true);
                     const auto token = store.generate_token(device.id);
                     const auto old_secret = store.secret();
                     store.rotate_secret();
                     require(store.secret() != old_secret, "secret replaced");
                     require(store.verify_token(token).status ==
                                 dev::TokenCheckStatus::BadSignature,
                             "old token no longer verifies");
                     require(store.get_device(device.id).has_value(), "devices are kept");
                     require(store.verify_token(store.generate_token(device.id)).valid(),
                             "new tokens verify");
                   }});

  tests.push_back({"store_revoke_all_except_keeps_one", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     for (const std::string id : {"a", "b", "c", "d"}) {
                       require(store.add_device(make_record(id, 1, 1)).ok(), "add " + id);
                     }
                     require(store.revoke_all_except("c") == 3, "three removed");
                     require(store.device_count() == 1, "one left");
                     require(store.get_device("c").has_value(), "kept device remains");
                     require(store.revoke_all_except("c") == 0, "nothing more to remove");
                   }});

  tests.push_back({"store_resolve_request_only_moves_pending", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     const dev::PendingRequest request{.id = "r1",
                                                       .device = {"n", "p", "b"},
                                                       .ip = "1.2.3.4",
                                                       .status = dev::RequestStatus::Pending,
                                                       .created_at = 1000};
                     require(store.add_request(request).ok(), "add request");
                     require(!store.add_request(request).ok(), "duplicate request id");

                     const dev::RequestResolution deny{.status = dev::RequestStatus::Denied,
                                                       .resolved_at = 2000,
                                                       .expired_at_or_before = 0};
                     const auto first = store.resolve_request("r1", deny);
                     require(first.has_value(), "pending request resolves");
                     require(first->status == dev::RequestStatus::Denied, "denied");
                     require(first->resolved_at == 2000, "resolution time stored");
                     require(!store.resolve_request("r1", deny).has_value(),
                             "resolved request does not transition again");
                     require(!store.resolve_request("missing", deny).has_value(),
                             "unknown request");
                   }});

  tests.push_back({"store_resolve_request_refuses_stale_entries", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     const dev::PendingRequest request{.id = "r1",
                                                       .status = dev::RequestStatus::Pending,
                                                       .created_at = 1000};
                     require(store.add_request(request).ok(), "add request");
                     const dev::RequestResolution late{.status = dev::RequestStatus::Approved,
                                                       .resolved_at = 9000,
                                                       .expired_at_or_before = 1000,
                                                       .device = make_record("d", 1, 1),
                                                       .token = std::string("t")};
                     require(!store.resolve_request("r1", late).has_value(),
                             "expired request must not be approved");
                     require(!store.get_device("d").has_value(), "no device minted");
                   }});
}
