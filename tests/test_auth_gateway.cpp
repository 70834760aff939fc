#include "test_framework.hpp"

#include "pairgate/auth/gateway.hpp"
#include "pairgate/auth/origin.hpp"
#include "pairgate/devices/user_agent.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

namespace auth = pairgate::auth;
namespace dev = pairgate::devices;
namespace obs = pairgate::observability;

constexpr const char *IPHONE_UA =
    "Mozilla/5.0 (iPhone; CPU iPhone OS 17_0 like Mac OS X) AppleWebKit/605.1.15 "
    "(KHTML, like Gecko) Version/17.0 Mobile/15E148 Safari/604.1";

auth::ClientOrigin loopback() { return auth::make_origin("127.0.0.1", "", "", "", ""); }

auth::ClientOrigin remote(const std::string &ua = "") {
  return auth::make_origin("203.0.113.5", "", "", "", ua);
}

auth::ClientOrigin relayed() {
  return auth::make_origin("127.0.0.1", "198.51.100.7, 10.0.0.1", "", "", "");
}

struct Harness {
  pairgate::testing::TempDir dir;
  dev::DeviceStore store{dir.path() / "devices.json"};
  dev::PendingRequestWorkflow workflow{store};
  auth::AuthGateway gateway{store, workflow};

  auth::Session host_session() {
    auto session = gateway.local_auth(loopback(), {"Host", "macOS", "Safari"});
    if (!session.ok()) {
      throw std::runtime_error("local auth failed in fixture");
    }
    return session.value();
  }

  auth::Session remote_session(const std::string &name = "Phone") {
    auto session = gateway.verify_code(store.access_code(), {name, "iOS", "Safari"}, remote());
    if (!session.ok()) {
      throw std::runtime_error("verify failed in fixture");
    }
    return session.value();
  }
};

} // namespace

void register_auth_gateway_tests(std::vector<pairgate::tests::TestCase> &tests) {
  using pairgate::tests::require;

  // ── Origin ────────────────────────────────────────────────────────────────

  tests.push_back({"origin_loopback_detection", [] {
                     for (const std::string addr :
                          {"127.0.0.1", "127.8.9.1", "::1", "[::1]", "::ffff:127.0.0.1",
                           "localhost"}) {
                       require(auth::is_loopback_address(addr), "loopback: " + addr);
                     }
                     for (const std::string addr : {"10.0.0.1", "192.168.1.2", "::2", ""}) {
                       require(!auth::is_loopback_address(addr), "not loopback: " + addr);
                     }
                   }});

  tests.push_back({"origin_forwarded_traffic_is_never_local", [] {
                     const auto xff = relayed();
                     require(!xff.is_loopback(), "X-Forwarded-For marks relayed traffic");
                     require(xff.client_ip() == "198.51.100.7", "first hop is the client");

                     const auto cf = auth::make_origin("127.0.0.1", "", "203.0.113.9", "", "");
                     require(!cf.is_loopback(), "CF-Connecting-IP marks relayed traffic");
                     require(cf.client_ip() == "203.0.113.9", "cf client address");

                     const auto real = auth::make_origin("::1", "", "", "198.51.100.1", "");
                     require(!real.is_loopback(), "X-Real-IP marks relayed traffic");

                     require(loopback().is_loopback(), "plain loopback is local");
                     require(loopback().client_ip() == "127.0.0.1", "peer is the client");
                   }});

  tests.push_back({"user_agent_detection", [] {
                     const auto d = dev::describe_user_agent(IPHONE_UA);
                     require(d.platform == "iOS", "iPhone is iOS, got " + d.platform);
                     require(d.browser == "Safari", "mobile safari, got " + d.browser);
                     require(d.name == "Safari on iOS", "derived name");
                     require(dev::detect_browser("Mozilla/5.0 (Windows NT 10.0) Chrome/120.0 "
                                                 "Safari/537.36 Edg/120.0") == "Edge",
                             "edge wins over chrome");
                     require(dev::detect_platform("Mozilla/5.0 (Linux; Android 14) Chrome/120") ==
                                 "Android",
                             "android before linux");
                     require(dev::detect_platform("") == "Unknown", "empty agent");

                     const auto kept = dev::complete_descriptor({"Mine", "", ""}, IPHONE_UA);
                     require(kept.name == "Mine", "supplied name kept");
                     require(kept.platform == "iOS", "platform filled in");
                   }});

  // ── Login ─────────────────────────────────────────────────────────────────

  tests.push_back({"auth_local_auth_requires_loopback", [] {
                     Harness h;
                     const auto session = h.gateway.local_auth(loopback(), {});
                     require(session.ok(), "loopback gets a session");
                     require(session.value().device.is_host, "local devices are hosts");
                     require(h.store.verify_token(session.value().token).valid(),
                             "issued token verifies");

                     const auto remote_attempt = h.gateway.local_auth(remote(), {});
                     require(!remote_attempt.ok() &&
                                 remote_attempt.error() == auth::AuthError::Forbidden,
                             "remote caller is forbidden");
                     const auto relayed_attempt = h.gateway.local_auth(relayed(), {});
                     require(!relayed_attempt.ok() &&
                                 relayed_attempt.error() == auth::AuthError::Forbidden,
                             "tunnel traffic is forbidden");
                     require(h.store.device_count() == 1, "only the local device exists");
                   }});

  tests.push_back({"auth_verify_code_creates_remote_device", [] {
                     Harness h;
                     const auto session = h.gateway.verify_code(" " + h.store.access_code() + "\n",
                                                                {}, remote(IPHONE_UA));
                     require(session.ok(), "correct code with whitespace is accepted");
                     require(!session.value().device.is_host, "remote devices are not hosts");
                     require(session.value().device.platform == "iOS", "platform from UA");
                     require(session.value().device.ip == "203.0.113.5", "client ip recorded");
                   }});

  tests.push_back({"auth_wrong_code_is_unauthorized_and_logged", [] {
                     pairgate::testing::ScopedRecorder recorder;
                     Harness h;
                     const std::string wrong = h.store.access_code() == "000000" ? "111111"
                                                                                 : "000000";
                     const auto session = h.gateway.verify_code(wrong, {}, remote());
                     require(!session.ok() && session.error() == auth::AuthError::Unauthorized,
                             "wrong code rejected");
                     require(h.store.device_count() == 0, "no device created");
                     const auto failures = recorder.recorder().events_of<obs::AuthFailureEvent>();
                     require(failures.size() == 1, "one auth failure recorded");
                     require(failures[0].route == "verify", "route recorded");
                     require(failures[0].ip == "203.0.113.5", "caller ip recorded");
                   }});

  // ── Sessions ──────────────────────────────────────────────────────────────

  tests.push_back({"auth_validate_refreshes_last_seen", [] {
                     Harness h;
                     const auto session = h.remote_session();
                     const auto validated = h.gateway.validate(
                         session.token, auth::make_origin("203.0.113.77", "", "", "", ""));
                     require(validated.ok(), "valid token accepted");
                     require(validated.value().id == session.device.id, "same device");
                     require(validated.value().last_seen_at >= session.device.last_seen_at,
                             "last seen does not go back");
                     require(validated.value().ip == "203.0.113.77", "ip refreshed");
                   }});

  tests.push_back({"auth_invalid_tokens_collapse_to_unauthorized", [] {
                     Harness h;
                     const auto session = h.remote_session();
                     for (const std::string token :
                          {std::string(), std::string("garbage"), session.token + "x"}) {
                       const auto result = h.gateway.validate(token, remote());
                       require(!result.ok() && result.error() == auth::AuthError::Unauthorized,
                               "bad token must be unauthorized");
                     }
                   }});

  tests.push_back({"auth_logout_revokes_token_and_device", [] {
                     Harness h;
                     const auto session = h.remote_session();
                     require(h.gateway.logout(session.token, remote()).ok(), "logout");
                     require(!h.store.get_device(session.device.id).has_value(), "device gone");
                     require(h.store.is_token_revoked(session.token), "token revoked");
                     const auto again = h.gateway.validate(session.token, remote());
                     require(!again.ok() && again.error() == auth::AuthError::Unauthorized,
                             "token no longer valid");
                     require(!h.gateway.logout(session.token, remote()).ok(),
                             "second logout is unauthorized");
                   }});

  tests.push_back({"auth_access_code_requires_session", [] {
                     Harness h;
                     const auto session = h.remote_session();
                     const auto code = h.gateway.access_code(session.token, remote());
                     require(code.ok() && code.value() == h.store.access_code(), "code returned");
                     const auto denied = h.gateway.access_code("", loopback());
                     require(!denied.ok() && denied.error() == auth::AuthError::Unauthorized,
                             "even loopback needs a token for the code route");
                   }});

  // ── Device management ─────────────────────────────────────────────────────

  tests.push_back({"auth_list_devices_marks_caller", [] {
                     Harness h;
                     const auto host = h.host_session();
                     const auto phone = h.remote_session();
                     const auto listing = h.gateway.list_devices(phone.token, remote());
                     require(listing.ok(), "listing");
                     require(listing.value().devices.size() == 2, "both devices listed");
                     require(listing.value().current_device_id == phone.device.id,
                             "caller marked as current");
                     (void)host;
                   }});

  tests.push_back({"auth_revoke_rules", [] {
                     Harness h;
                     const auto a = h.remote_session("A");
                     const auto b = h.remote_session("B");
                     const auto self = h.gateway.revoke(a.token, remote(), a.device.id);
                     require(!self.ok() && self.error() == auth::AuthError::Conflict,
                             "cannot revoke yourself");
                     const auto missing = h.gateway.revoke(a.token, remote(), "nope");
                     require(!missing.ok() && missing.error() == auth::AuthError::NotFound,
                             "unknown target");
                     require(h.gateway.revoke(a.token, remote(), b.device.id).ok(), "revoke b");
                     const auto b_after = h.gateway.validate(b.token, remote());
                     require(!b_after.ok() && b_after.error() == auth::AuthError::Unauthorized,
                             "revoked device loses access");
                   }});

  tests.push_back({"auth_rename_trims_and_validates", [] {
                     Harness h;
                     const auto a = h.remote_session("A");
                     const auto renamed = h.gateway.rename(a.token, remote(), a.device.id,
                                                           "  Living room  ");
                     require(renamed.ok() && renamed.value().name == "Living room", "trimmed");
                     const auto empty = h.gateway.rename(a.token, remote(), a.device.id, "   ");
                     require(!empty.ok() && empty.error() == auth::AuthError::BadRequest,
                             "blank name rejected");
                     const auto missing = h.gateway.rename(a.token, remote(), "nope", "x");
                     require(!missing.ok() && missing.error() == auth::AuthError::NotFound,
                             "unknown target");
                   }});

  tests.push_back({"auth_revoke_all_except_caller", [] {
                     Harness h;
                     const auto a = h.remote_session("A");
                     (void)h.remote_session("B");
                     (void)h.remote_session("C");
                     const auto removed = h.gateway.revoke_all_except(a.token, remote());
                     require(removed.ok() && removed.value() == 2, "two others removed");
                     require(h.store.device_count() == 1, "caller remains");
                     require(h.gateway.validate(a.token, remote()).ok(), "caller still valid");
                   }});

  // ── Pairing requests ──────────────────────────────────────────────────────

  tests.push_back({"auth_request_access_requires_code", [] {
                     Harness h;
                     const auto bad = h.gateway.request_access("bad", {}, remote());
                     require(!bad.ok() && bad.error() == auth::AuthError::Unauthorized,
                             "wrong code rejected");
                     const auto created =
                         h.gateway.request_access(h.store.access_code(), {}, remote(IPHONE_UA));
                     require(created.ok(), "request created");
                     require(created.value().device.platform == "iOS", "descriptor completed");
                     require(h.store.device_count() == 0, "no device before approval");
                   }});

  tests.push_back({"auth_check_status_hides_token_until_approved", [] {
                     Harness h;
                     const auto created =
                         h.gateway.request_access(h.store.access_code(), {}, remote());
                     require(created.ok(), "created");
                     const auto id = created.value().id;

                     auto status = h.gateway.check_status(id);
                     require(status.ok() && status.value().status == dev::RequestStatus::Pending,
                             "pending");
                     require(!status.value().token.has_value(), "no token while pending");

                     const auto approved = h.gateway.approve("", loopback(), id);
                     require(approved.ok(), "loopback operator approves");

                     status = h.gateway.check_status(id);
                     require(status.ok() && status.value().status == dev::RequestStatus::Approved,
                             "approved");
                     require(status.value().token.has_value(), "token delivered");
                     require(h.gateway.validate(*status.value().token, remote()).ok(),
                             "delivered token works");

                     const auto empty = h.gateway.check_status("  ");
                     require(!empty.ok() && empty.error() == auth::AuthError::BadRequest,
                             "empty id is a bad request");
                     const auto missing = h.gateway.check_status("missing");
                     require(!missing.ok() && missing.error() == auth::AuthError::NotFound,
                             "unknown id is not found");
                   }});

  tests.push_back({"auth_operator_authorization", [] {
                     Harness h;
                     const auto host = h.host_session();
                     const auto phone = h.remote_session();
                     const auto created =
                         h.gateway.request_access(h.store.access_code(), {}, remote());
                     require(created.ok(), "created");

                     const auto by_phone = h.gateway.list_pending(phone.token, remote());
                     require(!by_phone.ok() && by_phone.error() == auth::AuthError::Forbidden,
                             "non-host device is not an operator");
                     const auto by_tunnel = h.gateway.list_pending("", relayed());
                     require(!by_tunnel.ok() && by_tunnel.error() == auth::AuthError::Forbidden,
                             "relayed traffic is not an operator");
                     const auto by_host = h.gateway.list_pending(host.token, remote());
                     require(by_host.ok() && by_host.value().size() == 1,
                             "host token works from anywhere");

                     const auto denied = h.gateway.deny(host.token, remote(), created.value().id);
                     require(denied.ok() && denied.value().status == dev::RequestStatus::Denied,
                             "host denies");
                     const auto again = h.gateway.approve(host.token, remote(), created.value().id);
                     require(!again.ok() && again.error() == auth::AuthError::NotFound,
                             "resolved request is no longer approvable");
                   }});

  tests.push_back({"auth_events_are_recorded", [] {
                     pairgate::testing::ScopedRecorder recorder;
                     Harness h;
                     const auto host = h.host_session();
                     const auto created =
                         h.gateway.request_access(h.store.access_code(), {}, remote());
                     require(created.ok(), "created");
                     require(h.gateway.approve(host.token, remote(), created.value().id).ok(),
                             "approved");

                     const auto &rec = recorder.recorder();
                     const auto authorized = rec.events_of<obs::DeviceAuthorizedEvent>();
                     require(authorized.size() == 2, "local login and approval recorded");
                     require(authorized[0].method == "local", "first is local");
                     require(authorized[1].method == "approval", "second is approval");
                     require(rec.events_of<obs::AccessRequestCreatedEvent>().size() == 1,
                             "request creation recorded");
                     const auto resolved = rec.events_of<obs::AccessRequestResolvedEvent>();
                     require(resolved.size() == 1 && resolved[0].status == "approved",
                             "resolution recorded");
                   }});
}
