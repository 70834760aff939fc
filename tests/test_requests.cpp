#include "test_framework.hpp"

#include "pairgate/devices/requests.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <thread>

void register_requests_tests(std::vector<pairgate::tests::TestCase> &tests) {
  using pairgate::tests::require;
  using pairgate::testing::TempDir;
  namespace dev = pairgate::devices;

  constexpr std::int64_t WINDOW = 300'000;
  constexpr std::int64_t T0 = 1'700'000'000'000;

  tests.push_back({"requests_create_lists_as_pending", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     dev::PendingRequestWorkflow workflow(store, WINDOW);
                     const auto created =
                         workflow.create(pairgate::testing::sample_descriptor(), "8.8.8.8", T0);
                     require(created.ok(), created.error());
                     require(created.value().status == dev::RequestStatus::Pending, "pending");
                     require(!created.value().token.has_value(), "no token before approval");
                     const auto listed = workflow.list(T0 + 1000);
                     require(listed.size() == 1, "one pending request");
                     require(listed[0].id == created.value().id, "same request");
                     require(listed[0].ip == "8.8.8.8", "ip recorded");
                   }});

  tests.push_back({"requests_list_is_oldest_first", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     dev::PendingRequestWorkflow workflow(store, WINDOW);
                     const auto late = workflow.create({"late", "", ""}, "", T0 + 500);
                     const auto early = workflow.create({"early", "", ""}, "", T0);
                     require(late.ok() && early.ok(), "create");
                     const auto listed = workflow.list(T0 + 1000);
                     require(listed.size() == 2, "two requests");
                     require(listed[0].device.name == "early", "oldest first");
                   }});

  tests.push_back({"requests_expire_at_window_boundary", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     dev::PendingRequestWorkflow workflow(store, WINDOW);
                     const auto created = workflow.create({"n", "", ""}, "", T0);
                     require(created.ok(), created.error());
                     const auto id = created.value().id;

                     require(workflow.list(T0 + WINDOW - 1).size() == 1,
                             "still listed just inside the window");
                     require(workflow.list(T0 + WINDOW).empty(), "gone at the window");
                     require(workflow.status(id, T0 + WINDOW)->status ==
                                 dev::RequestStatus::Expired,
                             "status reads as expired");
                     require(workflow.status(id, T0 + WINDOW - 1)->status ==
                                 dev::RequestStatus::Pending,
                             "status is pending inside the window");
                     require(!workflow.approve(id, T0 + WINDOW).has_value(),
                             "expired request cannot be approved");
                     require(store.device_count() == 0, "no device minted");
                   }});

  tests.push_back({"requests_approve_mints_device_and_token", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     dev::PendingRequestWorkflow workflow(store, WINDOW);
                     const auto created = workflow.create(pairgate::testing::sample_descriptor(),
                                                          "8.8.4.4", T0);
                     require(created.ok(), created.error());
                     const auto approved = workflow.approve(created.value().id, T0 + 10);
                     require(approved.has_value(), "approve should succeed");
                     require(approved->status == dev::RequestStatus::Approved, "approved");
                     require(approved->token.has_value() && approved->device_id.has_value(),
                             "token and device id are attached");
                     require(approved->resolved_at == T0 + 10, "resolution time");

                     const auto device = store.get_device(*approved->device_id);
                     require(device.has_value(), "device minted");
                     require(device->name == "Test Phone", "descriptor carried over");
                     require(!device->is_host, "approved devices are not hosts");
                     require(device->ip == "8.8.4.4", "request ip carried over");
                     const auto check = store.verify_token(*approved->token);
                     require(check.valid() && check.device_id == device->id,
                             "token verifies for the minted device");
                     require(workflow.list(T0 + 20).empty(), "no longer pending");
                   }});

  tests.push_back({"requests_resolve_once", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     dev::PendingRequestWorkflow workflow(store, WINDOW);
                     const auto created = workflow.create({"n", "", ""}, "", T0);
                     require(created.ok(), created.error());
                     const auto id = created.value().id;
                     require(workflow.deny(id, T0 + 1).has_value(), "first deny");
                     require(!workflow.approve(id, T0 + 2).has_value(), "no approve after deny");
                     require(!workflow.deny(id, T0 + 3).has_value(), "no second deny");
                     require(workflow.status(id, T0 + 4)->status == dev::RequestStatus::Denied,
                             "denied sticks");
                     require(workflow.status(id, T0 + 4 + WINDOW)->status ==
                                 dev::RequestStatus::Denied,
                             "resolved requests never read as expired");
                     require(!workflow.approve("unknown", T0).has_value(), "unknown id");
                   }});

  tests.push_back({"requests_concurrent_approve_mints_one_device", [] {
                     TempDir dir;
                     dev::DeviceStore store(dir.path() / "devices.json");
                     dev::PendingRequestWorkflow workflow(store, WINDOW);
                     const auto created = workflow.create({"n", "", ""}, "");
                     require(created.ok(), created.error());
                     const auto id = created.value().id;

                     std::atomic<int> successes{0};
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 8; ++i) {
                       threads.emplace_back([&] {
                         if (workflow.approve(id).has_value()) {
                           ++successes;
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(successes.load() == 1, "exactly one approval wins");
                     require(store.device_count() == 1, "exactly one device minted");
                   }});

  tests.push_back({"requests_survive_store_reload", [] {
                     TempDir dir;
                     const auto path = dir.path() / "devices.json";
                     std::string id;
                     {
                       dev::DeviceStore store(path);
                       dev::PendingRequestWorkflow workflow(store, WINDOW);
                       const auto created = workflow.create({"n", "Android", "Chrome"}, "", T0);
                       require(created.ok(), created.error());
                       id = created.value().id;
                     }
                     dev::DeviceStore store(path);
                     dev::PendingRequestWorkflow workflow(store, WINDOW);
                     const auto status = workflow.status(id, T0 + 1);
                     require(status.has_value(), "request reloaded");
                     require(status->device.platform == "Android", "descriptor reloaded");
                   }});
}
