#include "utils.hpp"

namespace conduit::test {

    TEST_CASE("004: started server is ready with its tools", "[004][registry]") {
        scripted_fleet fleet{};
        server_registry registry{1s, fleet.launcher()};

        auto ref = registry.start(scripted_spec("alpha"));
        auto handle = ref.lock();
        REQUIRE(handle);
        CHECK(handle->status() == server_status::ready);
        CHECK(handle->name() == "alpha");
        CHECK(handle->pid() == 4242);
        CHECK(handle->server_name() == "scripted");
        CHECK(handle->server_version() == "1");
        CHECK(handle->last_error().empty());

        auto tools = handle->tools();
        REQUIRE(tools.size() == 1U);
        CHECK(tools[0].name == "work");
        CHECK(tools[0].description == "scripted work");

        CHECK(registry.contains("alpha"));
        CHECK_FALSE(registry.contains("beta"));
        CHECK(registry.get("alpha").lock() == handle);
    }

    TEST_CASE("004: unknown names are not found", "[004][registry]") {
        scripted_fleet fleet{};
        server_registry registry{1s, fleet.launcher()};

        CHECK_THROWS_AS(registry.get("ghost"), not_found_error);
        CHECK_THROWS_AS(registry.stop("ghost", 0ms), not_found_error);
        CHECK_THROWS_AS(registry.ping("ghost", 100ms), not_found_error);
    }

    TEST_CASE("004: a live name cannot be started twice", "[004][registry]") {
        scripted_fleet fleet{};
        server_registry registry{1s, fleet.launcher()};

        auto first = registry.start(scripted_spec("alpha")).lock();
        CHECK_THROWS_AS(registry.start(scripted_spec("alpha")), launch_error);

        CHECK(registry.get("alpha").lock() == first);
        CHECK(first->status() == server_status::ready);
        CHECK(fleet.control("alpha")->terminations.load() == 0);
    }

    TEST_CASE("004: launcher exceptions become launch errors", "[004][registry]") {
        server_registry registry{1s, [](const server_spec&) -> std::unique_ptr<tool_session> {
                                     throw std::runtime_error("exec format error");
                                 }};

        CHECK_THROWS_AS(registry.start(scripted_spec("broken")), launch_error);
        auto handle = registry.get("broken").lock();
        REQUIRE(handle);
        CHECK(handle->status() == server_status::failed);
        CHECK(handle->last_error().find("exec format error") != std::string::npos);
        CHECK(handle->pid() == -1);
    }

    TEST_CASE("004: refused handshake leaves a failed entry", "[004][registry]") {
        scripted_fleet fleet{};
        fleet.control("grumpy")->fail_handshake = true;
        server_registry registry{1s, fleet.launcher()};

        CHECK_THROWS_AS(registry.start(scripted_spec("grumpy")), launch_error);

        auto handle = registry.get("grumpy").lock();
        REQUIRE(handle);
        CHECK(handle->status() == server_status::failed);
        CHECK(handle->last_error().find("refused") != std::string::npos);
        CHECK(fleet.control("grumpy")->terminations.load() == 1);
    }

    TEST_CASE("004: handshake that never answers times out", "[004][registry]") {
        scripted_fleet fleet{};
        fleet.control("silent")->hang_handshake = true;
        server_registry registry{200ms, fleet.launcher()};

        auto begin = steady_clock::now();
        CHECK_THROWS_AS(registry.start(scripted_spec("silent")), launch_error);
        auto took = steady_clock::now() - begin;

        CHECK(took >= 200ms);
        CHECK(took < 2s);
        CHECK(registry.get("silent").lock()->status() == server_status::failed);
    }

    TEST_CASE("004: stop passes the grace period and is idempotent", "[004][registry]") {
        scripted_fleet fleet{};
        server_registry registry{1s, fleet.launcher()};
        auto handle = registry.start(scripted_spec("alpha")).lock();

        registry.stop("alpha", 750ms);
        CHECK(handle->status() == server_status::stopped);
        CHECK(fleet.control("alpha")->last_grace_ms.load() == 750);
        CHECK(fleet.control("alpha")->terminations.load() == 1);

        registry.stop("alpha", 10ms);
        registry.stop(*handle, 10ms);
        CHECK(fleet.control("alpha")->terminations.load() == 1);
        CHECK(handle->status() == server_status::stopped);

        // a stopped entry stays visible
        CHECK(registry.contains("alpha"));
        auto reply = handle->request("ping", "{}", steady_clock::now() + 100ms, {});
        CHECK(reply.status == rpc_status::disconnected);
    }

    TEST_CASE("004: a stopped name can be started again", "[004][registry]") {
        scripted_fleet fleet{};
        server_registry registry{1s, fleet.launcher()};

        auto old_handle = registry.start(scripted_spec("alpha")).lock();
        registry.stop("alpha", 0ms);
        REQUIRE(old_handle->status() == server_status::stopped);

        fleet.control("alpha")->alive.store(true);
        auto new_handle = registry.start(scripted_spec("alpha")).lock();
        REQUIRE(new_handle);
        CHECK(new_handle != old_handle);
        CHECK(new_handle->status() == server_status::ready);
        CHECK(registry.get("alpha").lock() == new_handle);
        CHECK(old_handle->status() == server_status::stopped);
    }

    TEST_CASE("004: a crashed server is reported failed", "[004][registry]") {
        scripted_fleet fleet{};
        server_registry registry{1s, fleet.launcher()};
        auto handle = registry.start(scripted_spec("fragile")).lock();
        REQUIRE(handle->status() == server_status::ready);

        fleet.control("fragile")->crash();

        CHECK(handle->status() == server_status::failed);
        CHECK(handle->last_error().find("137") != std::string::npos);
        REQUIRE(handle->exit_status().has_value());
        CHECK(*handle->exit_status() == 137);

        // stopping a failed handle reaps it and keeps the failure
        registry.stop("fragile", 0ms);
        CHECK(handle->status() == server_status::failed);
    }

    TEST_CASE("004: list and names reflect every entry in name order", "[004][registry]") {
        scripted_fleet fleet{};
        fleet.control("bad")->fail_handshake = true;
        server_registry registry{1s, fleet.launcher()};

        (void)registry.start(scripted_spec("zeta"));
        (void)registry.start(scripted_spec("alpha"));
        CHECK_THROWS_AS(registry.start(scripted_spec("bad")), launch_error);
        registry.stop("zeta", 0ms);

        CHECK(registry.names() == std::vector<std::string>{"alpha", "bad", "zeta"});

        auto snapshots = registry.list();
        REQUIRE(snapshots.size() == 3U);
        CHECK(snapshots[0].name == "alpha");
        CHECK(snapshots[0].status == server_status::ready);
        CHECK(snapshots[0].tool_count == 1U);
        CHECK(snapshots[0].server_name == "scripted");
        CHECK(snapshots[1].name == "bad");
        CHECK(snapshots[1].status == server_status::failed);
        CHECK_FALSE(snapshots[1].last_error.empty());
        CHECK(snapshots[2].name == "zeta");
        CHECK(snapshots[2].status == server_status::stopped);
    }

    TEST_CASE("004: ping reports reachability and latency", "[004][registry]") {
        scripted_fleet fleet{};
        server_registry registry{1s, fleet.launcher()};
        (void)registry.start(scripted_spec("up"));
        (void)registry.start(scripted_spec("down"));
        fleet.control("down")->crash();

        auto up = registry.ping("up", 1s);
        CHECK(up.ok);
        CHECK(up.name == "up");
        CHECK(up.message.empty());
        CHECK(up.latency >= 0us);

        auto down = registry.ping("down", 1s);
        CHECK_FALSE(down.ok);
        CHECK(down.message.find("failed") != std::string::npos);
    }

    TEST_CASE("004: start_all starts in parallel and collects failures", "[004][registry]") {
        scripted_fleet fleet{};
        fleet.control("bad")->fail_handshake = true;
        fleet.control("slow")->hang_handshake = true;
        server_registry registry{300ms, fleet.launcher()};

        std::vector<server_spec> specs{scripted_spec("one"), scripted_spec("bad"), scripted_spec("slow"),
                                       scripted_spec("two")};

        auto begin = steady_clock::now();
        auto failures = registry.start_all(specs);
        CHECK(steady_clock::now() - begin < 2s);

        REQUIRE(failures.size() == 2U);
        CHECK(failures[0].name == "bad");
        CHECK(failures[1].name == "slow");
        CHECK_FALSE(failures[0].message.empty());

        CHECK(registry.get("one").lock()->status() == server_status::ready);
        CHECK(registry.get("two").lock()->status() == server_status::ready);
        CHECK(registry.get("slow").lock()->status() == server_status::failed);
    }

    TEST_CASE("004: stop_all stops everything and closes the registry", "[004][registry]") {
        scripted_fleet fleet{};
        server_registry registry{1s, fleet.launcher()};
        auto a = registry.start(scripted_spec("a")).lock();
        auto b = registry.start(scripted_spec("b")).lock();

        registry.stop_all(250ms);

        CHECK(a->status() == server_status::stopped);
        CHECK(b->status() == server_status::stopped);
        CHECK(fleet.control("a")->last_grace_ms.load() == 250);
        CHECK(fleet.control("b")->last_grace_ms.load() == 250);

        CHECK_THROWS_AS(registry.start(scripted_spec("c")), launch_error);
        CHECK_FALSE(registry.contains("c"));

        registry.stop_all(250ms);
        CHECK(fleet.control("a")->terminations.load() == 1);
    }

    TEST_CASE("004: stop_all aborts a handshake in progress", "[004][registry]") {
        scripted_fleet fleet{};
        fleet.control("stuck")->hang_handshake = true;
        server_registry registry{30s, fleet.launcher()};

        std::atomic<bool> threw{false};
        std::jthread starter{[&] {
            try {
                (void)registry.start(scripted_spec("stuck"));
            }
            catch (const launch_error&) {
                threw = true;
            }
        }};
        REQUIRE(detail::eventually([&] { return registry.contains("stuck"); }));
        std::this_thread::sleep_for(20ms);

        auto begin = steady_clock::now();
        registry.stop_all(0ms);
        starter.join();

        CHECK(threw.load());
        CHECK(steady_clock::now() - begin < 5s);
        auto status = registry.get("stuck").lock()->status();
        CHECK((status == server_status::failed || status == server_status::stopped));
    }

    TEST_CASE("004: stop on a starting server abandons the handshake", "[004][registry]") {
        scripted_fleet fleet{};
        fleet.control("stuck")->hang_handshake = true;
        server_registry registry{30s, fleet.launcher()};

        std::optional<std::string> error{};
        std::jthread starter{[&] {
            try {
                (void)registry.start(scripted_spec("stuck"));
            }
            catch (const launch_error& e) {
                error = e.what();
            }
        }};
        REQUIRE(detail::eventually([&] { return fleet.control("stuck")->handshakes.load() == 1; }));

        auto begin = steady_clock::now();
        registry.stop("stuck", 0ms);
        CHECK(steady_clock::now() - begin < 2s);
        starter.join();

        REQUIRE(error.has_value());
        CHECK(error->find("stopped while starting") != std::string::npos);

        // the stop wins over the aborted start, and the session is gone
        auto handle = registry.get("stuck").lock();
        CHECK(handle->status() == server_status::stopped);
        CHECK(fleet.control("stuck")->terminations.load() >= 1);
        CHECK_FALSE(fleet.control("stuck")->alive.load());

        // the name is free again
        fleet.control("stuck")->alive.store(true);
        fleet.control("stuck")->hang_handshake = false;
        CHECK(registry.start(scripted_spec("stuck")).lock()->status() == server_status::ready);
    }

    TEST_CASE("004: any handshake exception fails the start", "[004][registry]") {
        scripted_fleet fleet{};
        fleet.control("explosive")->throw_in_handshake = true;
        server_registry registry{1s, fleet.launcher()};

        CHECK_THROWS_AS(registry.start(scripted_spec("explosive")), launch_error);

        auto handle = registry.get("explosive").lock();
        REQUIRE(handle);
        CHECK(handle->status() == server_status::failed);
        CHECK(handle->last_error().find("blew up") != std::string::npos);
        CHECK(fleet.control("explosive")->terminations.load() == 1);
    }

}  // namespace conduit::test
