#include <catch2/catch_test_macros.hpp>
#include "pool/pool_coordinator.hpp"
#include "core/error.hpp"
#include "mocks/mock_connection.hpp"

#include <atomic>
#include <format>
#include <thread>
#include <vector>

using namespace vaultagent;
using namespace std::chrono_literals;

namespace {

Credential make_credential(const std::string& role, int n) {
    Credential c;
    c.role = role;
    c.lease_id = std::format("database/creds/{}/lease-{}", role, n);
    c.username = std::format("user{}", n);
    c.password = "pw";
    c.lease_duration = 100s;
    return c;
}

PoolConfig small_pool() {
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.connection_timeout = 100ms;
    return config;
}

} // anonymous namespace

TEST_CASE("PoolCoordinator: first adopt publishes an active handle", "[coordinator]") {
    auto factory = std::make_shared<test::MockPoolFactory>();
    PoolCoordinator coordinator(factory, small_pool());

    CHECK(coordinator.current_handle("app") == nullptr);

    auto handle = coordinator.adopt("app", make_credential("app", 1));
    REQUIRE(handle);
    CHECK(handle->state() == HandleState::ACTIVE);
    CHECK(coordinator.current_handle("app") == handle);
    CHECK(factory->validations.load() == 1);

    auto conn = coordinator.borrow("app", 100ms);
    REQUIRE(conn);
    CHECK(conn.credential().lease_id == "database/creds/app/lease-1");
    CHECK(handle->outstanding() == 1);
}

TEST_CASE("PoolCoordinator: failed validation keeps the current handle", "[coordinator]") {
    auto factory = std::make_shared<test::MockPoolFactory>();
    PoolCoordinator coordinator(factory, small_pool());

    auto original = coordinator.adopt("app", make_credential("app", 1));

    SECTION("probe fails") {
        factory->db()->probes_fail.store(true);
        CHECK_THROWS_AS(coordinator.adopt("app", make_credential("app", 2)), ValidationError);
    }

    SECTION("new credential cannot connect") {
        factory->db()->rejected_users.insert("user2");
        CHECK_THROWS_AS(coordinator.adopt("app", make_credential("app", 2)), ValidationError);
    }

    CHECK(coordinator.current_handle("app") == original);
    CHECK(original->state() == HandleState::ACTIVE);
    CHECK(factory->closed.load() == 1);  // the rejected pool

    factory->db()->probes_fail.store(false);
    CHECK_NOTHROW(coordinator.borrow("app", 100ms));
}

TEST_CASE("PoolCoordinator: swap drains the old handle until its borrows return", "[coordinator]") {
    auto factory = std::make_shared<test::MockPoolFactory>();
    PoolCoordinator coordinator(factory, small_pool());

    auto old_handle = coordinator.adopt("app", make_credential("app", 1));
    auto in_flight = coordinator.borrow("app", 100ms);

    auto new_handle = coordinator.adopt("app", make_credential("app", 2));
    CHECK(coordinator.current_handle("app") == new_handle);
    CHECK(old_handle->state() == HandleState::DRAINING);
    CHECK(coordinator.draining_count("app") == 1);

    // New borrows go to the new pool only
    auto fresh = coordinator.borrow("app", 100ms);
    CHECK(fresh.credential().lease_id == "database/creds/app/lease-2");

    // The in-flight connection still works on the draining pool
    REQUIRE(in_flight);
    CHECK(in_flight->execute("SELECT 1").success);
    CHECK(old_handle->state() == HandleState::DRAINING);

    in_flight = BorrowedConnection(nullptr, nullptr);
    CHECK(old_handle->state() == HandleState::RETIRED);
    CHECK(old_handle->outstanding() == 0);
    CHECK(coordinator.draining_count("app") == 0);
    CHECK(factory->closed.load() == 1);
}

TEST_CASE("PoolCoordinator: returned connection no longer exposes its credential", "[coordinator]") {
    auto factory = std::make_shared<test::MockPoolFactory>();
    PoolCoordinator coordinator(factory, small_pool());
    auto handle = coordinator.adopt("app", make_credential("app", 1));

    SECTION("moved from") {
        auto conn = coordinator.borrow("app", 100ms);
        auto moved = std::move(conn);
        CHECK_FALSE(conn);
        CHECK_THROWS_AS(conn.credential(), VaultAgentError);
        CHECK(moved.credential().lease_id == "database/creds/app/lease-1");
        CHECK(handle->outstanding() == 1);
    }

    SECTION("discarded") {
        auto conn = coordinator.borrow("app", 100ms);
        conn.discard();
        CHECK_FALSE(conn);
        CHECK_THROWS_AS(conn.credential(), VaultAgentError);
        CHECK(handle->outstanding() == 0);
    }

    SECTION("replaced by move assignment") {
        auto first = coordinator.borrow("app", 100ms);
        auto second = coordinator.borrow("app", 100ms);
        first = std::move(second);
        CHECK_THROWS_AS(second.credential(), VaultAgentError);
        CHECK(first.credential().lease_id == "database/creds/app/lease-1");
        CHECK(handle->outstanding() == 1);
    }
}

TEST_CASE("PoolCoordinator: idle old handle retires immediately", "[coordinator]") {
    auto factory = std::make_shared<test::MockPoolFactory>();
    PoolCoordinator coordinator(factory, small_pool());

    auto old_handle = coordinator.adopt("app", make_credential("app", 1));
    (void)coordinator.adopt("app", make_credential("app", 2));

    CHECK(old_handle->state() == HandleState::RETIRED);
    CHECK(factory->closed.load() == 1);
}

TEST_CASE("PoolCoordinator: adopting the active lease again is a no-op", "[coordinator]") {
    auto factory = std::make_shared<test::MockPoolFactory>();
    PoolCoordinator coordinator(factory, small_pool());

    auto first = coordinator.adopt("app", make_credential("app", 1));
    auto again = coordinator.adopt("app", make_credential("app", 1));

    CHECK(first == again);
    CHECK(factory->builds.load() == 1);
}

TEST_CASE("PoolCoordinator: roles are independent", "[coordinator]") {
    auto factory = std::make_shared<test::MockPoolFactory>();
    PoolCoordinator coordinator(factory, small_pool());

    auto app = coordinator.adopt("app", make_credential("app", 1));
    auto web = coordinator.adopt("web", make_credential("web", 1));

    CHECK(coordinator.current_handle("app") == app);
    CHECK(coordinator.current_handle("web") == web);
    CHECK_THROWS_AS(coordinator.borrow("other", 10ms), ValidationError);
}

TEST_CASE("PoolCoordinator: exhausted pool raises PoolTimeoutError", "[coordinator]") {
    auto factory = std::make_shared<test::MockPoolFactory>();
    PoolConfig config = small_pool();
    config.max_connections = 1;
    PoolCoordinator coordinator(factory, config);

    auto handle = coordinator.adopt("app", make_credential("app", 1));
    auto held = coordinator.borrow("app", 50ms);

    CHECK_THROWS_AS(coordinator.borrow("app", 50ms), PoolTimeoutError);
    CHECK(handle->outstanding() == 1);
}

TEST_CASE("PoolCoordinator: concurrent borrows during swaps never see a retired pool",
          "[coordinator][concurrency]") {
    auto factory = std::make_shared<test::MockPoolFactory>();
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 8;
    PoolCoordinator coordinator(factory, config);
    (void)coordinator.adopt("app", make_credential("app", 0));

    std::atomic<bool> done{false};
    std::atomic<int> borrows{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> borrowers;
    for (int i = 0; i < 4; ++i) {
        borrowers.emplace_back([&] {
            while (!done.load()) {
                try {
                    auto conn = coordinator.borrow("app", 500ms);
                    if (!conn || !conn->is_connected()) failures.fetch_add(1);
                    borrows.fetch_add(1);
                } catch (const VaultAgentError&) {
                    failures.fetch_add(1);
                }
            }
        });
    }

    for (int n = 1; n <= 20; ++n) {
        (void)coordinator.adopt("app", make_credential("app", n));
        std::this_thread::sleep_for(2ms);
    }
    done.store(true);
    for (auto& t : borrowers) t.join();

    CHECK(failures.load() == 0);
    CHECK(borrows.load() > 0);
    CHECK(coordinator.draining_count("app") == 0);
}

TEST_CASE("PoolCoordinator: close_all unpublishes every pool", "[coordinator]") {
    auto factory = std::make_shared<test::MockPoolFactory>();
    PoolCoordinator coordinator(factory, small_pool());

    auto handle = coordinator.adopt("app", make_credential("app", 1));
    coordinator.close_all();

    CHECK(coordinator.current_handle("app") == nullptr);
    CHECK(handle->state() == HandleState::RETIRED);
    CHECK_THROWS_AS(coordinator.borrow("app", 10ms), ValidationError);
}

TEST_CASE("PoolCoordinator: invalid construction", "[coordinator][config]") {
    CHECK_THROWS_AS(PoolCoordinator(nullptr, small_pool()), ConfigurationError);

    PoolConfig bad = small_pool();
    bad.min_connections = 5;
    bad.max_connections = 2;
    CHECK_THROWS_AS(PoolCoordinator(std::make_shared<test::MockPoolFactory>(), bad), ConfigurationError);
}
