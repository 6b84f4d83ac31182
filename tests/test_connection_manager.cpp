#include <catch2/catch_test_macros.hpp>
#include "manager/connection_manager.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/mock_connection.hpp"
#include "mocks/mock_secret_store.hpp"

#include <thread>
#include <vector>

using namespace vaultagent;
using namespace std::chrono_literals;

namespace {

struct ManagerFixture {
    std::shared_ptr<test::MockSecretStore> store = std::make_shared<test::MockSecretStore>();
    std::shared_ptr<test::ManualClock> clock = std::make_shared<test::ManualClock>();
    AuthSession auth{store, AuthSessionConfig{"role-id", "secret-id", 1000ms}, clock};
    SecretCache cache{SecretCache::Config{100, 300s}, clock};
    CredentialBroker broker{store, auth, cache, BrokerConfig{}, clock};
    std::shared_ptr<test::MockPoolFactory> factory = std::make_shared<test::MockPoolFactory>();

    static ConnectionManagerOptions options(bool background = false) {
        ConnectionManagerOptions o;
        o.pool.min_connections = 1;
        o.pool.max_connections = 2;
        o.pool.connection_timeout = 100ms;
        o.refresh.refresh_buffer = 0.8;
        o.refresh.check_interval = 10ms;
        o.background_refresh = background;
        return o;
    }

    std::unique_ptr<ConnectionManager> make(ConnectionManagerOptions o = options()) {
        return std::make_unique<ConnectionManager>("app", broker, factory, std::move(o), clock);
    }
};

} // anonymous namespace

TEST_CASE("ConnectionManager: construction issues and adopts the first credential", "[manager]") {
    ManagerFixture f;
    auto manager = f.make();

    CHECK(f.store->issue_calls.load() == 1);
    auto cred = manager->current_credential();
    REQUIRE(cred.has_value());
    CHECK(cred->lease_id == "database/creds/app/lease-1");

    auto conn = manager->get_connection();
    REQUIRE(conn);
    CHECK(conn->execute("SELECT 1").success);
    CHECK(conn.credential().username == "v-app-1");
}

TEST_CASE("ConnectionManager: construction failure propagates", "[manager]") {
    ManagerFixture f;

    SECTION("store refuses to issue") {
        f.store->set_issue_failure(StoreErrorCode::UNAVAILABLE);
        CHECK_THROWS_AS(f.make(), StoreUnavailableError);
    }

    SECTION("pool fails validation") {
        f.factory->db()->probes_fail.store(true);
        CHECK_THROWS_AS(f.make(), ValidationError);
    }
}

TEST_CASE("ConnectionManager: on-demand mode refreshes stale credentials before lending",
          "[manager][on_demand]") {
    ManagerFixture f;
    auto manager = f.make();

    f.clock->advance(79s);
    { auto conn = manager->get_connection(); }
    CHECK(f.store->issue_calls.load() == 1);

    f.clock->advance(1s);
    auto conn = manager->get_connection();
    CHECK(f.store->issue_calls.load() == 2);
    CHECK(conn.credential().lease_id == "database/creds/app/lease-2");
}

TEST_CASE("ConnectionManager: concurrent stale callers trigger one refresh", "[manager][concurrency]") {
    ManagerFixture f;
    auto opts = ManagerFixture::options();
    opts.pool.max_connections = 8;
    auto manager = f.make(opts);
    f.store->issue_delay = 50ms;
    f.clock->advance(90s);

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&] { auto conn = manager->get_connection(); });
    }
    for (auto& t : threads) t.join();

    CHECK(f.store->issue_calls.load() == 2);
}

TEST_CASE("ConnectionManager: on-demand refresh failure keeps serving the old pool",
          "[manager][on_demand]") {
    ManagerFixture f;
    auto manager = f.make();

    f.clock->advance(90s);
    f.store->set_issue_failure(StoreErrorCode::UNAVAILABLE);

    auto conn = manager->get_connection();
    CHECK(conn.credential().lease_id == "database/creds/app/lease-1");
    CHECK(manager->refresh_status().consecutive_failures == 1);
}

TEST_CASE("ConnectionManager: failed borrow validation refreshes once", "[manager][validation]") {
    ManagerFixture f;
    auto manager = f.make();
    auto db = f.factory->db();

    SECTION("recovers when the new credential works") {
        {
            std::lock_guard lock(db->mutex);
            db->probe_script = {false};  // only the first borrow probe fails
        }
        auto conn = manager->get_connection();

        CHECK(f.store->issue_calls.load() == 2);
        CHECK(conn.credential().lease_id == "database/creds/app/lease-2");
    }

    SECTION("second failure raises ValidationError") {
        {
            std::lock_guard lock(db->mutex);
            db->probe_script = {false, true, false};  // borrow, refresh validation, retry
        }
        CHECK_THROWS_AS(manager->get_connection(), ValidationError);
        CHECK(f.store->issue_calls.load() == 2);
    }

    SECTION("refresh that fails validation surfaces its error") {
        db->probes_fail.store(true);
        CHECK_THROWS_AS(manager->get_connection(), ValidationError);
        CHECK(manager->current_credential()->lease_id == "database/creds/app/lease-1");
    }

    SECTION("validation can be switched off") {
        auto opts = ManagerFixture::options();
        opts.validate_on_borrow = false;
        auto unchecked = f.make(opts);
        db->probes_fail.store(true);

        CHECK_NOTHROW(unchecked->get_connection());
    }
}

TEST_CASE("ConnectionManager: background mode refreshes without callers", "[manager][background]") {
    ManagerFixture f;
    std::atomic<int> callbacks{0};
    auto opts = ManagerFixture::options(true);
    opts.on_refresh = [&](const Credential&) { callbacks.fetch_add(1); };
    auto manager = f.make(opts);

    CHECK(manager->is_background());
    CHECK(callbacks.load() == 1);

    manager->start();
    f.clock->advance(85s);
    for (int i = 0; i < 200 && f.store->issue_calls.load() < 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    CHECK(f.store->issue_calls.load() >= 2);
    CHECK(callbacks.load() >= 2);

    // get_connection never refreshes by itself in background mode
    manager->stop();
    const int calls = f.store->issue_calls.load();
    f.clock->advance(1000s);
    { auto conn = manager->get_connection(); }
    CHECK(f.store->issue_calls.load() == calls);
}

TEST_CASE("ConnectionManager: refresh_now swaps pools and drains the old one", "[manager]") {
    ManagerFixture f;
    auto manager = f.make();

    auto held = manager->get_connection();
    const auto fresh = manager->refresh_now();
    CHECK(fresh.lease_id == "database/creds/app/lease-2");
    CHECK(manager->current_credential()->lease_id == fresh.lease_id);

    // The held connection still belongs to the old lease
    CHECK(held.credential().lease_id == "database/creds/app/lease-1");
    CHECK(held->execute("SELECT 1").success);
}

TEST_CASE("ConnectionManager: close is idempotent and blocks later borrows", "[manager]") {
    ManagerFixture f;
    auto manager = f.make();
    auto held = manager->get_connection();

    manager->close();
    manager->close();

    CHECK(manager->is_closed());
    CHECK_THROWS_AS(manager->get_connection(), ManagerClosedError);
    CHECK_THROWS_AS(manager->refresh_now(), ManagerClosedError);

    // Connections borrowed before close stay usable until returned
    CHECK(held->execute("SELECT 1").success);
}
