#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "mocks/mock_db_connection.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace joinscout;
using joinscout::testing::MockConnectionFactory;
using joinscout::testing::MockDbConnection;

TEST_CASE("Pool: min_connections pre-warms idle connections", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.connection_string = "dbname=catalog";
    config.min_connections = 2;
    config.max_connections = 5;

    GenericConnectionPool pool("test-db", config, factory);

    auto stats = pool.get_stats();
    CHECK(stats.idle_connections == 2);
    CHECK(stats.total_connections == 2);
    CHECK(factory->last_connection_string() == "dbname=catalog");
}

TEST_CASE("Pool: connections are created lazily and reused", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.min_connections = 0;
    config.max_connections = 3;

    GenericConnectionPool pool("test-db", config, factory);
    CHECK(factory->total_created() == 0);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        CHECK(conn->is_connected());
    }
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    CHECK(factory->total_created() == 1);
    auto stats = pool.get_stats();
    CHECK(stats.total_acquires == 2);
    CHECK(stats.total_releases == 2);
    CHECK(stats.idle_connections == 1);
}

TEST_CASE("Pool: acquire times out when every slot is taken", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.max_connections = 2;

    GenericConnectionPool pool("test-db", config, factory);

    auto a = pool.acquire();
    auto b = pool.acquire();
    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);

    auto c = pool.acquire(std::chrono::milliseconds(50));
    CHECK(c == nullptr);
    CHECK(pool.get_stats().failed_acquires == 1);

    // Releasing one handle frees a slot
    a.reset();
    auto d = pool.acquire(std::chrono::milliseconds(50));
    CHECK(d != nullptr);
}

TEST_CASE("Pool: failed connect releases its slot", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.max_connections = 1;

    GenericConnectionPool pool("test-db", config, factory);

    factory->set_fail_connect(true);
    CHECK(pool.acquire(std::chrono::milliseconds(50)) == nullptr);

    factory->set_fail_connect(false);
    auto conn = pool.acquire(std::chrono::milliseconds(50));
    CHECK(conn != nullptr);

    auto stats = pool.get_stats();
    CHECK(stats.failed_acquires == 1);
    // Failed acquires are not timed
    CHECK(stats.acquire_time_count == 1);
}

TEST_CASE("Pool: unhealthy idle connection is replaced", "[pool][health]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.max_connections = 1;
    config.idle_timeout = std::chrono::milliseconds(0);

    GenericConnectionPool pool("test-db", config, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        auto* mock = dynamic_cast<MockDbConnection*>(conn->get());
        REQUIRE(mock != nullptr);
        mock->set_healthy(false);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);
    CHECK(factory->total_created() == 2);
    CHECK(pool.get_stats().health_check_failures == 1);
}

TEST_CASE("Pool: recently used connection skips the health check", "[pool][health]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.max_connections = 1;
    config.idle_timeout = std::chrono::milliseconds(60000);

    GenericConnectionPool pool("test-db", config, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        dynamic_cast<MockDbConnection*>(conn->get())->set_healthy(false);
    }

    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);
    CHECK(factory->total_created() == 1);
    CHECK(pool.get_stats().health_check_failures == 0);
}

TEST_CASE("Pool: connection lost mid-query is dropped on release", "[pool][health]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.max_connections = 1;
    config.idle_timeout = std::chrono::milliseconds(60000);

    GenericConnectionPool pool("test-db", config, factory);

    {
        auto lease = pool.acquire();
        REQUIRE(lease != nullptr);
        lease->close();
    }

    auto stats = pool.get_stats();
    CHECK(stats.total_connections == 0);
    CHECK(stats.idle_connections == 0);
    CHECK(stats.total_releases == 1);

    // The slot came back with it
    auto fresh = pool.acquire(std::chrono::milliseconds(50));
    REQUIRE(fresh != nullptr);
    CHECK(fresh->is_connected());
    CHECK(factory->total_created() == 2);
}

TEST_CASE("Pool: lease scope bounds the borrow", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.max_connections = 1;

    GenericConnectionPool pool("test-db", config, factory);

    for (int query = 0; query < 3; ++query) {
        auto lease = pool.acquire(std::chrono::milliseconds(50));
        REQUIRE(lease != nullptr);
        CHECK(pool.get_stats().active_connections == 1);
    }
    CHECK(pool.get_stats().active_connections == 0);
    CHECK(factory->total_created() == 1);
}

// ============================================================================
// Lifetime
// ============================================================================

TEST_CASE("Pool: short max_lifetime causes connection recycling", "[pool][lifetime]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::seconds(1);

    GenericConnectionPool pool("test-db", config, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(1200));

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    CHECK(pool.get_stats().connections_recycled >= 1);
    CHECK(factory->total_created() == 2);
}

TEST_CASE("Pool: max_lifetime=0 disables recycling", "[pool][lifetime]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 2;
    config.max_lifetime = std::chrono::seconds(0);

    GenericConnectionPool pool("test-db", config, factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    CHECK(pool.get_stats().connections_recycled == 0);
    CHECK(factory->total_created() == 1);
}

// ============================================================================
// Drain
// ============================================================================

TEST_CASE("Pool: drain refuses new acquires and closes returned connections", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.min_connections = 1;
    config.max_connections = 3;

    GenericConnectionPool pool("test-db", config, factory);

    auto held = pool.acquire();
    REQUIRE(held != nullptr);
    auto* raw = held->get();

    pool.drain();
    pool.drain();  // idempotent

    CHECK(pool.acquire(std::chrono::milliseconds(10)) == nullptr);
    CHECK(raw->is_connected());

    held.reset();
    auto stats = pool.get_stats();
    CHECK(stats.total_connections == 0);
    CHECK(stats.idle_connections == 0);
}

// ============================================================================
// Metrics and concurrency
// ============================================================================

TEST_CASE("Pool: bucket counts sum equals total count", "[pool][metrics]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.max_connections = 10;

    GenericConnectionPool pool("test-db", config, factory);

    constexpr int N = 10;
    for (int i = 0; i < N; ++i) {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    auto stats = pool.get_stats();
    uint64_t bucket_sum = 0;
    for (auto b : stats.acquire_time_buckets) bucket_sum += b;
    CHECK(bucket_sum == static_cast<uint64_t>(N));
    CHECK(stats.acquire_time_count == static_cast<uint64_t>(N));
}

TEST_CASE("Pool: concurrent borrowers never exceed max_connections", "[pool][concurrency]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig config;
    config.max_connections = 3;

    GenericConnectionPool pool("test-db", config, factory);

    std::atomic<int> in_use{0};
    std::atomic<int> peak{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto conn = pool.acquire(std::chrono::milliseconds(2000));
                if (!conn) {
                    failures.fetch_add(1);
                    continue;
                }
                const int now = in_use.fetch_add(1) + 1;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                in_use.fetch_sub(1);
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(failures.load() == 0);
    CHECK(peak.load() <= 3);
    CHECK(factory->total_created() <= 3);
    CHECK(pool.get_stats().total_acquires == 160);
}
