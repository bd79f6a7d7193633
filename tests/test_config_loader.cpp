#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace joinscout;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "joinscout_test_config") {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

// ============================================================================
// Defaults and sections
// ============================================================================

TEST_CASE("Config: defaults with only a connection string", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "postgresql://reader@localhost/shop"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.database.conninfo() == "postgresql://reader@localhost/shop");
    CHECK(cfg.database.default_schema == "public");
    CHECK(cfg.database.application_name == "joinscout-readonly");
    CHECK(cfg.database.statement_timeout.count() == 0);

    CHECK(cfg.pool.min_connections == 0);
    CHECK(cfg.pool.max_connections == 5);
    CHECK(cfg.pool.acquire_timeout.count() == 2000);
    CHECK(cfg.pool.idle_timeout.count() == 30000);
    CHECK(cfg.pool.max_lifetime.count() == 3600);
    CHECK(cfg.pool.health_check_query == "SELECT 1");
    CHECK(cfg.connection_timeout.count() == 2000);

    CHECK(cfg.inference.concurrent_pair_lookups);
    CHECK(cfg.inference.max_concurrent_pairs == 5);
    CHECK(cfg.inference.request_timeout.count() == 0);
    CHECK(cfg.inference.inner_join_threshold == 90);
    CHECK(cfg.inference.inner_join_bonus == 5);

    CHECK(cfg.logging.level == "info");
}

TEST_CASE("Config: every section overrides its defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
host = "db.internal"
port = 6432
dbname = "shop"
user = "reader"
application_name = "scout"
default_schema = "app"
statement_timeout_ms = 1500

[pool]
min_connections = 1
max_connections = 8
connection_timeout_ms = 4000
acquire_timeout_ms = 750
idle_timeout_ms = 10000
max_lifetime_seconds = 0
health_check_query = "SELECT 2"

[inference]
concurrent_pair_lookups = false
max_concurrent_pairs = 3
request_timeout_ms = 5000
inner_join_threshold = 95
inner_join_bonus = 2

[logging]
level = "debug"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.database.port == 6432);
    CHECK(cfg.database.application_name == "scout");
    CHECK(cfg.database.default_schema == "app");
    CHECK(cfg.database.statement_timeout.count() == 1500);

    CHECK(cfg.pool.min_connections == 1);
    CHECK(cfg.pool.max_connections == 8);
    CHECK(cfg.connection_timeout.count() == 4000);
    CHECK(cfg.pool.acquire_timeout.count() == 750);
    CHECK(cfg.pool.idle_timeout.count() == 10000);
    CHECK(cfg.pool.max_lifetime.count() == 0);
    CHECK(cfg.pool.health_check_query == "SELECT 2");

    CHECK_FALSE(cfg.inference.concurrent_pair_lookups);
    CHECK(cfg.inference.max_concurrent_pairs == 3);
    CHECK(cfg.inference.request_timeout.count() == 5000);
    CHECK(cfg.inference.inner_join_threshold == 95);
    CHECK(cfg.inference.inner_join_bonus == 2);

    CHECK(cfg.logging.level == "debug");
}

TEST_CASE("Config: pair workers follow the pool size unless set", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "dbname=shop"

[pool]
max_connections = 2
)");
    REQUIRE(result.success);
    CHECK(result.config.inference.max_concurrent_pairs == 2);
}

TEST_CASE("Config: discrete fields compose a quoted conninfo", "[config]") {
    DatabaseConfig db;
    db.host = "localhost";
    db.port = 5433;
    db.dbname = "shop";
    db.user = "reader";
    db.password = "it's a \\secret";
    db.sslmode = "require";

    CHECK(db.conninfo() ==
          "host='localhost' port='5433' dbname='shop' user='reader' "
          "password='it\\'s a \\\\secret' sslmode='require'");

    DatabaseConfig socket_only;
    socket_only.dbname = "shop";
    CHECK(socket_only.conninfo() == "dbname='shop'");
}

// ============================================================================
// Environment variables
// ============================================================================

TEST_CASE("Config: expand env var in connection_string", "[config][env]") {
    ::setenv("JOINSCOUT_TEST_PASSWORD", "s3cret", 1);

    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=localhost password=${JOINSCOUT_TEST_PASSWORD} dbname=test"
)");
    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "host=localhost password=s3cret dbname=test");

    ::unsetenv("JOINSCOUT_TEST_PASSWORD");
}

TEST_CASE("Config: missing env var expands to empty", "[config][env]") {
    ::unsetenv("JOINSCOUT_NONEXISTENT_12345");

    auto result = ConfigLoader::load_from_string(R"(
[database]
host = "localhost"
password = "${JOINSCOUT_NONEXISTENT_12345}"
)");
    REQUIRE(result.success);
    CHECK(result.config.database.password.empty());
}

TEST_CASE("Config: unclosed ${ is parse error", "[config][env]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=localhost password=${UNCLOSED"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Config: validation reports every problem at once", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
default_schema = ""

[pool]
min_connections = 4
max_connections = 0

[logging]
level = "verbose"
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("Config validation failed") != std::string::npos);
    CHECK(msg.find("database.connection_string or database.host/dbname") != std::string::npos);
    CHECK(msg.find("default_schema") != std::string::npos);
    CHECK(msg.find("max_connections must be > 0") != std::string::npos);
    CHECK(msg.find("min_connections (4) > max_connections (0)") != std::string::npos);
    CHECK(msg.find("logging.level 'verbose'") != std::string::npos);
}

TEST_CASE("Config: pair workers cannot outnumber pool connections", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "dbname=shop"

[pool]
max_connections = 2

[inference]
max_concurrent_pairs = 6
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("inference.max_concurrent_pairs (6) > pool.max_connections (2)")
          != std::string::npos);

    auto zero = ConfigLoader::load_from_string(R"(
[database]
connection_string = "dbname=shop"

[inference]
max_concurrent_pairs = 0
)");
    REQUIRE_FALSE(zero.success);
    CHECK(zero.error_message.find("inference.max_concurrent_pairs must be > 0") != std::string::npos);
}

TEST_CASE("Config: malformed TOML is reported, not thrown", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[database\nhost = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("Config: missing file is reported", "[config][validation]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/joinscout.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

// ============================================================================
// Includes
// ============================================================================

TEST_CASE("Config: included file provides base values", "[config][include]") {
    TmpDir tmp;
    tmp.file("pool.toml", R"(
[pool]
max_connections = 9
idle_timeout_ms = 1000
)");
    auto main_path = tmp.file("main.toml", R"(
include = "pool.toml"

[database]
connection_string = "dbname=shop"

[pool]
idle_timeout_ms = 2000
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.pool.max_connections == 9);
    // Including file wins
    CHECK(result.config.pool.idle_timeout.count() == 2000);
}

TEST_CASE("Config: array of includes and nested includes", "[config][include]") {
    TmpDir tmp;
    tmp.file("logging.toml", "[logging]\nlevel = \"warn\"\n");
    tmp.file("inner.toml", "[inference]\ninner_join_bonus = 7\n");
    tmp.file("inference.toml", "include = \"inner.toml\"\n[inference]\nrequest_timeout_ms = 300\n");
    auto main_path = tmp.file("main.toml", R"(
include = ["logging.toml", "inference.toml"]

[database]
connection_string = "dbname=shop"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "warn");
    CHECK(result.config.inference.request_timeout.count() == 300);
    CHECK(result.config.inference.inner_join_bonus == 7);
}

TEST_CASE("Config: circular include is rejected", "[config][include]") {
    TmpDir tmp;
    tmp.file("b.toml", "include = \"a.toml\"\n");
    auto a = tmp.file("a.toml", "include = \"b.toml\"\n[database]\nconnection_string = \"dbname=x\"\n");

    auto result = ConfigLoader::load_from_file(a);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}

TEST_CASE("Config: missing include is an error", "[config][include]") {
    TmpDir tmp;
    auto main_path = tmp.file("main.toml", R"(
include = "nonexistent.toml"

[database]
connection_string = "dbname=shop"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    CHECK_FALSE(result.success);
}
