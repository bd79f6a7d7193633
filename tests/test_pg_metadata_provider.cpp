#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "db/postgresql/pg_metadata_provider.hpp"
#include "mocks/mock_db_connection.hpp"

using namespace joinscout;
using joinscout::testing::MockConnectionFactory;

namespace {

struct ProviderFixture {
    std::shared_ptr<MockConnectionFactory> factory = std::make_shared<MockConnectionFactory>();
    std::shared_ptr<GenericConnectionPool> pool;
    PgMetadataProvider provider;

    ProviderFixture() : pool(make_pool(factory)), provider(pool) {}

    static std::shared_ptr<GenericConnectionPool> make_pool(std::shared_ptr<MockConnectionFactory> f) {
        PoolConfig config;
        config.max_connections = 1;
        config.acquire_timeout = std::chrono::milliseconds(50);
        return std::make_shared<GenericConnectionPool>("catalog", config, std::move(f));
    }

    joinscout::testing::ScriptedResults& script() { return factory->script(); }
};

const QualifiedName kUsers("public", "users");

} // namespace

TEST_CASE("PgMetadata: find_tables passes schema and table as parameters", "[provider]") {
    ProviderFixture fx;
    fx.script().push_rows({"nspname", "relname"}, {{"public", "users"}, {"public", "Users"}});

    auto result = fx.provider.find_tables(kUsers);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 2);
    CHECK(result.value()[0] == kUsers);
    CHECK(result.value()[1].table == "Users");

    REQUIRE(fx.script().calls.size() == 1);
    CHECK(fx.script().calls[0].params == std::vector<std::string>{"public", "users"});
}

TEST_CASE("PgMetadata: columns keep NULL distinct from empty", "[provider]") {
    ProviderFixture fx;
    fx.script().push_rows(
        {"column_name", "data_type", "is_nullable", "column_default", "character_maximum_length", "comment"},
        {
            {"id", "integer", "NO", "nextval('users_id_seq'::regclass)", "\\N", "\\N"},
            {"email", "character varying", "YES", "\\N", "255", "login address"},
            {"nick", "text", "YES", "''::text", "\\N", ""},
        });

    auto result = fx.provider.columns(kUsers);
    REQUIRE(result.is_ok());
    const auto& cols = result.value();
    REQUIRE(cols.size() == 3);

    CHECK(cols[0].name == "id");
    CHECK_FALSE(cols[0].nullable);
    REQUIRE(cols[0].default_value.has_value());
    CHECK_FALSE(cols[0].max_length.has_value());
    CHECK_FALSE(cols[0].comment.has_value());

    CHECK(cols[1].nullable);
    CHECK_FALSE(cols[1].default_value.has_value());
    REQUIRE(cols[1].max_length.has_value());
    CHECK(*cols[1].max_length == 255);
    CHECK(cols[1].comment == std::optional<std::string>("login address"));

    REQUIRE(cols[2].comment.has_value());
    CHECK(cols[2].comment->empty());
    CHECK(cols[2].type_class() == TypeClass::TEXTUAL);
}

TEST_CASE("PgMetadata: primary key keeps declaration order", "[provider]") {
    ProviderFixture fx;
    fx.script().push_rows({"attname"}, {{"tenant_id"}, {"id"}});

    auto result = fx.provider.primary_key(kUsers);
    REQUIRE(result.is_ok());
    CHECK(result.value() == PrimaryKey{"tenant_id", "id"});
}

TEST_CASE("PgMetadata: edge rows map to typed edges", "[provider]") {
    ProviderFixture fx;
    const std::vector<std::string> cols = {"sn", "sc", "sa", "tn", "tc", "ta", "conname"};
    fx.script().push_rows(cols, {{"public", "orders", "user_id", "public", "users", "id", "orders_user_id_fkey"}});
    fx.script().push_rows(cols, {{"sales", "invoices", "buyer_id", "public", "users", "id", "invoices_buyer_fk"}});

    auto out = fx.provider.outgoing_edges(QualifiedName("public", "orders"));
    REQUIRE(out.is_ok());
    REQUIRE(out.value().size() == 1);
    const auto& e = out.value()[0];
    CHECK(e.source == QualifiedName("public", "orders"));
    CHECK(e.source_column == "user_id");
    CHECK(e.target == kUsers);
    CHECK(e.target_column == "id");
    CHECK(e.constraint_name == "orders_user_id_fkey");

    auto in = fx.provider.incoming_edges(kUsers);
    REQUIRE(in.is_ok());
    REQUIRE(in.value().size() == 1);
    CHECK(in.value()[0].from_table == QualifiedName("sales", "invoices"));
    CHECK(in.value()[0].from_column == "buyer_id");
    CHECK(in.value()[0].to_column == "id");
}

TEST_CASE("PgMetadata: index rows parse array literals", "[provider]") {
    ProviderFixture fx;
    fx.script().push_rows({"index_name", "columns", "is_unique", "method"}, {
        {"users_pkey", "{id}", "t", "btree"},
        {"users_name_idx", "{last_name,\"First Name\"}", "f", "btree"},
    });

    auto result = fx.provider.indexes(kUsers);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 2);
    CHECK(result.value()[0].unique);
    CHECK(result.value()[0].columns == std::vector<std::string>{"id"});
    CHECK_FALSE(result.value()[1].unique);
    CHECK(result.value()[1].columns == std::vector<std::string>{"last_name", "First Name"});
    CHECK(result.value()[1].access_method == "btree");
}

TEST_CASE("PgMetadata: parse_text_array edge cases", "[provider]") {
    CHECK(PgMetadataProvider::parse_text_array("{}").empty());
    CHECK(PgMetadataProvider::parse_text_array("").empty());
    CHECK(PgMetadataProvider::parse_text_array("not an array").empty());
    CHECK(PgMetadataProvider::parse_text_array("{a}") == std::vector<std::string>{"a"});
    CHECK(PgMetadataProvider::parse_text_array("{\"a,b\",c}") == std::vector<std::string>{"a,b", "c"});
    CHECK(PgMetadataProvider::parse_text_array("{\"say \\\"hi\\\"\"}") ==
          std::vector<std::string>{"say \"hi\""});
}

TEST_CASE("PgMetadata: list and search return qualified names", "[provider]") {
    ProviderFixture fx;
    fx.script().push_rows({"schemaname", "tablename"}, {{"public", "orders"}, {"public", "users"}});
    fx.script().push_rows({"schemaname", "tablename"}, {{"public", "users"}});

    auto list = fx.provider.list_tables();
    REQUIRE(list.is_ok());
    CHECK(list.value().size() == 2);
    CHECK(fx.script().calls[0].params.empty());

    auto search = fx.provider.search_tables("^us");
    REQUIRE(search.is_ok());
    REQUIRE(search.value().size() == 1);
    CHECK(fx.script().calls[1].params == std::vector<std::string>{"^us"});
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("PgMetadata: query failure is METADATA_UNAVAILABLE", "[provider]") {
    ProviderFixture fx;
    fx.script().push_failure("ERROR:  permission denied for table pg_constraint\n", "42501");

    auto result = fx.provider.outgoing_edges(kUsers);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::METADATA_UNAVAILABLE);
    CHECK(result.error_message().find("permission denied") != std::string::npos);

    // The connection went back to the pool
    CHECK(fx.pool->get_stats().idle_connections == 1);
}

TEST_CASE("PgMetadata: invalid regex is INVALID_REQUEST", "[provider]") {
    ProviderFixture fx;
    fx.script().push_failure("ERROR:  invalid regular expression: parentheses () not balanced", "2201B");

    auto result = fx.provider.search_tables("(oops");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INVALID_REQUEST);
}

TEST_CASE("PgMetadata: unreachable database is METADATA_UNAVAILABLE", "[provider]") {
    ProviderFixture fx;
    fx.factory->set_fail_connect(true);

    auto result = fx.provider.columns(kUsers);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::METADATA_UNAVAILABLE);
    CHECK(result.error_message().find("catalog") != std::string::npos);
}

TEST_CASE("PgMetadata: exhausted pool is METADATA_UNAVAILABLE", "[provider]") {
    ProviderFixture fx;
    auto held = fx.pool->acquire();
    REQUIRE(held != nullptr);

    auto result = fx.provider.primary_key(kUsers);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::METADATA_UNAVAILABLE);
}
