#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <chrono>
#include <string>

namespace joinscout {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute_params(const std::string& sql,
                               const std::vector<std::string>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    DbResultSet process_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief Session settings applied to every new connection
 */
struct PgSessionConfig {
    std::string application_name{"joinscout-readonly"};
    std::chrono::milliseconds statement_timeout{0};   // 0 = server default
    std::chrono::milliseconds connect_timeout{2000};  // rounded up to whole seconds, 0 = none
};

/**
 * @brief PostgreSQL connection factory
 *
 * Connects with PQconnectdb, then pins the session read-only so
 * nothing issued through the pool can mutate data or schema.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    PgConnectionFactory() = default;
    explicit PgConnectionFactory(PgSessionConfig session) : session_(std::move(session)) {}

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;

private:
    PgSessionConfig session_;
};

} // namespace joinscout
