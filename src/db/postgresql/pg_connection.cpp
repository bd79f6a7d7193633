#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <format>

namespace joinscout {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return {.success = false, .error_message = "Connection is null"};
    }
    return process_result(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(const std::string& sql,
                                         const std::vector<std::string>& params) {
    if (!conn_) {
        return {.success = false, .error_message = "Connection is null"};
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    // Text-format parameters, server infers types from the statement
    PGresult* res = PQexecParams(conn_, sql.c_str(),
        static_cast<int>(values.size()), nullptr, values.data(),
        nullptr, nullptr, 0);
    return process_result(res);
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_result(PGresult* res) {
    if (!res) {
        return {.success = false, .error_message = PQerrorMessage(conn_)};
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_COMMAND_OK) {
        PQclear(res);
        return {.success = true};
    }

    if (status != PGRES_TUPLES_OK) {
        DbResultSet failed;
        failed.error_message = PQresultErrorMessage(res);
        if (const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE)) {
            failed.sqlstate = state;
        }
        PQclear(res);
        return failed;
    }

    DbResultSet result;
    result.success = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));

    for (int i = 0; i < nrows; i++) {
        DbRow row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j)));
            }
        }
        result.rows.push_back(std::move(row));
    }

    PQclear(res);
    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    // expand_dbname lets connection_string be either a URI or key=value pairs;
    // connect_timeout is only used when the string does not set its own
    std::string timeout_str;
    if (session_.connect_timeout.count() > 0) {
        // libpq treats values below 2 seconds as 2
        timeout_str = std::to_string((session_.connect_timeout.count() + 999) / 1000);
    }
    const char* keywords[] = {"connect_timeout", "dbname", nullptr};
    const char* values[] = {
        timeout_str.empty() ? nullptr : timeout_str.c_str(),
        connection_string.c_str(),
        nullptr
    };
    PGconn* conn = PQconnectdbParams(keywords, values, /*expand_dbname=*/1);

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    auto pg = std::make_unique<PgConnection>(conn);

    // set_config() takes the value as a parameter, so no identifier quoting is needed
    auto app = pg->execute_params("SELECT set_config('application_name', $1, false)",
                                  {session_.application_name});
    auto ro = pg->execute("SET default_transaction_read_only = on");
    if (!app.success || !ro.success) {
        utils::log::error(std::format("Failed to initialize read-only session: {}{}",
            app.error_message, ro.error_message));
        return nullptr;
    }

    if (session_.statement_timeout.count() > 0) {
        auto timeout = pg->execute(std::format("SET statement_timeout = {}",
                                               session_.statement_timeout.count()));
        if (!timeout.success) {
            utils::log::warn(std::format("Failed to set statement_timeout: {}", timeout.error_message));
        }
    }

    return pg;
}

} // namespace joinscout
