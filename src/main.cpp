#include "analyzer/join_inference_engine.hpp"
#include "config/config_loader.hpp"
#include "core/cancellation.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_metadata_provider.hpp"
#include "schema/schema_inspector.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace joinscout;
using json = nlohmann::json;

namespace {

// Observed by an in-flight suggest request; SIGINT flips it
CancellationToken g_cancel;

void signal_handler(int /*signal*/) {
    g_cancel.cancel();
}

void print_usage() {
    std::cerr <<
        "usage: joinscout <config.toml> <command> [args]\n"
        "\n"
        "commands:\n"
        "  describe <table>                              columns, keys and indexes\n"
        "  list                                          all user tables\n"
        "  search <pattern>                              tables matching a regex\n"
        "  suggest <new:alias> <existing:alias>...       ranked JOIN clauses\n";
}

int print_error(ErrorCategory category, const std::string& message) {
    json err = {
        {"error", {
            {"category", error_category_to_string(category)},
            {"message", message},
            {"retryable", is_retryable(category)}
        }}
    };
    std::cout << err.dump(2) << '\n';
    return 1;
}

template<typename T>
int print_error(const Result<T>& result) {
    return print_error(result.error_category(), result.error_message());
}

// "schema.table:alias"; a missing alias defaults to the bare table name
TableRef parse_table_arg(const std::string& arg) {
    const auto colon = arg.rfind(':');
    if (colon != std::string::npos) {
        return TableRef(arg.substr(0, colon), arg.substr(colon + 1));
    }
    const auto dot = arg.find('.');
    return TableRef(arg, dot == std::string::npos ? arg : arg.substr(dot + 1));
}

// ============================================================================
// JSON rendering
// ============================================================================

json to_json(const TableSnapshot& snap, const std::string& default_schema) {
    json columns = json::array();
    for (const auto& col : snap.columns) {
        json c = {
            {"name", col.name},
            {"type", col.type},
            {"nullable", col.nullable},
            {"type_class", type_class_to_string(col.type_class())},
            {"primary_key", snap.is_primary_key_column(col.name)}
        };
        c["default"] = col.default_value ? json(*col.default_value) : json(nullptr);
        c["max_length"] = col.max_length ? json(*col.max_length) : json(nullptr);
        c["comment"] = col.comment ? json(*col.comment) : json(nullptr);
        columns.push_back(std::move(c));
    }

    json outgoing = json::array();
    for (const auto& fk : snap.outgoing) {
        outgoing.push_back({
            {"column", fk.source_column},
            {"references_table", fk.target.full_name()},
            {"references_column", fk.target_column},
            {"constraint", fk.constraint_name}
        });
    }

    json incoming = json::array();
    for (const auto& fk : snap.incoming) {
        incoming.push_back({
            {"table", fk.from_table.full_name()},
            {"column", fk.from_column},
            {"references_column", fk.to_column},
            {"constraint", fk.constraint_name}
        });
    }

    json indexes = json::array();
    for (const auto& idx : snap.indexes) {
        indexes.push_back({
            {"name", idx.name},
            {"columns", idx.columns},
            {"unique", idx.unique},
            {"method", idx.access_method}
        });
    }

    return {
        {"table", snap.display_name(default_schema)},
        {"schema", snap.name.schema},
        {"columns", std::move(columns)},
        {"primary_key", snap.primary_key},
        {"foreign_keys", std::move(outgoing)},
        {"referenced_by", std::move(incoming)},
        {"indexes", std::move(indexes)}
    };
}

json to_json(const JoinSuggestion& s) {
    return {
        {"joinType", join_kind_to_string(s.kind)},
        {"expression", s.expression},
        {"description", s.description},
        {"score", s.score}
    };
}

// ============================================================================
// Commands
// ============================================================================

int cmd_describe(const SchemaInspector& inspector, const std::string& table) {
    auto snap = inspector.snapshot(table);
    if (snap.is_error()) return print_error(snap);
    if (!snap.value()) {
        return print_error(ErrorCategory::TABLE_NOT_FOUND,
            std::format("Table '{}' not found", table));
    }
    std::cout << to_json(*snap.value(), inspector.default_schema()).dump(2) << '\n';
    return 0;
}

int cmd_list(const SchemaInspector& inspector) {
    auto tables = inspector.list_tables();
    if (tables.is_error()) return print_error(tables);
    std::cout << json{{"tables", tables.value()}}.dump(2) << '\n';
    return 0;
}

int cmd_search(const SchemaInspector& inspector, const std::string& pattern) {
    auto tables = inspector.search_tables(pattern);
    if (tables.is_error()) return print_error(tables);
    std::cout << json{{"pattern", pattern}, {"tables", tables.value()}}.dump(2) << '\n';
    return 0;
}

int cmd_suggest(const JoinInferenceEngine& engine, const std::vector<std::string>& args) {
    const TableRef new_table = parse_table_arg(args[0]);
    std::vector<TableRef> existing;
    existing.reserve(args.size() - 1);
    for (size_t i = 1; i < args.size(); ++i) {
        existing.push_back(parse_table_arg(args[i]));
    }

    std::signal(SIGINT, signal_handler);
    auto result = engine.suggest_joins(existing, new_table, &g_cancel);
    std::signal(SIGINT, SIG_DFL);
    if (result.is_error()) return print_error(result);

    json suggestions = json::array();
    for (const auto& s : result.value()) {
        suggestions.push_back(to_json(s));
    }
    json out = {{"suggestions", std::move(suggestions)}};
    if (result.value().empty()) {
        out["message"] = "no suggestions found";
    }
    std::cout << out.dump(2) << '\n';
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 2;
    }

    const std::string config_file = argv[1];
    const std::string command = argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    const bool arity_ok =
        (command == "describe" && args.size() == 1) ||
        (command == "list" && args.empty()) ||
        (command == "search" && args.size() == 1) ||
        (command == "suggest" && args.size() >= 2);
    if (!arity_ok) {
        print_usage();
        return 2;
    }

    auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return print_error(ErrorCategory::INVALID_REQUEST, config_result.error_message);
    }
    const auto& cfg = config_result.config;

    // Validation already rejected unknown names
    utils::log::set_level(utils::log::parse_level(cfg.logging.level).value_or(utils::log::Level::INFO));

    try {
        PgSessionConfig session;
        session.application_name = cfg.database.application_name;
        session.statement_timeout = cfg.database.statement_timeout;
        session.connect_timeout = cfg.connection_timeout;

        PoolConfig pool_config = cfg.pool;
        pool_config.connection_string = cfg.database.conninfo();

        auto pool = std::make_shared<GenericConnectionPool>(
            cfg.database.dbname.empty() ? "metadata" : cfg.database.dbname,
            pool_config,
            std::make_shared<PgConnectionFactory>(std::move(session)));

        auto provider = std::make_shared<PgMetadataProvider>(pool);
        auto inspector = std::make_shared<const SchemaInspector>(provider, cfg.database.default_schema);

        int rc = 0;
        if (command == "describe") {
            rc = cmd_describe(*inspector, args[0]);
        } else if (command == "list") {
            rc = cmd_list(*inspector);
        } else if (command == "search") {
            rc = cmd_search(*inspector, args[0]);
        } else {
            const JoinInferenceEngine engine(inspector, cfg.inference);
            rc = cmd_suggest(engine, args);
        }

        pool->drain();
        return rc;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return print_error(ErrorCategory::INTERNAL_ERROR, e.what());
    }
}
