#include "db/postgresql/pg_metadata_provider.hpp"
#include "db/schema_constants.hpp"
#include "core/utils.hpp"
#include <format>

namespace joinscout {

namespace {

// SQLSTATE class 22 code for a malformed regular expression
constexpr std::string_view kInvalidRegex = "2201B";

constexpr const char* kFindTablesQuery =
    "SELECT n.nspname, c.relname "
    "FROM pg_class c "
    "JOIN pg_namespace n ON n.oid = c.relnamespace "
    "WHERE c.relkind IN ('r', 'p') "
    "  AND lower(n.nspname) = lower($1) "
    "  AND lower(c.relname) = lower($2) "
    "ORDER BY (n.nspname = $1 AND c.relname = $2) DESC, n.nspname, c.relname;";

constexpr const char* kColumnsQuery =
    "SELECT "
    "    c.column_name, "
    "    c.data_type, "
    "    c.is_nullable, "
    "    c.column_default, "
    "    c.character_maximum_length, "
    "    col_description((quote_ident(c.table_schema) || '.' || quote_ident(c.table_name))::regclass, "
    "                    c.ordinal_position::int) AS comment "
    "FROM information_schema.columns c "
    "WHERE c.table_schema = $1 AND c.table_name = $2 "
    "ORDER BY c.ordinal_position;";

constexpr const char* kPrimaryKeyQuery =
    "SELECT a.attname "
    "FROM pg_index i "
    "JOIN pg_attribute a ON a.attrelid = i.indrelid AND a.attnum = ANY(i.indkey) "
    "WHERE i.indrelid = (quote_ident($1) || '.' || quote_ident($2))::regclass "
    "  AND i.indisprimary "
    "ORDER BY array_position(i.indkey::int2[], a.attnum);";

// conkey/confkey are unnested in lockstep so composite keys pair up column by column
constexpr const char* kEdgeSelect =
    "SELECT sn.nspname, sc.relname, sa.attname, "
    "       tn.nspname, tc.relname, ta.attname, con.conname "
    "FROM pg_constraint con "
    "JOIN pg_class sc ON sc.oid = con.conrelid "
    "JOIN pg_namespace sn ON sn.oid = sc.relnamespace "
    "JOIN pg_class tc ON tc.oid = con.confrelid "
    "JOIN pg_namespace tn ON tn.oid = tc.relnamespace "
    "CROSS JOIN LATERAL unnest(con.conkey, con.confkey) WITH ORDINALITY AS k(src_attnum, tgt_attnum, ord) "
    "JOIN pg_attribute sa ON sa.attrelid = con.conrelid AND sa.attnum = k.src_attnum "
    "JOIN pg_attribute ta ON ta.attrelid = con.confrelid AND ta.attnum = k.tgt_attnum "
    "WHERE con.contype = 'f' ";

const std::string kOutgoingQuery = std::string(kEdgeSelect) +
    "AND sn.nspname = $1 AND sc.relname = $2 "
    "ORDER BY con.conname, k.ord;";

const std::string kIncomingQuery = std::string(kEdgeSelect) +
    "AND tn.nspname = $1 AND tc.relname = $2 "
    "ORDER BY sn.nspname, sc.relname, con.conname, k.ord;";

constexpr const char* kIndexQuery =
    "SELECT "
    "    i.relname AS index_name, "
    "    array_agg(a.attname ORDER BY array_position(ix.indkey::int2[], a.attnum)) AS columns, "
    "    ix.indisunique AS is_unique, "
    "    am.amname AS method "
    "FROM pg_class t "
    "JOIN pg_index ix ON t.oid = ix.indrelid "
    "JOIN pg_class i ON i.oid = ix.indexrelid "
    "JOIN pg_attribute a ON a.attrelid = t.oid AND a.attnum = ANY(ix.indkey) "
    "JOIN pg_am am ON i.relam = am.oid "
    "JOIN pg_namespace n ON n.oid = t.relnamespace "
    "WHERE n.nspname = $1 AND t.relname = $2 "
    "GROUP BY i.relname, ix.indisunique, am.amname "
    "ORDER BY i.relname;";

constexpr const char* kListTablesQuery =
    "SELECT schemaname, tablename "
    "FROM pg_tables "
    "WHERE schemaname NOT IN ('information_schema', 'pg_catalog', 'pg_toast') "
    "ORDER BY schemaname, tablename;";

constexpr const char* kSearchTablesQuery =
    "SELECT schemaname, tablename "
    "FROM pg_tables "
    "WHERE schemaname NOT IN ('information_schema', 'pg_catalog', 'pg_toast') "
    "  AND (tablename ~ $1 OR schemaname ~ $1) "
    "ORDER BY "
    "  CASE "
    "    WHEN tablename = $1 THEN 1 "
    "    WHEN tablename ILIKE $1 || '%' THEN 2 "
    "    WHEN tablename ILIKE '%' || $1 || '%' THEN 3 "
    "    ELSE 4 "
    "  END, "
    "  schemaname, tablename;";

std::vector<QualifiedName> to_names(const DbResultSet& rs) {
    std::vector<QualifiedName> names;
    names.reserve(rs.rows.size());
    for (size_t row = 0; row < rs.rows.size(); ++row) {
        names.emplace_back(rs.text(row, 0), rs.text(row, 1));
    }
    return names;
}

std::vector<ForeignKeyEdge> to_edges(const DbResultSet& rs) {
    static constexpr int COL_SRC_SCHEMA = 0;
    static constexpr int COL_SRC_TABLE  = 1;
    static constexpr int COL_SRC_COLUMN = 2;
    static constexpr int COL_TGT_SCHEMA = 3;
    static constexpr int COL_TGT_TABLE  = 4;
    static constexpr int COL_TGT_COLUMN = 5;
    static constexpr int COL_CONSTRAINT = 6;

    std::vector<ForeignKeyEdge> edges;
    edges.reserve(rs.rows.size());
    for (size_t row = 0; row < rs.rows.size(); ++row) {
        ForeignKeyEdge edge;
        edge.source = QualifiedName(rs.text(row, COL_SRC_SCHEMA), rs.text(row, COL_SRC_TABLE));
        edge.source_column = rs.text(row, COL_SRC_COLUMN);
        edge.target = QualifiedName(rs.text(row, COL_TGT_SCHEMA), rs.text(row, COL_TGT_TABLE));
        edge.target_column = rs.text(row, COL_TGT_COLUMN);
        edge.constraint_name = rs.text(row, COL_CONSTRAINT);
        edges.push_back(std::move(edge));
    }
    return edges;
}

} // anonymous namespace

PgMetadataProvider::PgMetadataProvider(std::shared_ptr<IConnectionPool> pool)
    : pool_(std::move(pool)) {}

Result<DbResultSet> PgMetadataProvider::run(const std::string& what, const char* sql,
                                            const std::vector<std::string>& params) {
    auto conn = pool_->acquire();
    if (!conn) {
        return Result<DbResultSet>::error(ErrorCategory::METADATA_UNAVAILABLE,
            std::format("No connection available from pool '{}' while loading {}",
                        pool_->name(), what));
    }

    auto rs = conn->get()->execute_params(sql, params);
    if (!rs.success) {
        const auto category = (rs.sqlstate == kInvalidRegex)
            ? ErrorCategory::INVALID_REQUEST
            : ErrorCategory::METADATA_UNAVAILABLE;
        utils::log::warn(std::format("Catalog query for {} failed: {}", what,
                                     utils::trim(rs.error_message)));
        return Result<DbResultSet>::error(category,
            std::format("Failed to load {}: {}", what, utils::trim(rs.error_message)));
    }
    return Result<DbResultSet>::ok(std::move(rs));
}

Result<std::vector<QualifiedName>> PgMetadataProvider::find_tables(const QualifiedName& name) {
    auto rs = run(std::format("table {}", name.full_name()), kFindTablesQuery,
                  {name.schema, name.table});
    if (rs.is_error()) return Result<std::vector<QualifiedName>>::propagate(rs);
    return Result<std::vector<QualifiedName>>::ok(to_names(rs.value()));
}

Result<std::vector<ColumnInfo>> PgMetadataProvider::columns(const QualifiedName& name) {
    auto rs = run(std::format("columns of {}", name.full_name()), kColumnsQuery,
                  {name.schema, name.table});
    if (rs.is_error()) return Result<std::vector<ColumnInfo>>::propagate(rs);

    // Column indices in the result set (matching the SELECT order)
    static constexpr int COL_NAME       = 0;
    static constexpr int COL_DATA_TYPE  = 1;
    static constexpr int COL_NULLABLE   = 2;
    static constexpr int COL_DEFAULT    = 3;
    static constexpr int COL_MAX_LENGTH = 4;
    static constexpr int COL_COMMENT    = 5;

    const auto& set = rs.value();
    std::vector<ColumnInfo> result;
    result.reserve(set.rows.size());
    for (size_t row = 0; row < set.rows.size(); ++row) {
        ColumnInfo col;
        col.name = set.text(row, COL_NAME);
        col.type = set.text(row, COL_DATA_TYPE);
        col.nullable = (set.text(row, COL_NULLABLE) == db::kYes);
        col.default_value = set.optional_text(row, COL_DEFAULT);
        if (const auto len = set.optional_text(row, COL_MAX_LENGTH)) {
            col.max_length = utils::try_parse_int<int32_t>(*len);
        }
        col.comment = set.optional_text(row, COL_COMMENT);
        result.push_back(std::move(col));
    }
    return Result<std::vector<ColumnInfo>>::ok(std::move(result));
}

Result<PrimaryKey> PgMetadataProvider::primary_key(const QualifiedName& name) {
    auto rs = run(std::format("primary key of {}", name.full_name()), kPrimaryKeyQuery,
                  {name.schema, name.table});
    if (rs.is_error()) return Result<PrimaryKey>::propagate(rs);

    PrimaryKey pk;
    for (size_t row = 0; row < rs.value().rows.size(); ++row) {
        pk.push_back(rs.value().text(row, 0));
    }
    return Result<PrimaryKey>::ok(std::move(pk));
}

Result<std::vector<ForeignKeyEdge>> PgMetadataProvider::outgoing_edges(const QualifiedName& name) {
    auto rs = run(std::format("foreign keys of {}", name.full_name()), kOutgoingQuery.c_str(),
                  {name.schema, name.table});
    if (rs.is_error()) return Result<std::vector<ForeignKeyEdge>>::propagate(rs);
    return Result<std::vector<ForeignKeyEdge>>::ok(to_edges(rs.value()));
}

Result<std::vector<IncomingForeignKey>> PgMetadataProvider::incoming_edges(const QualifiedName& name) {
    auto rs = run(std::format("references to {}", name.full_name()), kIncomingQuery.c_str(),
                  {name.schema, name.table});
    if (rs.is_error()) return Result<std::vector<IncomingForeignKey>>::propagate(rs);

    std::vector<IncomingForeignKey> result;
    for (auto& edge : to_edges(rs.value())) {
        IncomingForeignKey in;
        in.from_table = std::move(edge.source);
        in.from_column = std::move(edge.source_column);
        in.to_column = std::move(edge.target_column);
        in.constraint_name = std::move(edge.constraint_name);
        result.push_back(std::move(in));
    }
    return Result<std::vector<IncomingForeignKey>>::ok(std::move(result));
}

Result<std::vector<IndexDescriptor>> PgMetadataProvider::indexes(const QualifiedName& name) {
    auto rs = run(std::format("indexes of {}", name.full_name()), kIndexQuery,
                  {name.schema, name.table});
    if (rs.is_error()) return Result<std::vector<IndexDescriptor>>::propagate(rs);

    const auto& set = rs.value();
    std::vector<IndexDescriptor> result;
    result.reserve(set.rows.size());
    for (size_t row = 0; row < set.rows.size(); ++row) {
        IndexDescriptor idx;
        idx.name = set.text(row, 0);
        idx.columns = parse_text_array(set.text(row, 1));
        idx.unique = (set.text(row, 2) == db::kTrue);
        idx.access_method = set.text(row, 3);
        result.push_back(std::move(idx));
    }
    return Result<std::vector<IndexDescriptor>>::ok(std::move(result));
}

Result<std::vector<QualifiedName>> PgMetadataProvider::list_tables() {
    auto rs = run("table list", kListTablesQuery, {});
    if (rs.is_error()) return Result<std::vector<QualifiedName>>::propagate(rs);
    return Result<std::vector<QualifiedName>>::ok(to_names(rs.value()));
}

Result<std::vector<QualifiedName>> PgMetadataProvider::search_tables(const std::string& pattern) {
    auto rs = run(std::format("tables matching '{}'", pattern), kSearchTablesQuery, {pattern});
    if (rs.is_error()) return Result<std::vector<QualifiedName>>::propagate(rs);
    return Result<std::vector<QualifiedName>>::ok(to_names(rs.value()));
}

std::vector<std::string> PgMetadataProvider::parse_text_array(const std::string& literal) {
    std::vector<std::string> items;
    if (literal.size() < 2 || literal.front() != '{' || literal.back() != '}') {
        return items;
    }

    std::string current;
    bool in_quotes = false;
    bool has_item = false;
    for (size_t i = 1; i + 1 < literal.size(); ++i) {
        const char c = literal[i];
        if (in_quotes) {
            if (c == '\\' && i + 2 < literal.size()) {
                current += literal[++i];
            } else if (c == '"') {
                in_quotes = false;
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
            has_item = true;
        } else if (c == ',') {
            items.push_back(utils::trim(current));
            current.clear();
            has_item = false;
        } else {
            current += c;
            has_item = true;
        }
    }
    if (has_item || !current.empty() || !items.empty()) {
        items.push_back(utils::trim(current));
    }
    return items;
}

} // namespace joinscout
