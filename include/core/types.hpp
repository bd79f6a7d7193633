#pragma once

#include "core/column_type.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>

namespace joinscout {

// ============================================================================
// Table Identity
// ============================================================================

/**
 * @brief Resolved (schema, table) key used for every metadata lookup
 */
struct QualifiedName {
    std::string schema;
    std::string table;

    QualifiedName() = default;
    QualifiedName(std::string s, std::string t) : schema(std::move(s)), table(std::move(t)) {}

    std::string full_name() const {
        return schema.empty() ? table : (schema + "." + table);
    }

    bool operator==(const QualifiedName& other) const = default;
};

/**
 * @brief A table as used in a query: possibly qualified name plus alias
 */
struct TableRef {
    std::string table_name;     // "table" or "schema.table"
    std::string alias;

    TableRef() = default;
    TableRef(std::string t, std::string a) : table_name(std::move(t)), alias(std::move(a)) {}
};

// ============================================================================
// Schema Model
// ============================================================================

struct ColumnInfo {
    std::string name;
    std::string type;           // information_schema data_type
    bool nullable = true;
    std::optional<std::string> default_value;
    std::optional<int32_t> max_length;
    std::optional<std::string> comment;

    TypeClass type_class() const { return classify_type(type); }
};

// Ordered by declaration; empty means the table has no primary key
using PrimaryKey = std::vector<std::string>;

/**
 * @brief Directional reference source.column -> target.column
 *
 * Composite keys arrive as one edge per column pair sharing a constraint name.
 */
struct ForeignKeyEdge {
    QualifiedName source;
    std::string source_column;
    QualifiedName target;
    std::string target_column;
    std::string constraint_name;
};

/**
 * @brief Incoming reference as seen from the referenced table
 */
struct IncomingForeignKey {
    QualifiedName from_table;
    std::string from_column;
    std::string to_column;
    std::string constraint_name;
};

struct IndexDescriptor {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
    std::string access_method;  // btree, hash, gin, ...
};

/**
 * @brief Full metadata for one table, assembled per call
 */
struct TableSnapshot {
    QualifiedName name;
    std::vector<ColumnInfo> columns;
    PrimaryKey primary_key;
    std::vector<ForeignKeyEdge> outgoing;
    std::vector<IncomingForeignKey> incoming;
    std::vector<IndexDescriptor> indexes;

    bool is_primary_key_column(std::string_view column_name) const {
        for (const auto& pk : primary_key) {
            if (pk == column_name) return true;
        }
        return false;
    }

    // Bare table name in the default schema, "schema.table" elsewhere
    std::string display_name(std::string_view default_schema) const {
        return name.schema == default_schema ? name.table : name.full_name();
    }
};

// ============================================================================
// Join Suggestions
// ============================================================================

enum class JoinKind {
    INNER,
    LEFT
};

inline const char* join_kind_to_string(JoinKind kind) {
    switch (kind) {
        case JoinKind::INNER: return "INNER JOIN";
        case JoinKind::LEFT: return "LEFT JOIN";
        default: return "UNKNOWN";
    }
}

struct JoinSuggestion {
    JoinKind kind = JoinKind::LEFT;
    std::string expression;     // "LEFT JOIN orders o ON oi.order_id = o.id"
    std::string description;
    int score = 0;

    JoinSuggestion() = default;
    JoinSuggestion(JoinKind k, std::string expr, std::string desc, int s)
        : kind(k), expression(std::move(expr)), description(std::move(desc)), score(s) {}
};

} // namespace joinscout
