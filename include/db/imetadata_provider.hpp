#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <string>
#include <vector>

namespace joinscout {

/**
 * @brief Point queries about one table's catalog metadata
 *
 * All lookups are keyed by an already-resolved (schema, table) pair.
 * Implementations perform reads only. Any failure to reach the catalog
 * (pool exhaustion, connectivity, permissions, timeouts) is reported as
 * ErrorCategory::METADATA_UNAVAILABLE. A malformed search pattern is
 * ErrorCategory::INVALID_REQUEST.
 *
 * Implementations must be safe to call from several threads at once.
 */
class IMetadataProvider {
public:
    virtual ~IMetadataProvider() = default;

    /**
     * @brief Base tables whose schema and name match case-insensitively
     *
     * Exact-case matches come first. More than one row without an exact
     * match means the identifier is ambiguous.
     */
    [[nodiscard]] virtual Result<std::vector<QualifiedName>> find_tables(
        const QualifiedName& name) = 0;

    [[nodiscard]] virtual Result<std::vector<ColumnInfo>> columns(const QualifiedName& name) = 0;

    /**
     * @brief Primary-key columns in declaration order (empty = none)
     */
    [[nodiscard]] virtual Result<PrimaryKey> primary_key(const QualifiedName& name) = 0;

    /**
     * @brief Foreign keys declared on this table
     */
    [[nodiscard]] virtual Result<std::vector<ForeignKeyEdge>> outgoing_edges(
        const QualifiedName& name) = 0;

    /**
     * @brief Foreign keys on other tables that reference this table
     */
    [[nodiscard]] virtual Result<std::vector<IncomingForeignKey>> incoming_edges(
        const QualifiedName& name) = 0;

    [[nodiscard]] virtual Result<std::vector<IndexDescriptor>> indexes(
        const QualifiedName& name) = 0;

    /**
     * @brief All user tables, ordered by schema then table name
     */
    [[nodiscard]] virtual Result<std::vector<QualifiedName>> list_tables() = 0;

    /**
     * @brief Tables whose name or schema matches a regular expression,
     *        best matches first
     */
    [[nodiscard]] virtual Result<std::vector<QualifiedName>> search_tables(
        const std::string& pattern) = 0;
};

} // namespace joinscout
