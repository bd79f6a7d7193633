#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "schema/schema_inspector.hpp"
#include <string>
#include <vector>

namespace joinscout {

/**
 * @brief Two foreign keys pointing at the same (schema, table, column)
 */
struct SharedReference {
    ForeignKeyEdge left;
    ForeignKeyEdge right;
};

/**
 * @brief Complete outgoing edge sets of two tables
 *
 * Both sets are unrestricted: shared references need each table's
 * entire outgoing set, not just the edges between the pair.
 */
struct PairEdges {
    QualifiedName left;
    QualifiedName right;
    std::vector<ForeignKeyEdge> left_edges;
    std::vector<ForeignKeyEdge> right_edges;

    // left -> right
    [[nodiscard]] std::vector<ForeignKeyEdge> direct() const;

    // right -> left
    [[nodiscard]] std::vector<ForeignKeyEdge> reverse() const;

    // left -> X.c <- right, in left-edge-major order
    [[nodiscard]] std::vector<SharedReference> shared() const;
};

/**
 * @brief Read-only projection of the foreign-key graph over a pair of tables
 *
 * Issues one table-resolution query and one outgoing-edge query per table;
 * the cost is independent of schema size. Nothing is indexed or cached.
 */
class ForeignKeyGraphView {
public:
    explicit ForeignKeyGraphView(const SchemaInspector& inspector);

    /**
     * @brief Resolve an identifier, treating absence as an error
     * @return TABLE_NOT_FOUND if no such table exists
     */
    [[nodiscard]] Result<QualifiedName> require_table(const std::string& identifier) const;

    /**
     * @brief Fetch the full outgoing edge sets of two resolved tables
     */
    [[nodiscard]] Result<PairEdges> edges_between(const QualifiedName& left,
                                                  const QualifiedName& right) const;

    /**
     * @brief Resolve both tables, then fetch their edge sets
     */
    [[nodiscard]] Result<PairEdges> edges_between(const TableRef& left, const TableRef& right) const;

private:
    const SchemaInspector& inspector_;
};

} // namespace joinscout
