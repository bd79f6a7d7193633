#include "schema/foreign_key_graph.hpp"
#include <format>

namespace joinscout {

// ============================================================================
// Relationship shapes
// ============================================================================

std::vector<ForeignKeyEdge> PairEdges::direct() const {
    std::vector<ForeignKeyEdge> result;
    for (const auto& edge : left_edges) {
        if (edge.target == right) {
            result.push_back(edge);
        }
    }
    return result;
}

std::vector<ForeignKeyEdge> PairEdges::reverse() const {
    std::vector<ForeignKeyEdge> result;
    for (const auto& edge : right_edges) {
        if (edge.target == left) {
            result.push_back(edge);
        }
    }
    return result;
}

std::vector<SharedReference> PairEdges::shared() const {
    std::vector<SharedReference> result;
    for (const auto& l : left_edges) {
        for (const auto& r : right_edges) {
            if (l.target == r.target && l.target_column == r.target_column) {
                result.push_back({l, r});
            }
        }
    }
    return result;
}

// ============================================================================
// ForeignKeyGraphView
// ============================================================================

ForeignKeyGraphView::ForeignKeyGraphView(const SchemaInspector& inspector)
    : inspector_(inspector) {}

Result<QualifiedName> ForeignKeyGraphView::require_table(const std::string& identifier) const {
    auto resolved = inspector_.resolve(identifier);
    if (resolved.is_error()) {
        return Result<QualifiedName>::propagate(resolved);
    }
    if (!resolved.value()) {
        return Result<QualifiedName>::error(ErrorCategory::TABLE_NOT_FOUND,
            std::format("Table '{}' not found", identifier));
    }
    return Result<QualifiedName>::ok(*resolved.value());
}

Result<PairEdges> ForeignKeyGraphView::edges_between(const QualifiedName& left,
                                                     const QualifiedName& right) const {
    auto& provider = inspector_.provider();

    auto left_edges = provider.outgoing_edges(left);
    if (left_edges.is_error()) return Result<PairEdges>::propagate(left_edges);

    auto right_edges = provider.outgoing_edges(right);
    if (right_edges.is_error()) return Result<PairEdges>::propagate(right_edges);

    PairEdges pair;
    pair.left = left;
    pair.right = right;
    pair.left_edges = std::move(left_edges.value());
    pair.right_edges = std::move(right_edges.value());
    return Result<PairEdges>::ok(std::move(pair));
}

Result<PairEdges> ForeignKeyGraphView::edges_between(const TableRef& left,
                                                     const TableRef& right) const {
    auto l = require_table(left.table_name);
    if (l.is_error()) return Result<PairEdges>::propagate(l);

    auto r = require_table(right.table_name);
    if (r.is_error()) return Result<PairEdges>::propagate(r);

    return edges_between(l.value(), r.value());
}

} // namespace joinscout
