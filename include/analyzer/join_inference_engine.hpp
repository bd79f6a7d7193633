#pragma once

#include "core/cancellation.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "schema/foreign_key_graph.hpp"
#include "schema/schema_inspector.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace joinscout {

struct InferenceConfig {
    bool concurrent_pair_lookups = true;
    // Worker cap for concurrent lookups; keep it at or below the pool size
    size_t max_concurrent_pairs = 5;
    std::chrono::milliseconds request_timeout{0};   // 0 = unbounded
    int inner_join_threshold = 90;
    int inner_join_bonus = 5;
};

/**
 * @brief Proposes JOIN clauses for bringing a new table into a query
 *
 * For every table already in the query, the foreign-key graph between it
 * and the new table is inspected for three shapes:
 *
 *   direct     existing -> new          95, or 100 if the FK column embeds the new alias
 *   reverse    new -> existing          95, or 100 if the FK column embeds the existing alias
 *   shared     existing -> X <- new     85, or 90 if either FK column embeds its own alias
 *
 * Every LEFT JOIN at or above inner_join_threshold also gets an INNER JOIN
 * twin scored inner_join_bonus higher. Candidates from all pairs are merged,
 * deduplicated by expression text (highest score wins) and returned best first.
 *
 * Pair lookups may run on up to max_concurrent_pairs workers. Each worker
 * holds at most one pooled connection at a time, so a cap no larger than the
 * pool never waits on an acquire. Ranking only starts once every pair has
 * returned, so the result never depends on completion order.
 */
class JoinInferenceEngine {
public:
    explicit JoinInferenceEngine(std::shared_ptr<const SchemaInspector> inspector,
                                 InferenceConfig config = {});

    /**
     * @brief Suggest joins for `new_table` against every table in `existing`
     *
     * An empty `existing` list yields an empty result. Errors:
     * INVALID_REQUEST for empty identifiers or aliases, TABLE_NOT_FOUND /
     * AMBIGUOUS_IDENTIFIER for unresolvable tables, METADATA_UNAVAILABLE when the
     * provider fails, CANCELLED when `cancel` fires or the request timeout expires.
     */
    [[nodiscard]] Result<std::vector<JoinSuggestion>> suggest_joins(
        const std::vector<TableRef>& existing,
        const TableRef& new_table,
        const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Candidates for one (existing, new) pair, unranked
     *
     * Pure: needs only the pair's edge sets. `left` and `right` carry the
     * aliases; their table names come from `edges`.
     */
    [[nodiscard]] std::vector<JoinSuggestion> infer_pair(const TableRef& left,
                                                         const TableRef& right,
                                                         const PairEdges& edges) const;

    /**
     * @brief Stable sort by descending score, then drop repeated expressions
     */
    [[nodiscard]] static std::vector<JoinSuggestion> rank(std::vector<JoinSuggestion> candidates);

    [[nodiscard]] const InferenceConfig& config() const { return config_; }

private:
    /**
     * @brief "schema.table alias", omitting the default schema and a redundant alias
     */
    std::string render_table(const QualifiedName& name, const std::string& alias) const;

    void emit(std::vector<JoinSuggestion>& out, std::string expression,
              std::string description, int score) const;

    Result<PairEdges> load_pair(const TableRef& existing, const QualifiedName& new_name) const;

    std::shared_ptr<const SchemaInspector> inspector_;
    ForeignKeyGraphView graph_;
    InferenceConfig config_;
};

} // namespace joinscout
