#include "analyzer/join_inference_engine.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <future>
#include <optional>
#include <unordered_set>

namespace joinscout {

namespace {

constexpr int kExactAliasScore = 100;
constexpr int kForeignKeyScore = 95;
constexpr int kSharedAliasScore = 90;
constexpr int kSharedScore = 85;

constexpr std::string_view kLeftJoin = "LEFT JOIN";
constexpr std::string_view kInnerJoin = "INNER JOIN";

bool blank(const std::string& s) {
    return utils::trim(s).empty();
}

} // anonymous namespace

JoinInferenceEngine::JoinInferenceEngine(std::shared_ptr<const SchemaInspector> inspector,
                                         InferenceConfig config)
    : inspector_(std::move(inspector)),
      graph_(*inspector_),
      config_(config) {}

// ============================================================================
// Rendering
// ============================================================================

std::string JoinInferenceEngine::render_table(const QualifiedName& name,
                                              const std::string& alias) const {
    std::string rendered = inspector_->display_name(name);
    if (alias != name.table) {
        rendered += ' ';
        rendered += alias;
    }
    return rendered;
}

void JoinInferenceEngine::emit(std::vector<JoinSuggestion>& out, std::string expression,
                               std::string description, int score) const {
    const bool promote = score >= config_.inner_join_threshold;

    std::string inner_expression;
    std::string inner_description;
    if (promote) {
        inner_expression = utils::replace_first(expression, kLeftJoin, kInnerJoin);
        inner_description = utils::replace_first(description, "Left join", "Inner join");
    }

    out.emplace_back(JoinKind::LEFT, std::move(expression), std::move(description), score);
    if (promote) {
        out.emplace_back(JoinKind::INNER, std::move(inner_expression),
                         std::move(inner_description), score + config_.inner_join_bonus);
    }
}

// ============================================================================
// Pairwise inference
// ============================================================================

std::vector<JoinSuggestion> JoinInferenceEngine::infer_pair(const TableRef& left,
                                                            const TableRef& right,
                                                            const PairEdges& edges) const {
    std::vector<JoinSuggestion> out;
    const std::string& left_name = edges.left.table;
    const std::string& right_name = edges.right.table;

    // left -> right: bring in the new table
    for (const auto& edge : edges.direct()) {
        const int score = utils::contains(edge.source_column, right.alias)
            ? kExactAliasScore : kForeignKeyScore;
        emit(out,
             std::format("{} {} ON {}.{} = {}.{}", kLeftJoin,
                         render_table(edges.right, right.alias),
                         left.alias, edge.source_column, right.alias, edge.target_column),
             std::format("Direct foreign key relationship from {} to {} (FK: {})",
                         left_name, right_name, edge.constraint_name),
             score);
    }

    // right -> left: the new table references an existing one
    for (const auto& edge : edges.reverse()) {
        const int score = utils::contains(edge.source_column, left.alias)
            ? kExactAliasScore : kForeignKeyScore;
        emit(out,
             std::format("{} {} ON {}.{} = {}.{}", kLeftJoin,
                         render_table(edges.left, left.alias),
                         right.alias, edge.source_column, left.alias, edge.target_column),
             std::format("Reverse foreign key relationship from {} to {} (FK: {})",
                         right_name, left_name, edge.constraint_name),
             score);
    }

    // left -> X.c <- right
    for (const auto& ref : edges.shared()) {
        const bool embeds = utils::contains(ref.left.source_column, left.alias) ||
                            utils::contains(ref.right.source_column, right.alias);
        const int score = std::max(embeds ? kSharedAliasScore : 0, kSharedScore);
        emit(out,
             std::format("{} {} ON {}.{} = {}.{}", kLeftJoin,
                         render_table(edges.right, right.alias),
                         left.alias, ref.left.source_column, right.alias, ref.right.source_column),
             std::format("Join through shared reference to {} (FK: {}, {})",
                         ref.left.target.table,
                         ref.left.constraint_name, ref.right.constraint_name),
             score);
    }

    return out;
}

std::vector<JoinSuggestion> JoinInferenceEngine::rank(std::vector<JoinSuggestion> candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const JoinSuggestion& a, const JoinSuggestion& b) {
            return a.score > b.score;
        });

    std::vector<JoinSuggestion> ranked;
    ranked.reserve(candidates.size());
    std::unordered_set<std::string> seen;
    for (auto& candidate : candidates) {
        if (seen.insert(candidate.expression).second) {
            ranked.push_back(std::move(candidate));
        }
    }
    return ranked;
}

// ============================================================================
// Request entry point
// ============================================================================

Result<PairEdges> JoinInferenceEngine::load_pair(const TableRef& existing,
                                                 const QualifiedName& new_name) const {
    auto resolved = graph_.require_table(existing.table_name);
    if (resolved.is_error()) {
        return Result<PairEdges>::propagate(resolved);
    }
    return graph_.edges_between(resolved.value(), new_name);
}

Result<std::vector<JoinSuggestion>> JoinInferenceEngine::suggest_joins(
    const std::vector<TableRef>& existing,
    const TableRef& new_table,
    const CancellationToken* cancel) const {

    using R = Result<std::vector<JoinSuggestion>>;
    utils::Timer timer;

    if (blank(new_table.table_name) || blank(new_table.alias)) {
        return R::error(ErrorCategory::INVALID_REQUEST,
            "New table requires a non-empty name and alias");
    }
    for (const auto& ref : existing) {
        if (blank(ref.table_name) || blank(ref.alias)) {
            return R::error(ErrorCategory::INVALID_REQUEST,
                "Existing tables require a non-empty name and alias");
        }
    }

    std::optional<CancellationToken> deadline;
    if (config_.request_timeout.count() > 0) {
        deadline.emplace(config_.request_timeout);
    }
    const auto cancelled = [&] {
        return (cancel && cancel->is_cancelled()) || (deadline && deadline->is_cancelled());
    };

    auto new_name = graph_.require_table(new_table.table_name);
    if (new_name.is_error()) {
        return R::propagate(new_name);
    }
    if (existing.empty()) {
        return R::ok({});
    }

    std::vector<std::optional<Result<PairEdges>>> pairs(existing.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};

    // Indices are claimed in input order, so every pair ahead of a failure still loads
    const auto load_pairs = [&] {
        while (!failed.load(std::memory_order_acquire) && !cancelled()) {
            const size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= existing.size()) return;
            pairs[i] = load_pair(existing[i], new_name.value());
            if (pairs[i]->is_error()) {
                failed.store(true, std::memory_order_release);
            }
        }
    };

    const size_t workers = config_.concurrent_pair_lookups
        ? std::min(config_.max_concurrent_pairs, existing.size())
        : 1;

    if (workers > 1) {
        std::vector<std::future<void>> futures;
        futures.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            futures.push_back(std::async(std::launch::async, load_pairs));
        }
        // Wait for every worker before deciding anything
        for (auto& f : futures) {
            f.get();
        }
    } else {
        load_pairs();
    }

    if (cancelled()) {
        return R::error(ErrorCategory::CANCELLED, "Join suggestion request cancelled");
    }

    // First failure in input order wins
    for (const auto& pair : pairs) {
        if (pair && pair->is_error()) {
            return R::propagate(*pair);
        }
    }

    std::vector<JoinSuggestion> candidates;
    for (size_t i = 0; i < pairs.size(); ++i) {
        auto found = infer_pair(existing[i], new_table, pairs[i]->value());
        if (utils::log::enabled(utils::log::Level::DEBUG)) {
            utils::log::debug(std::format("join pair {} -> {}: {} candidates",
                existing[i].table_name, new_table.table_name, found.size()));
        }
        candidates.insert(candidates.end(),
                          std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }

    auto ranked = rank(std::move(candidates));
    if (utils::log::enabled(utils::log::Level::DEBUG)) {
        utils::log::debug(std::format("suggest_joins {}: {} suggestions from {} tables in {}ms",
            new_table.table_name, ranked.size(), existing.size(), timer.elapsed_ms().count()));
    }
    return R::ok(std::move(ranked));
}

} // namespace joinscout
