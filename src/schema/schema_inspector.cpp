#include "schema/schema_inspector.hpp"
#include "db/schema_constants.hpp"
#include "core/utils.hpp"
#include <format>

namespace joinscout {

QualifiedName parse_qualified_name(std::string_view identifier, std::string_view default_schema) {
    const auto dot = identifier.find(db::kSchemaSeparator);
    if (dot == std::string_view::npos) {
        return QualifiedName(std::string(default_schema), std::string(identifier));
    }

    std::string schema(identifier.substr(0, dot));
    if (schema.empty()) {
        schema = default_schema;
    }
    return QualifiedName(std::move(schema), std::string(identifier.substr(dot + 1)));
}

SchemaInspector::SchemaInspector(std::shared_ptr<IMetadataProvider> provider,
                                 std::string default_schema)
    : provider_(std::move(provider)), default_schema_(std::move(default_schema)) {}

Result<std::optional<QualifiedName>> SchemaInspector::resolve(const std::string& identifier) const {
    using R = Result<std::optional<QualifiedName>>;

    const std::string trimmed = utils::trim(identifier);
    if (trimmed.empty()) {
        return R::error(ErrorCategory::INVALID_REQUEST, "Table identifier must not be empty");
    }

    const QualifiedName name = parse_qualified_name(trimmed, default_schema_);
    if (name.table.empty()) {
        return R::error(ErrorCategory::INVALID_REQUEST,
            std::format("Table identifier '{}' has no table part", identifier));
    }

    auto candidates = provider_->find_tables(name);
    if (candidates.is_error()) {
        return R::propagate(candidates);
    }

    const auto& found = candidates.value();
    if (found.empty()) {
        return R::ok(std::nullopt);
    }
    // Provider orders an exact-case match first
    if (found.front() == name || found.size() == 1) {
        return R::ok(found.front());
    }

    std::string listing;
    for (const auto& candidate : found) {
        if (!listing.empty()) listing += ", ";
        listing += candidate.full_name();
    }
    return R::error(ErrorCategory::AMBIGUOUS_IDENTIFIER,
        std::format("Table identifier '{}' matches more than one table: {}", identifier, listing));
}

Result<std::optional<TableSnapshot>> SchemaInspector::snapshot(const std::string& identifier) const {
    using R = Result<std::optional<TableSnapshot>>;

    auto resolved = resolve(identifier);
    if (resolved.is_error()) return R::propagate(resolved);
    if (!resolved.value()) return R::ok(std::nullopt);

    const QualifiedName& name = *resolved.value();
    TableSnapshot snap;
    snap.name = name;

    auto columns = provider_->columns(name);
    if (columns.is_error()) return R::propagate(columns);
    snap.columns = std::move(columns.value());

    auto pk = provider_->primary_key(name);
    if (pk.is_error()) return R::propagate(pk);
    snap.primary_key = std::move(pk.value());

    auto outgoing = provider_->outgoing_edges(name);
    if (outgoing.is_error()) return R::propagate(outgoing);
    snap.outgoing = std::move(outgoing.value());

    auto incoming = provider_->incoming_edges(name);
    if (incoming.is_error()) return R::propagate(incoming);
    snap.incoming = std::move(incoming.value());

    auto indexes = provider_->indexes(name);
    if (indexes.is_error()) return R::propagate(indexes);
    snap.indexes = std::move(indexes.value());

    utils::log::debug(std::format("Snapshot of {}: {} columns, {} outgoing, {} incoming, {} indexes",
        name.full_name(), snap.columns.size(), snap.outgoing.size(),
        snap.incoming.size(), snap.indexes.size()));

    return R::ok(std::move(snap));
}

Result<std::vector<std::string>> SchemaInspector::list_tables() const {
    auto tables = provider_->list_tables();
    if (tables.is_error()) return Result<std::vector<std::string>>::propagate(tables);

    std::vector<std::string> names;
    names.reserve(tables.value().size());
    for (const auto& t : tables.value()) {
        names.push_back(display_name(t));
    }
    return Result<std::vector<std::string>>::ok(std::move(names));
}

Result<std::vector<std::string>> SchemaInspector::search_tables(const std::string& pattern) const {
    if (pattern.empty()) {
        return Result<std::vector<std::string>>::error(ErrorCategory::INVALID_REQUEST,
            "Search pattern must not be empty");
    }

    auto tables = provider_->search_tables(pattern);
    if (tables.is_error()) return Result<std::vector<std::string>>::propagate(tables);

    std::vector<std::string> names;
    names.reserve(tables.value().size());
    for (const auto& t : tables.value()) {
        names.push_back(display_name(t));
    }
    return Result<std::vector<std::string>>::ok(std::move(names));
}

std::string SchemaInspector::display_name(const QualifiedName& name) const {
    return name.schema == default_schema_ ? name.table : name.full_name();
}

} // namespace joinscout
