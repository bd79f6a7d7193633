#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/imetadata_provider.hpp"
#include "db/schema_constants.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace joinscout {

/**
 * @brief Split "schema.table" on the first separator
 *
 * A bare name (or an empty schema part, as in ".orders") gets the default schema.
 * The table part is returned as-is and may be empty; callers validate it.
 */
[[nodiscard]] QualifiedName parse_qualified_name(std::string_view identifier,
                                                 std::string_view default_schema);

/**
 * @brief Builds per-call TableSnapshots from a metadata provider
 *
 * Holds no cached state: every call goes back to the provider, so a
 * snapshot always reflects the catalog at the time of the call. Safe to
 * share between threads as long as the provider is.
 *
 * "Not found" is a legitimate answer, reported as an empty optional;
 * only provider failures and ambiguous identifiers are errors.
 */
class SchemaInspector {
public:
    explicit SchemaInspector(std::shared_ptr<IMetadataProvider> provider,
                             std::string default_schema = std::string(db::kDefaultSchema));

    /**
     * @brief Resolve an identifier to exactly one real table
     * @return nullopt if no table matches
     */
    [[nodiscard]] Result<std::optional<QualifiedName>> resolve(const std::string& identifier) const;

    /**
     * @brief Assemble columns, primary key, foreign keys and indexes of a table
     * @return nullopt if the table does not exist; never a partial snapshot
     */
    [[nodiscard]] Result<std::optional<TableSnapshot>> snapshot(const std::string& identifier) const;

    /**
     * @brief All user tables, bare in the default schema and qualified elsewhere
     */
    [[nodiscard]] Result<std::vector<std::string>> list_tables() const;

    /**
     * @brief Tables whose name or schema matches a regular expression
     */
    [[nodiscard]] Result<std::vector<std::string>> search_tables(const std::string& pattern) const;

    [[nodiscard]] const std::string& default_schema() const { return default_schema_; }

    [[nodiscard]] IMetadataProvider& provider() const { return *provider_; }

    /**
     * @brief Render a name for display relative to the default schema
     */
    [[nodiscard]] std::string display_name(const QualifiedName& name) const;

private:
    std::shared_ptr<IMetadataProvider> provider_;
    std::string default_schema_;
};

} // namespace joinscout
