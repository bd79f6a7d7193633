#pragma once

#include "db/imetadata_provider.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <string>
#include <vector>

namespace joinscout {

/**
 * @brief PostgreSQL metadata provider
 *
 * Answers catalog point queries from information_schema and pg_catalog.
 * Each logical query borrows one pooled connection and returns it on
 * every exit path; no transaction spans two queries.
 */
class PgMetadataProvider : public IMetadataProvider {
public:
    /**
     * @param pool Injected pool (shared with other consumers of the same database)
     */
    explicit PgMetadataProvider(std::shared_ptr<IConnectionPool> pool);

    Result<std::vector<QualifiedName>> find_tables(const QualifiedName& name) override;
    Result<std::vector<ColumnInfo>> columns(const QualifiedName& name) override;
    Result<PrimaryKey> primary_key(const QualifiedName& name) override;
    Result<std::vector<ForeignKeyEdge>> outgoing_edges(const QualifiedName& name) override;
    Result<std::vector<IncomingForeignKey>> incoming_edges(const QualifiedName& name) override;
    Result<std::vector<IndexDescriptor>> indexes(const QualifiedName& name) override;
    Result<std::vector<QualifiedName>> list_tables() override;
    Result<std::vector<QualifiedName>> search_tables(const std::string& pattern) override;

    /**
     * @brief Parse a PostgreSQL array literal ("{a,b}", "{\"Mixed Case\",c}")
     */
    [[nodiscard]] static std::vector<std::string> parse_text_array(const std::string& literal);

private:
    /**
     * @brief Run one catalog query on a borrowed connection
     * @param what Short label used in error messages ("columns of public.users")
     */
    Result<DbResultSet> run(const std::string& what, const char* sql,
                            const std::vector<std::string>& params);

    std::shared_ptr<IConnectionPool> pool_;
};

} // namespace joinscout
