#pragma once

#include "analyzer/join_inference_engine.hpp"
#include "db/iconnection_pool.hpp"

#include <toml++/toml.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace joinscout {

// ============================================================================
// Database Config
// ============================================================================

struct DatabaseConfig {
    // Either a full libpq connection string / URI...
    std::string connection_string;

    // ...or discrete fields composed into one
    std::string host;
    int port = 5432;
    std::string dbname;
    std::string user;
    std::string password;
    std::string sslmode;

    std::string application_name = "joinscout-readonly";
    std::string default_schema = "public";
    std::chrono::milliseconds statement_timeout{0};

    /**
     * @brief libpq conninfo for this database
     *
     * connection_string verbatim when set, otherwise "key='value'" pairs
     * built from the discrete fields that are present.
     */
    [[nodiscard]] std::string conninfo() const;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    DatabaseConfig database;
    PoolConfig pool;                                    // connection_string left empty
    std::chrono::milliseconds connection_timeout{2000};
    InferenceConfig inference;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads joinscout.toml
 *
 * String values may reference environment variables as ${NAME} (unset
 * variables expand to ""). A top-level `include` (string or array of
 * strings) pulls in other files relative to the including file; the
 * including file wins on conflicts.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file, resolving includes
     * @param config_path Path to joinscout.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from a TOML string (includes are not resolved)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every problem with a parsed config, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static AppConfig extract_all_sections(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static void extract_pool(const toml::table& root, AppConfig& config);
    static InferenceConfig extract_inference(const toml::table& root, size_t pool_size);
    static LoggingConfig extract_logging(const toml::table& root);

    static LoadResult validate_and_return(AppConfig config);
};

} // namespace joinscout
