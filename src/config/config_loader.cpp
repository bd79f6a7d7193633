#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace joinscout {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (input.compare(i, 2, "${") == 0) {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// Walks tables and arrays alike; only string leaves change
void expand_env_vars_in(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto& [key, val] : *tbl) {
            expand_env_vars_in(val);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in(elem);
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        auto* existing = base.get(key);
        if (existing && existing->is_table() && val.is_table()) {
            merge_tables(*existing->as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}", kMaxIncludeDepth));
    }

    std::vector<std::string> paths;
    if (const auto* single = root["include"].as_string()) {
        paths.emplace_back(single->get());
    } else if (const auto* many = root["include"].as_array()) {
        for (const auto& item : *many) {
            if (const auto* s = item.as_string()) {
                paths.emplace_back(s->get());
            }
        }
    }
    if (paths.empty()) return;
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const fs::path abs_path = fs::canonical(base_dir / rel_path);

        if (!visited.insert(abs_path.string()).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path.string()));
        }

        auto included = toml::parse_file(abs_path.string());
        resolve_includes(included, abs_path.parent_path(), visited, depth + 1);

        // Included file is the base; the including file overrides it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path(), visited, 0);

    expand_env_vars_in(result);
    return result;
}

// Single-quoted conninfo value: backslash and quote are escaped
std::string quote_conninfo_value(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\\' || c == '\'') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

} // anonymous namespace

std::string DatabaseConfig::conninfo() const {
    if (!connection_string.empty()) {
        return connection_string;
    }

    std::string result;
    const auto append = [&result](std::string_view key, const std::string& value) {
        if (value.empty()) return;
        if (!result.empty()) result += ' ';
        result += key;
        result += '=';
        result += quote_conninfo_value(value);
    };

    append("host", host);
    append("port", host.empty() ? ""s : std::to_string(port));
    append("dbname", dbname);
    append("user", user);
    append("password", password);
    append("sslmode", sslmode);
    return result;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.host = d["host"].value_or(""s);
    cfg.port = d["port"].value_or(5432);
    cfg.dbname = d["dbname"].value_or(""s);
    cfg.user = d["user"].value_or(""s);
    cfg.password = d["password"].value_or(""s);
    cfg.sslmode = d["sslmode"].value_or(""s);
    cfg.application_name = d["application_name"].value_or(cfg.application_name);
    cfg.default_schema = d["default_schema"].value_or(cfg.default_schema);
    cfg.statement_timeout = std::chrono::milliseconds(d["statement_timeout_ms"].value_or(int64_t{0}));
    return cfg;
}

void ConfigLoader::extract_pool(const toml::table& root, AppConfig& config) {
    const auto* pool = root["pool"].as_table();
    if (!pool) return;
    const auto& p = *pool;
    auto& cfg = config.pool;

    // Negative counts would wrap; clamp so validation sees 0
    const auto count = [](int64_t v) { return static_cast<size_t>(v < 0 ? 0 : v); };

    cfg.min_connections = count(p["min_connections"].value_or(int64_t{0}));
    cfg.max_connections = count(p["max_connections"].value_or(int64_t{5}));
    cfg.acquire_timeout = std::chrono::milliseconds(p["acquire_timeout_ms"].value_or(int64_t{2000}));
    cfg.idle_timeout = std::chrono::milliseconds(p["idle_timeout_ms"].value_or(int64_t{30000}));
    cfg.max_lifetime = std::chrono::seconds(p["max_lifetime_seconds"].value_or(int64_t{3600}));
    cfg.health_check_query = p["health_check_query"].value_or(cfg.health_check_query);
    config.connection_timeout = std::chrono::milliseconds(
        p["connection_timeout_ms"].value_or(int64_t{2000}));
}

InferenceConfig ConfigLoader::extract_inference(const toml::table& root, size_t pool_size) {
    InferenceConfig cfg;
    // One connection per worker at a time, so the pool size is the natural cap
    cfg.max_concurrent_pairs = pool_size;
    const auto* inference = root["inference"].as_table();
    if (!inference) return cfg;
    const auto& i = *inference;

    cfg.concurrent_pair_lookups = i["concurrent_pair_lookups"].value_or(true);
    if (const auto workers = i["max_concurrent_pairs"].value<int64_t>()) {
        cfg.max_concurrent_pairs = static_cast<size_t>(*workers < 0 ? 0 : *workers);
    }
    cfg.request_timeout = std::chrono::milliseconds(i["request_timeout_ms"].value_or(int64_t{0}));
    cfg.inner_join_threshold = i["inner_join_threshold"].value_or(cfg.inner_join_threshold);
    cfg.inner_join_bonus = i["inner_join_bonus"].value_or(cfg.inner_join_bonus);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or("info"s);
    }
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AppConfig config;
    config.database = extract_database(root);
    extract_pool(root, config);
    config.inference = extract_inference(root, config.pool.max_connections);
    config.logging = extract_logging(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;
    const auto& db = config.database;

    if (db.connection_string.empty() && db.host.empty() && db.dbname.empty()) {
        errors.emplace_back("database.connection_string or database.host/dbname is required");
    }
    if (db.port < 1 || db.port > 65535) {
        errors.push_back(std::format("database.port must be 1-65535, got {}", db.port));
    }
    if (utils::trim(db.default_schema).empty()) {
        errors.emplace_back("database.default_schema must not be empty");
    }

    if (config.pool.max_connections == 0) {
        errors.emplace_back("pool.max_connections must be > 0");
    }
    if (config.pool.min_connections > config.pool.max_connections) {
        errors.push_back(std::format("pool.min_connections ({}) > max_connections ({})",
            config.pool.min_connections, config.pool.max_connections));
    }

    if (config.inference.max_concurrent_pairs == 0) {
        errors.emplace_back("inference.max_concurrent_pairs must be > 0");
    }
    if (config.inference.max_concurrent_pairs > config.pool.max_connections) {
        errors.push_back(std::format("inference.max_concurrent_pairs ({}) > pool.max_connections ({})",
            config.inference.max_concurrent_pairs, config.pool.max_connections));
    }
    if (config.inference.inner_join_bonus < 0) {
        errors.push_back(std::format("inference.inner_join_bonus must be >= 0, got {}",
            config.inference.inner_join_bonus));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
            config.logging.level));
    }

    return errors;
}

} // namespace joinscout
