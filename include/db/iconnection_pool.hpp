#pragma once

#include "db/idb_connection.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace joinscout {

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 0;
    size_t max_connections = 5;
    std::chrono::milliseconds acquire_timeout{2000};
    std::chrono::milliseconds idle_timeout{30000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};  // 0 = disabled
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;

    // Acquire time histogram (microseconds)
    // Buckets: ≤100μs, ≤500μs, ≤1ms, ≤5ms, ≤50ms, +Inf
    uint64_t acquire_time_sum_us = 0;
    uint64_t acquire_time_count = 0;
    std::array<uint64_t, 6> acquire_time_buckets = {};
};

/**
 * @brief Abstract connection pool interface
 */
class IConnectionPool {
public:
    /**
     * @brief One borrowed connection, scoped to a single catalog query
     *
     * The destructor hands the connection back to the pool that issued it.
     * Leases are held through unique_ptr and never copied or moved, so the
     * pool must outlive every lease it hands out.
     */
    class Lease {
    public:
        Lease(IConnectionPool& pool, std::unique_ptr<IDbConnection> conn)
            : pool_(pool), conn_(std::move(conn)) {}

        ~Lease() {
            if (conn_) {
                pool_.release(std::move(conn_));
            }
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        IDbConnection* get() const { return conn_.get(); }
        IDbConnection* operator->() const { return conn_.get(); }

    private:
        IConnectionPool& pool_;
        std::unique_ptr<IDbConnection> conn_;
    };

    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire connection from pool (blocking with timeout)
     * @param timeout Max wait time for acquisition
     * @return Lease, or nullptr on timeout, shutdown or connect failure
     */
    [[nodiscard]] virtual std::unique_ptr<Lease> acquire(
        std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Acquire using the pool's configured timeout
     */
    [[nodiscard]] virtual std::unique_ptr<Lease> acquire() = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Drain pool - close all idle connections
     */
    virtual void drain() = 0;

    /**
     * @brief Get database name this pool serves
     */
    [[nodiscard]] virtual const std::string& name() const = 0;

protected:
    /**
     * @brief Take back a leased connection (once per lease, from ~Lease)
     */
    virtual void release(std::unique_ptr<IDbConnection> conn) = 0;
};

} // namespace joinscout
