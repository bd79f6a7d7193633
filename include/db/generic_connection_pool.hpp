#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace joinscout {

/**
 * @brief Bounded pool of metadata connections
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Lazy initialization: connections created on-demand up to max
 * - Health checking: only for connections idle longer than idle_timeout
 * - Lifetime: connections older than max_lifetime are replaced on acquire
 * - Thread-safe: mutex protects deque, semaphore prevents oversubscription
 * - RAII: a Lease hands its connection back on destruction; connections
 *   that died mid-query are dropped instead of going back to the idle deque
 *
 * The pool is passed explicitly to whoever needs it; there is no global instance.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @brief Construct pool with connection factory
     * @param db_name Database name (for logging)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<Lease> acquire(std::chrono::milliseconds timeout) override;

    std::unique_ptr<Lease> acquire() override {
        return acquire(config_.acquire_timeout);
    }

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }

private:
    using Clock = std::chrono::steady_clock;

    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Close `conn` and open a fresh one in its place
     * @return Replacement connection, or nullptr if the factory failed
     */
    std::unique_ptr<IDbConnection> replace_connection(std::unique_ptr<IDbConnection> conn);

    void track(const IDbConnection* conn, Clock::time_point now);
    void untrack(const IDbConnection* conn);

    void release(std::unique_ptr<IDbConnection> conn) override;

    void record_acquire_time(Clock::time_point acquire_start);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<uint64_t> acquire_time_sum_us_{0};
    std::atomic<uint64_t> acquire_time_count_{0};
    std::array<std::atomic<uint64_t>, 6> acquire_time_buckets_{};

    std::atomic<bool> shutdown_{false};

    // Per-connection bookkeeping, guarded by mutex_
    std::unordered_map<const IDbConnection*, Clock::time_point> created_at_;
    std::unordered_map<const IDbConnection*, Clock::time_point> last_used_;
};

} // namespace joinscout
