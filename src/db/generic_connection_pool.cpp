#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace joinscout {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (conn) {
            std::lock_guard lock(mutex_);
            const auto now = Clock::now();
            created_at_[conn.get()] = now;
            last_used_[conn.get()] = now;
            idle_connections_.emplace_back(std::move(conn));
        } else {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for '{}'",
                i + 1, db_name_));
        }
    }

    utils::log::info(std::format("ConnectionPool initialized for '{}': {} connections (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<IConnectionPool::Lease> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    const auto acquire_start = Clock::now();

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("ConnectionPool '{}': acquire timed out after {}ms",
            db_name_, timeout.count()));
        return nullptr;
    }

    // Re-check shutdown after acquiring semaphore (shutdown may have been
    // set between the initial check and semaphore acquisition)
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    Clock::time_point birth{};
    Clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (conn) {
                const auto it = created_at_.find(conn.get());
                if (it != created_at_.end()) birth = it->second;
                const auto lu = last_used_.find(conn.get());
                if (lu != last_used_.end()) last_used = lu->second;
            }
        }
    }

    if (!conn) {
        conn = create_connection();
        if (conn) {
            const auto now = Clock::now();
            birth = now;
            last_used = now;
            track(conn.get(), now);
        }
    } else if (config_.max_lifetime.count() > 0 && Clock::now() - birth > config_.max_lifetime) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        conn = replace_connection(std::move(conn));
        last_used = Clock::now();
    } else if (Clock::now() - last_used > config_.idle_timeout &&
               !conn->is_healthy(config_.health_check_query)) {
        // Recently-used connections skip the round trip
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        conn = replace_connection(std::move(conn));
    }

    if (!conn) {
        semaphore_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    record_acquire_time(acquire_start);

    return std::make_unique<Lease>(*this, std::move(conn));
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);

    stats.acquire_time_sum_us = acquire_time_sum_us_.load(std::memory_order_relaxed);
    stats.acquire_time_count = acquire_time_count_.load(std::memory_order_relaxed);
    for (size_t i = 0; i < acquire_time_buckets_.size(); ++i) {
        stats.acquire_time_buckets[i] = acquire_time_buckets_[i].load(std::memory_order_relaxed);
    }

    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            created_at_.erase(conn.get());
            last_used_.erase(conn.get());
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    idle_connections_.clear();

    utils::log::info(std::format("ConnectionPool drained for '{}'", db_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    } else {
        utils::log::error(std::format("ConnectionPool '{}': failed to open connection", db_name_));
    }
    return conn;
}

std::unique_ptr<IDbConnection> GenericConnectionPool::replace_connection(
    std::unique_ptr<IDbConnection> conn) {
    untrack(conn.get());
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);

    auto fresh = create_connection();
    if (fresh) {
        track(fresh.get(), Clock::now());
    }
    return fresh;
}

void GenericConnectionPool::track(const IDbConnection* conn, Clock::time_point now) {
    std::lock_guard lock(mutex_);
    created_at_[conn] = now;
    last_used_[conn] = now;
}

void GenericConnectionPool::untrack(const IDbConnection* conn) {
    std::lock_guard lock(mutex_);
    created_at_.erase(conn);
    last_used_.erase(conn);
}

void GenericConnectionPool::release(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    const bool draining = shutdown_.load(std::memory_order_acquire);
    if (draining || !conn->is_connected()) {
        if (!draining) {
            utils::log::warn(std::format("ConnectionPool '{}': dropping connection lost mid-query",
                db_name_));
        }
        untrack(conn.get());
        conn->close();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
        semaphore_.release();
        return;
    }

    // No health check on return; stale connections are caught on the next acquire
    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = Clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

void GenericConnectionPool::record_acquire_time(Clock::time_point acquire_start) {
    const auto elapsed = Clock::now() - acquire_start;
    const auto us = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    acquire_time_sum_us_.fetch_add(us, std::memory_order_relaxed);
    acquire_time_count_.fetch_add(1, std::memory_order_relaxed);

    // Buckets: ≤100μs, ≤500μs, ≤1ms, ≤5ms, ≤50ms, +Inf
    size_t bucket = 5;
    if (us <= 100)        bucket = 0;
    else if (us <= 500)   bucket = 1;
    else if (us <= 1000)  bucket = 2;
    else if (us <= 5000)  bucket = 3;
    else if (us <= 50000) bucket = 4;
    acquire_time_buckets_[bucket].fetch_add(1, std::memory_order_relaxed);
}

} // namespace joinscout
