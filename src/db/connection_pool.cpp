#include "db/connection_pool.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace dbsurvey {

ConnectionPool::ConnectionPool(ConnectionParams params, std::unique_ptr<IConnectionFactory> factory)
    : params_(std::move(params)),
      factory_(std::move(factory)),
      semaphore_(std::clamp<std::ptrdiff_t>(params_.max_connections, 1, kMaxPoolSize)) {}

ConnectionPool::~ConnectionPool() {
    drain();
}

Result<ConnectionPool::Lease> ConnectionPool::acquire() {
    if (shutdown_.load(std::memory_order_acquire)) {
        return Result<Lease>::error(ErrorCode::CONNECTION_FAILED, "Connection pool is shut down");
    }

    if (!semaphore_.try_acquire_for(params_.connect_timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return Result<Lease>::error(ErrorCode::CONNECTION_TIMEOUT,
            std::format("Timed out waiting for a pooled connection to {}", params_.display()));
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
        }
    }

    if (conn && !conn->is_healthy("SELECT 1")) {
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        conn->close();
        conn.reset();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
    }

    if (!conn) {
        auto created = factory_->create(params_);
        if (created.is_error()) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return Result<Lease>::propagate(created);
        }
        conn = created.take_value();
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    return Result<Lease>::ok(Lease(this, std::move(conn)));
}

PoolStats ConnectionPool::get_stats() const {
    PoolStats stats;
    {
        std::lock_guard lock(mutex_);
        stats.idle_connections = idle_connections_.size();
    }
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    return stats;
}

void ConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idle_connections_.clear();
}

void ConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    if (shutdown_.load(std::memory_order_acquire)) {
        conn->close();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        idle_connections_.emplace_back(std::move(conn));
    }
    semaphore_.release();
}

} // namespace dbsurvey
