#pragma once

#include "db/iconnection_factory.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>

namespace dbsurvey {

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t total_acquires = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
};

/**
 * @brief Per-adapter bounded connection pool
 *
 * Owned exclusively by one engine instance; never shared across
 * adapters or databases.
 *
 * - Bounded: max_connections enforced via counting_semaphore
 * - Lazy: connections are created on demand, none are pre-warmed
 * - Idle connections are health-checked before reuse
 * - Lease returns its connection on destruction
 */
class ConnectionPool {
public:
    static constexpr std::ptrdiff_t kMaxPoolSize = 100;

    /**
     * @brief Move-only handle; the connection goes back to the pool when it dies
     */
    class Lease {
    public:
        Lease(ConnectionPool* pool, std::unique_ptr<IDbConnection> conn)
            : pool_(pool), conn_(std::move(conn)) {}
        ~Lease() { release(); }

        Lease(Lease&& other) noexcept
            : pool_(other.pool_), conn_(std::move(other.conn_)) { other.pool_ = nullptr; }
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                pool_ = other.pool_;
                conn_ = std::move(other.conn_);
                other.pool_ = nullptr;
            }
            return *this;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        IDbConnection* operator->() const { return conn_.get(); }
        IDbConnection& operator*() const { return *conn_; }

    private:
        void release() {
            if (pool_ && conn_) {
                pool_->return_connection(std::move(conn_));
            }
            pool_ = nullptr;
        }

        ConnectionPool* pool_;
        std::unique_ptr<IDbConnection> conn_;
    };

    ConnectionPool(ConnectionParams params, std::unique_ptr<IConnectionFactory> factory);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Acquire a connection (blocks up to connect_timeout for a free slot)
     */
    [[nodiscard]] Result<Lease> acquire();

    [[nodiscard]] PoolStats get_stats() const;

    /**
     * @brief Close all idle connections and refuse further acquires
     */
    void drain();

    [[nodiscard]] const ConnectionParams& params() const { return params_; }

private:
    void return_connection(std::unique_ptr<IDbConnection> conn);

    ConnectionParams params_;
    std::unique_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;
    std::counting_semaphore<kMaxPoolSize> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<bool> shutdown_{false};
};

} // namespace dbsurvey
