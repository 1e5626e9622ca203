// SPDX-License-Identifier: MIT

// src/connection_pool.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/tcp_connection.hpp"
#include "lib/stream/timer.hpp"
#include "src/config.hpp"

namespace llm_fanout {

/// Keep-alive connections to one backend endpoint, shared by all tasks.
///
/// A borrower gets either an idle connection that already carried a
/// complete response (IsReused(), ready for a request) or a fresh,
/// unconnected TcpConnection that the borrower connects itself. When
/// max_connections is reached, borrowers queue in FIFO order for at most
/// the pool timeout, then fail with PoolTimeout.
///
/// Event loop thread only.
class ConnectionPool {
public:
    /// Exclusive use of one connection. Move-only; destruction returns the
    /// connection to the pool, idle if it is still reusable and the socket
    /// is healthy, closed otherwise. A reused connection stays reusable
    /// until the borrower calls Claim(), so one dropped unused goes back
    /// to the idle set.
    class Lease {
    public:
        Lease() = default;
        ~Lease() { Release(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept { *this = std::move(other); }
        Lease& operator=(Lease&& other) noexcept;

        TcpConnection* operator->() const { return conn_.get(); }
        TcpConnection& operator*() const { return *conn_; }
        const std::shared_ptr<TcpConnection>& connection() const { return conn_; }

        explicit operator bool() const { return conn_ != nullptr; }

        /// True if the connection was taken from the idle set.
        bool IsReused() const { return reused_; }

        /// The borrower is about to use the connection. From here on it
        /// returns to the idle set only after MarkReusable().
        void Claim() { reusable_ = false; }

        /// The response on this connection ended cleanly with keep-alive.
        void MarkReusable() { reusable_ = true; }

        void Release();

    private:
        friend class ConnectionPool;
        Lease(ConnectionPool* pool, std::shared_ptr<TcpConnection> conn, bool reused)
            : pool_(pool),
              alive_(pool->alive_),
              conn_(std::move(conn)),
              reused_(reused),
              reusable_(reused) {}

        ConnectionPool* pool_ = nullptr;
        std::weak_ptr<bool> alive_;
        std::shared_ptr<TcpConnection> conn_;
        bool reused_ = false;
        bool reusable_ = false;
    };

    using LeaseCallback = std::function<void(std::expected<Lease, Error>)>;

    ConnectionPool(IEventLoop& loop, PoolConfig config,
                   std::chrono::milliseconds pool_timeout);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// Request a connection. Runs the callback before returning when one
    /// is available; otherwise queues it.
    /// @return Ticket for CancelWaiter()
    uint64_t Acquire(LeaseCallback on_lease);

    /// Remove a queued borrower. Returns false if it was already served.
    bool CancelWaiter(uint64_t ticket);

    /// Close every idle connection.
    void CloseIdle();

    size_t OpenCount() const { return open_; }
    size_t IdleCount() const { return idle_.size(); }
    size_t LeasedCount() const { return leased_; }
    size_t Waiting() const { return waiters_.size(); }
    /// Connections created over the pool's lifetime.
    size_t OpenedTotal() const { return opened_total_; }
    /// Leases served from the idle set over the pool's lifetime.
    size_t ReusedTotal() const { return reused_total_; }

private:
    struct Waiter {
        uint64_t ticket;
        LeaseCallback on_lease;
        std::unique_ptr<Timer> timer;
    };

    bool HasCapacity() const {
        return config_.max_connections == 0 || open_ < config_.max_connections;
    }

    void Return(std::shared_ptr<TcpConnection> conn, bool reusable);
    void Park(std::shared_ptr<TcpConnection> conn);
    void Evict(TcpConnection* conn);
    void ServeWaiters();
    void HandOff(Waiter waiter, std::shared_ptr<TcpConnection> conn, bool reused);
    void OnWaitTimeout(uint64_t ticket);

    IEventLoop& loop_;
    PoolConfig config_;
    std::chrono::milliseconds pool_timeout_;

    std::vector<std::shared_ptr<TcpConnection>> idle_;
    std::deque<Waiter> waiters_;
    size_t open_ = 0;
    size_t leased_ = 0;
    size_t opened_total_ = 0;
    size_t reused_total_ = 0;
    uint64_t next_ticket_ = 1;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace llm_fanout
