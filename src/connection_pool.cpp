// SPDX-License-Identifier: MIT

// src/connection_pool.cpp
#include "src/connection_pool.hpp"

#include <algorithm>
#include <cassert>
#include <string>
#include <utility>

#include "src/logging.hpp"

namespace llm_fanout {

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        alive_ = std::move(other.alive_);
        conn_ = std::move(other.conn_);
        reused_ = other.reused_;
        reusable_ = other.reusable_;
        other.pool_ = nullptr;
        other.reused_ = false;
        other.reusable_ = false;
    }
    return *this;
}

void ConnectionPool::Lease::Release() {
    if (!conn_) return;
    auto conn = std::move(conn_);
    conn_.reset();
    if (alive_.expired()) {
        conn->ClearCallbacks();
        conn->Close();
        return;
    }
    pool_->Return(std::move(conn), reusable_);
    pool_ = nullptr;
}

ConnectionPool::ConnectionPool(IEventLoop& loop, PoolConfig config,
                               std::chrono::milliseconds pool_timeout)
    : loop_(loop), config_(config), pool_timeout_(pool_timeout) {}

ConnectionPool::~ConnectionPool() {
    CloseIdle();
}

uint64_t ConnectionPool::Acquire(LeaseCallback on_lease) {
    assert(loop_.IsInEventLoopThread());
    uint64_t ticket = next_ticket_++;

    if (waiters_.empty()) {
        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            conn->ClearCallbacks();
            ++leased_;
            ++reused_total_;
            on_lease(Lease(this, std::move(conn), /*reused=*/true));
            return ticket;
        }
        if (HasCapacity()) {
            ++open_;
            ++leased_;
            ++opened_total_;
            on_lease(Lease(this, TcpConnection::Create(loop_), /*reused=*/false));
            return ticket;
        }
    }

    Waiter waiter{ticket, std::move(on_lease), nullptr};
    if (pool_timeout_.count() > 0) {
        waiter.timer = std::make_unique<Timer>(loop_);
        std::weak_ptr<bool> alive = alive_;
        waiter.timer->OnTimer([this, alive, ticket] {
            if (alive.expired()) return;
            OnWaitTimeout(ticket);
        });
        waiter.timer->Start(pool_timeout_);
    }
    waiters_.push_back(std::move(waiter));
    return ticket;
}

bool ConnectionPool::CancelWaiter(uint64_t ticket) {
    assert(loop_.IsInEventLoopThread());
    auto it = std::find_if(waiters_.begin(), waiters_.end(),
                           [ticket](const Waiter& w) { return w.ticket == ticket; });
    if (it == waiters_.end()) return false;
    waiters_.erase(it);
    return true;
}

void ConnectionPool::CloseIdle() {
    auto idle = std::move(idle_);
    idle_.clear();
    for (auto& conn : idle) {
        conn->ClearCallbacks();
        conn->Close();
        --open_;
    }
}

void ConnectionPool::Return(std::shared_ptr<TcpConnection> conn, bool reusable) {
    assert(loop_.IsInEventLoopThread());
    --leased_;
    conn->ClearCallbacks();

    bool healthy = conn->IsOpen() && conn->IsConnected() && conn->PendingWriteBytes() == 0;
    if (reusable && healthy) {
        if (!waiters_.empty()) {
            Waiter waiter = std::move(waiters_.front());
            waiters_.pop_front();
            ++leased_;
            ++reused_total_;
            HandOff(std::move(waiter), std::move(conn), /*reused=*/true);
            return;
        }
        if (idle_.size() < config_.max_idle) {
            Park(std::move(conn));
            return;
        }
    }

    conn->Close();
    --open_;
    ServeWaiters();
}

void ConnectionPool::Park(std::shared_ptr<TcpConnection> conn) {
    TcpConnection* raw = conn.get();
    std::weak_ptr<bool> alive = alive_;
    auto evict = [this, alive, raw] {
        if (!alive.expired()) Evict(raw);
    };
    // The peer may close an idle connection; bytes while idle are a protocol
    // violation. Either way the connection is no longer usable.
    conn->OnDone(evict);
    conn->OnError([evict](const Error&) { evict(); });
    conn->OnData([evict](BufferChain& chain) {
        chain.Consume(chain.Size());
        evict();
    });
    idle_.push_back(std::move(conn));
}

void ConnectionPool::Evict(TcpConnection* conn) {
    auto it = std::find_if(idle_.begin(), idle_.end(),
                           [conn](const auto& c) { return c.get() == conn; });
    if (it == idle_.end()) return;
    auto evicted = std::move(*it);
    idle_.erase(it);
    evicted->ClearCallbacks();
    evicted->Close();
    --open_;
    Log()->debug("connection pool: evicted idle connection ({} open)", open_);
    ServeWaiters();
}

void ConnectionPool::ServeWaiters() {
    while (!waiters_.empty() && HasCapacity()) {
        Waiter waiter = std::move(waiters_.front());
        waiters_.pop_front();
        ++open_;
        ++leased_;
        ++opened_total_;
        HandOff(std::move(waiter), TcpConnection::Create(loop_), /*reused=*/false);
    }
}

void ConnectionPool::HandOff(Waiter waiter, std::shared_ptr<TcpConnection> conn, bool reused) {
    if (waiter.timer) waiter.timer->Stop();

    // Delivered on the next iteration: Return() usually runs inside the
    // previous borrower's callbacks
    auto lease = std::shared_ptr<Lease>(new Lease(this, std::move(conn), reused));
    auto on_lease = std::make_shared<LeaseCallback>(std::move(waiter.on_lease));
    auto timer = std::shared_ptr<Timer>(std::move(waiter.timer));
    loop_.Defer([lease, on_lease, timer] {
        (*on_lease)(std::move(*lease));
    });
}

void ConnectionPool::OnWaitTimeout(uint64_t ticket) {
    auto it = std::find_if(waiters_.begin(), waiters_.end(),
                           [ticket](const Waiter& w) { return w.ticket == ticket; });
    if (it == waiters_.end()) return;

    // The timer is running this callback; destroy it on the next iteration
    auto expired = std::make_shared<Waiter>(std::move(*it));
    waiters_.erase(it);
    loop_.Defer([expired] {});

    auto on_lease = std::move(expired->on_lease);
    on_lease(std::unexpected(Error{ErrorCode::PoolTimeout,
        "no pooled connection available within " +
        std::to_string(pool_timeout_.count()) + " ms"}));
}

}  // namespace llm_fanout
