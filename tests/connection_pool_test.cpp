// SPDX-License-Identifier: MIT

// tests/connection_pool_test.cpp
#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "lib/stream/epoll_event_loop.hpp"
#include "src/connection_pool.hpp"

using namespace llm_fanout;
using namespace std::chrono_literals;

class ConnectionPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        ASSERT_GE(listen_fd_, 0);
        int opt = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        auto* addr = reinterpret_cast<sockaddr_in*>(&addr_);
        addr->sin_family = AF_INET;
        addr->sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ASSERT_EQ(bind(listen_fd_, reinterpret_cast<sockaddr*>(addr), sizeof(sockaddr_in)), 0);
        ASSERT_EQ(listen(listen_fd_, 8), 0);
        socklen_t len = sizeof(sockaddr_in);
        ASSERT_EQ(getsockname(listen_fd_, reinterpret_cast<sockaddr*>(addr), &len), 0);
    }

    void TearDown() override {
        for (int fd : peers_) close(fd);
        if (listen_fd_ >= 0) close(listen_fd_);
    }

    bool PollUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout = 2000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!done()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            loop_.Poll(10);
        }
        return true;
    }

    // Take a lease, connecting it when fresh.
    ConnectionPool::Lease AcquireConnected(ConnectionPool& pool) {
        std::optional<ConnectionPool::Lease> lease;
        pool.Acquire([&](std::expected<ConnectionPool::Lease, Error> l) {
            if (l) lease.emplace(std::move(*l));
        });
        EXPECT_TRUE(PollUntil([&] { return lease.has_value(); }));
        if (!lease) return {};
        if (!lease->IsReused()) {
            (*lease)->Connect(addr_);
            EXPECT_TRUE(PollUntil([&] { return (*lease)->IsConnected(); }));
            int peer = accept(listen_fd_, nullptr, nullptr);
            EXPECT_GE(peer, 0);
            peers_.push_back(peer);
        }
        return std::move(*lease);
    }

    EpollEventLoop loop_;
    int listen_fd_ = -1;
    sockaddr_storage addr_{};
    std::vector<int> peers_;
};

TEST_F(ConnectionPoolTest, FreshLeaseIsUnconnected) {
    ConnectionPool pool(loop_, PoolConfig{}, 1000ms);
    std::optional<ConnectionPool::Lease> lease;
    pool.Acquire([&](std::expected<ConnectionPool::Lease, Error> l) {
        ASSERT_TRUE(l.has_value());
        lease.emplace(std::move(*l));
    });

    ASSERT_TRUE(lease.has_value());
    EXPECT_FALSE(lease->IsReused());
    EXPECT_FALSE((*lease)->IsConnected());
    EXPECT_EQ(pool.OpenCount(), 1);
    EXPECT_EQ(pool.LeasedCount(), 1);

    lease.reset();
    EXPECT_EQ(pool.OpenCount(), 0);
    EXPECT_EQ(pool.LeasedCount(), 0);
}

TEST_F(ConnectionPoolTest, ReusableConnectionIsParkedAndReused) {
    ConnectionPool pool(loop_, PoolConfig{}, 1000ms);

    auto lease = AcquireConnected(pool);
    ASSERT_TRUE(lease);
    TcpConnection* raw = &*lease;
    lease.MarkReusable();
    lease.Release();

    EXPECT_EQ(pool.IdleCount(), 1);
    EXPECT_EQ(pool.OpenCount(), 1);

    auto again = AcquireConnected(pool);
    ASSERT_TRUE(again);
    EXPECT_TRUE(again.IsReused());
    EXPECT_EQ(&*again, raw);
    EXPECT_EQ(pool.ReusedTotal(), 1);
    EXPECT_EQ(pool.OpenedTotal(), 1);
}

TEST_F(ConnectionPoolTest, UnconnectedLeaseIsNeverParked) {
    ConnectionPool pool(loop_, PoolConfig{}, 1000ms);
    std::optional<ConnectionPool::Lease> lease;
    pool.Acquire([&](std::expected<ConnectionPool::Lease, Error> l) { lease.emplace(std::move(*l)); });
    ASSERT_TRUE(lease.has_value());

    lease->MarkReusable();
    lease.reset();
    EXPECT_EQ(pool.IdleCount(), 0);
    EXPECT_EQ(pool.OpenCount(), 0);
}

TEST_F(ConnectionPoolTest, CapQueuesAndHandsOffReturnedConnection) {
    ConnectionPool pool(loop_, PoolConfig{.max_connections = 1}, 1000ms);
    auto first = AcquireConnected(pool);
    ASSERT_TRUE(first);
    TcpConnection* raw = &*first;

    std::optional<ConnectionPool::Lease> second;
    pool.Acquire([&](std::expected<ConnectionPool::Lease, Error> l) {
        ASSERT_TRUE(l.has_value());
        second.emplace(std::move(*l));
    });
    EXPECT_FALSE(second.has_value());
    EXPECT_EQ(pool.Waiting(), 1);

    first.MarkReusable();
    first.Release();
    EXPECT_FALSE(second.has_value());  // delivered on the next iteration
    ASSERT_TRUE(PollUntil([&] { return second.has_value(); }));
    EXPECT_TRUE(second->IsReused());
    EXPECT_EQ(&**second, raw);
    EXPECT_EQ(pool.OpenCount(), 1);
    EXPECT_EQ(pool.Waiting(), 0);
}

TEST_F(ConnectionPoolTest, UnusedHandOffGoesBackToIdle) {
    ConnectionPool pool(loop_, PoolConfig{.max_connections = 1}, 1000ms);
    auto first = AcquireConnected(pool);
    ASSERT_TRUE(first);
    TcpConnection* raw = &*first;

    // The borrower lost interest before the hand-off arrived
    bool served = false;
    pool.Acquire([&](std::expected<ConnectionPool::Lease, Error> l) {
        ASSERT_TRUE(l.has_value());
        served = true;
    });

    first.MarkReusable();
    first.Release();
    ASSERT_TRUE(PollUntil([&] { return served; }));
    EXPECT_EQ(pool.IdleCount(), 1);
    EXPECT_EQ(pool.OpenCount(), 1);

    auto again = AcquireConnected(pool);
    ASSERT_TRUE(again);
    EXPECT_TRUE(again.IsReused());
    EXPECT_EQ(&*again, raw);
}

TEST_F(ConnectionPoolTest, ClaimedLeaseIsClosedUnlessMarked) {
    ConnectionPool pool(loop_, PoolConfig{}, 1000ms);
    auto lease = AcquireConnected(pool);
    ASSERT_TRUE(lease);
    lease.MarkReusable();
    lease.Release();

    auto again = AcquireConnected(pool);
    ASSERT_TRUE(again.IsReused());
    again.Claim();
    again.Release();
    EXPECT_EQ(pool.IdleCount(), 0);
    EXPECT_EQ(pool.OpenCount(), 0);
}

TEST_F(ConnectionPoolTest, ClosedConnectionFreesSlotForWaiter) {
    ConnectionPool pool(loop_, PoolConfig{.max_connections = 1}, 1000ms);
    auto first = AcquireConnected(pool);
    ASSERT_TRUE(first);

    std::optional<ConnectionPool::Lease> second;
    pool.Acquire([&](std::expected<ConnectionPool::Lease, Error> l) {
        ASSERT_TRUE(l.has_value());
        second.emplace(std::move(*l));
    });

    first.Release();  // not reusable
    ASSERT_TRUE(PollUntil([&] { return second.has_value(); }));
    EXPECT_FALSE(second->IsReused());
    EXPECT_FALSE((*second)->IsConnected());
    EXPECT_EQ(pool.OpenCount(), 1);
    EXPECT_EQ(pool.OpenedTotal(), 2);
}

TEST_F(ConnectionPoolTest, WaiterTimesOut) {
    ConnectionPool pool(loop_, PoolConfig{.max_connections = 1}, 50ms);
    auto held = AcquireConnected(pool);
    ASSERT_TRUE(held);

    std::optional<Error> error;
    auto started = std::chrono::steady_clock::now();
    pool.Acquire([&](std::expected<ConnectionPool::Lease, Error> l) {
        ASSERT_FALSE(l.has_value());
        error = l.error();
    });
    ASSERT_TRUE(PollUntil([&] { return error.has_value(); }));
    EXPECT_GE(std::chrono::steady_clock::now() - started, 40ms);
    EXPECT_EQ(error->code, ErrorCode::PoolTimeout);
    EXPECT_EQ(pool.Waiting(), 0);

    // Drain the deferred cleanup of the expired waiter
    loop_.Poll(0);
}

TEST_F(ConnectionPoolTest, CancelledWaiterIsNotServed) {
    ConnectionPool pool(loop_, PoolConfig{.max_connections = 1}, 1000ms);
    auto held = AcquireConnected(pool);
    ASSERT_TRUE(held);

    bool served = false;
    uint64_t ticket = pool.Acquire([&](std::expected<ConnectionPool::Lease, Error>) { served = true; });
    EXPECT_TRUE(pool.CancelWaiter(ticket));
    EXPECT_FALSE(pool.CancelWaiter(ticket));

    held.Release();
    for (int i = 0; i < 3; ++i) loop_.Poll(0);
    EXPECT_FALSE(served);
    EXPECT_EQ(pool.OpenCount(), 0);
}

TEST_F(ConnectionPoolTest, IdleConnectionEvictedWhenPeerCloses) {
    ConnectionPool pool(loop_, PoolConfig{}, 1000ms);
    auto lease = AcquireConnected(pool);
    ASSERT_TRUE(lease);
    lease.MarkReusable();
    lease.Release();
    ASSERT_EQ(pool.IdleCount(), 1);

    close(peers_.back());
    peers_.pop_back();

    ASSERT_TRUE(PollUntil([&] { return pool.IdleCount() == 0; }));
    EXPECT_EQ(pool.OpenCount(), 0);
}

TEST_F(ConnectionPoolTest, IdleSetIsBounded) {
    ConnectionPool pool(loop_, PoolConfig{.max_idle = 1}, 1000ms);
    auto a = AcquireConnected(pool);
    auto b = AcquireConnected(pool);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(pool.OpenCount(), 2);

    a.MarkReusable();
    b.MarkReusable();
    a.Release();
    b.Release();

    EXPECT_EQ(pool.IdleCount(), 1);
    EXPECT_EQ(pool.OpenCount(), 1);

    pool.CloseIdle();
    EXPECT_EQ(pool.IdleCount(), 0);
    EXPECT_EQ(pool.OpenCount(), 0);
}

TEST_F(ConnectionPoolTest, LeaseOutlivingPoolClosesConnection) {
    ConnectionPool::Lease lease;
    {
        ConnectionPool pool(loop_, PoolConfig{}, 1000ms);
        lease = AcquireConnected(pool);
        ASSERT_TRUE(lease);
    }
    auto conn = lease.connection();
    lease.MarkReusable();
    lease.Release();
    EXPECT_FALSE(conn->IsOpen());
}
