// SPDX-License-Identifier: MIT

// tests/tcp_connection_test.cpp
#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/tcp_connection.hpp"

using namespace llm_fanout;

namespace {

sockaddr_storage Loopback(uint16_t port) {
    sockaddr_storage storage{};
    auto* addr = reinterpret_cast<sockaddr_in*>(&storage);
    addr->sin_family = AF_INET;
    addr->sin_port = htons(port);
    addr->sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    return storage;
}

bool PollUntil(EpollEventLoop& loop, const std::function<bool()>& done,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        loop.Poll(10);
    }
    return true;
}

std::string ChainToString(BufferChain& chain) {
    std::string out;
    while (!chain.Empty()) {
        std::string_view front = chain.FrontView();
        out.append(front);
        chain.Consume(front.size());
    }
    return out;
}

}  // namespace

class TcpConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        ASSERT_GE(listen_fd_, 0);
        int opt = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        auto addr = Loopback(0);
        ASSERT_EQ(bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(sockaddr_in)), 0);
        ASSERT_EQ(listen(listen_fd_, 8), 0);

        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        ASSERT_EQ(getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len), 0);
        port_ = ntohs(bound.sin_port);
    }

    void TearDown() override {
        if (peer_fd_ >= 0) close(peer_fd_);
        if (listen_fd_ >= 0) close(listen_fd_);
    }

    void AcceptPeer() {
        peer_fd_ = accept(listen_fd_, nullptr, nullptr);
        ASSERT_GE(peer_fd_, 0);
    }

    std::string ReadPeer(size_t n) {
        std::string out(n, '\0');
        size_t got = 0;
        while (got < n) {
            ssize_t r = read(peer_fd_, out.data() + got, n - got);
            if (r <= 0) break;
            got += static_cast<size_t>(r);
        }
        out.resize(got);
        return out;
    }

    void WritePeer(std::string_view data) {
        ASSERT_EQ(write(peer_fd_, data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    EpollEventLoop loop_;
    int listen_fd_ = -1;
    int peer_fd_ = -1;
    uint16_t port_ = 0;
};

TEST_F(TcpConnectionTest, ConnectWriteReadAndEof) {
    auto conn = TcpConnection::Create(loop_);

    bool connected = false;
    bool drained = false;
    bool done = false;
    std::string received;

    conn->OnConnect([&] {
        connected = true;
        conn->Write(std::string_view("ping"));
    });
    conn->OnWriteDrained([&] { drained = true; });
    conn->OnData([&](BufferChain& chain) { received += ChainToString(chain); });
    conn->OnDone([&] { done = true; });
    conn->OnError([&](const Error& e) { FAIL() << e.message; });

    conn->Connect(Loopback(port_));
    ASSERT_TRUE(PollUntil(loop_, [&] { return connected && drained; }));
    EXPECT_TRUE(conn->IsConnected());
    EXPECT_EQ(conn->PendingWriteBytes(), 0);

    AcceptPeer();
    EXPECT_EQ(ReadPeer(4), "ping");

    WritePeer("pong");
    ASSERT_TRUE(PollUntil(loop_, [&] { return received == "pong"; }));

    close(peer_fd_);
    peer_fd_ = -1;
    ASSERT_TRUE(PollUntil(loop_, [&] { return done; }));
    EXPECT_FALSE(conn->IsOpen());
}

TEST_F(TcpConnectionTest, WriteBeforeConnectIsFlushedOnConnect) {
    auto conn = TcpConnection::Create(loop_);
    bool drained = false;
    conn->OnWriteDrained([&] { drained = true; });

    conn->Connect(Loopback(port_));
    conn->Write(std::string_view("queued"));
    ASSERT_TRUE(PollUntil(loop_, [&] { return drained; }));

    AcceptPeer();
    EXPECT_EQ(ReadPeer(6), "queued");
}

TEST_F(TcpConnectionTest, ConnectRefusedIsConnectFailure) {
    // Nothing listens once the listener is gone
    close(listen_fd_);
    listen_fd_ = -1;

    auto conn = TcpConnection::Create(loop_);
    std::optional<Error> error;
    bool connected = false;
    conn->OnConnect([&] { connected = true; });
    conn->OnError([&](const Error& e) { error = e; });

    conn->Connect(Loopback(port_));
    ASSERT_TRUE(PollUntil(loop_, [&] { return error.has_value(); }));
    EXPECT_FALSE(connected);
    EXPECT_EQ(error->code, ErrorCode::ConnectFailure);
    EXPECT_EQ(error->os_errno, ECONNREFUSED);
    EXPECT_FALSE(conn->IsOpen());
}

TEST_F(TcpConnectionTest, ResetAfterConnectIsConnectionClosedEarly) {
    auto conn = TcpConnection::Create(loop_);
    bool connected = false;
    std::optional<Error> error;
    conn->OnConnect([&] { connected = true; });
    conn->OnError([&](const Error& e) { error = e; });

    conn->Connect(Loopback(port_));
    ASSERT_TRUE(PollUntil(loop_, [&] { return connected; }));
    AcceptPeer();

    // Abortive close sends RST
    linger lg{1, 0};
    setsockopt(peer_fd_, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
    close(peer_fd_);
    peer_fd_ = -1;

    ASSERT_TRUE(PollUntil(loop_, [&] { return error.has_value(); }));
    EXPECT_EQ(error->code, ErrorCode::ConnectionClosedEarly);
}

TEST_F(TcpConnectionTest, CloseInsideDataCallbackStopsCallbacks) {
    auto conn = TcpConnection::Create(loop_);
    bool connected = false;
    int data_calls = 0;
    bool done = false;
    conn->OnConnect([&] { connected = true; });
    conn->OnData([&](BufferChain& chain) {
        ++data_calls;
        chain.Consume(chain.Size());
        conn->Close();
    });
    conn->OnDone([&] { done = true; });

    conn->Connect(Loopback(port_));
    ASSERT_TRUE(PollUntil(loop_, [&] { return connected; }));
    AcceptPeer();
    WritePeer("data");
    close(peer_fd_);
    peer_fd_ = -1;

    ASSERT_TRUE(PollUntil(loop_, [&] { return data_calls > 0; }));
    loop_.Poll(20);
    EXPECT_EQ(data_calls, 1);
    EXPECT_FALSE(done);
}

TEST_F(TcpConnectionTest, DroppingLastReferenceInsideCallbackIsSafe) {
    auto conn = TcpConnection::Create(loop_);
    std::weak_ptr<TcpConnection> weak = conn;
    bool connected = false;
    conn->OnConnect([&] { connected = true; });
    conn->OnData([&](BufferChain& chain) {
        chain.Consume(chain.Size());
        conn.reset();
    });

    conn->Connect(Loopback(port_));
    ASSERT_TRUE(PollUntil(loop_, [&] { return connected; }));
    AcceptPeer();
    WritePeer("bye");

    ASSERT_TRUE(PollUntil(loop_, [&] { return weak.expired(); }));
}

TEST_F(TcpConnectionTest, ReplacingCallbacksHandsConnectionOver) {
    auto conn = TcpConnection::Create(loop_);
    bool connected = false;
    std::string first;
    std::string second;
    conn->OnConnect([&] { connected = true; });
    conn->OnData([&](BufferChain& chain) { first += ChainToString(chain); });

    conn->Connect(Loopback(port_));
    ASSERT_TRUE(PollUntil(loop_, [&] { return connected; }));
    AcceptPeer();

    WritePeer("one");
    ASSERT_TRUE(PollUntil(loop_, [&] { return first == "one"; }));

    conn->ClearCallbacks();
    conn->OnData([&](BufferChain& chain) { second += ChainToString(chain); });
    WritePeer("two");
    ASSERT_TRUE(PollUntil(loop_, [&] { return second == "two"; }));
    EXPECT_EQ(first, "one");
}
