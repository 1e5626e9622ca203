// SPDX-License-Identifier: MIT

// lib/stream/tcp_connection.hpp
#pragma once

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace llm_fanout {

// TcpConnection - non-blocking client socket driven by an IEventLoop.
//
// Data flow: Network -> TcpConnection -> OnData/OnDone/OnError callbacks
// Write path: Write() queues bytes; OnWriteDrained fires once the queue
// has been fully handed to the kernel.
//
// Callbacks can be replaced at any time (a pooled connection is handed
// from one borrower to the next), including from inside a callback.
// A callback may also Close() the connection or drop the last reference
// to it; the connection keeps itself alive until the dispatch returns.
//
// Errors are classified by phase: failures before the connection is
// established are ConnectFailure, write errors are WriteFailure, and read
// errors after establishment are ConnectionClosedEarly.
//
// Thread safety: all methods must be called from the event loop thread.
class TcpConnection : public std::enable_shared_from_this<TcpConnection> {
public:
    using ConnectCallback = std::function<void()>;
    using DataCallback = std::function<void(BufferChain&)>;
    using DoneCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const Error&)>;
    using DrainCallback = std::function<void()>;

    static std::shared_ptr<TcpConnection> Create(IEventLoop& loop) {
        return std::shared_ptr<TcpConnection>(new TcpConnection(loop));
    }

    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;
    TcpConnection(TcpConnection&&) = delete;
    TcpConnection& operator=(TcpConnection&&) = delete;

    // Start a non-blocking connect. Completion is reported through
    // OnConnect, failure through OnError (possibly before Connect returns).
    void Connect(const sockaddr_storage& addr);

    // Queue data for sending. Ignored once closed.
    void Write(std::string_view data);
    void Write(BufferChain data);

    // Close the socket. No callbacks fire after Close().
    void Close();

    void OnConnect(ConnectCallback cb) { on_connect_ = std::move(cb); }
    void OnData(DataCallback cb) { on_data_ = std::move(cb); }
    void OnDone(DoneCallback cb) { on_done_ = std::move(cb); }
    void OnError(ErrorCallback cb) { on_error_ = std::move(cb); }
    void OnWriteDrained(DrainCallback cb) { on_drained_ = std::move(cb); }

    // Drop every callback (used when a connection changes owner).
    void ClearCallbacks();

    bool IsOpen() const { return fd_ >= 0; }
    bool IsConnected() const { return connected_; }
    size_t PendingWriteBytes() const { return write_buffer_.size(); }
    int fd() const { return fd_; }

private:
    explicit TcpConnection(IEventLoop& loop) : loop_(loop) {}

    void HandleReadable();
    void HandleWritable();
    void HandleSocketError(int err);

    // Check SO_ERROR and finish a pending connect. Returns false (after
    // reporting) if the connect failed.
    bool CompleteConnect();
    void FlushWrites();
    void UpdateEpollFlags();
    void Fail(const Error& e);

    IEventLoop& loop_;
    std::unique_ptr<IEventHandle> handle_;
    int fd_ = -1;
    bool connected_ = false;
    bool watching_write_ = false;

    std::vector<std::byte> write_buffer_;
    SegmentPool segment_pool_{4};

    ConnectCallback on_connect_;
    DataCallback on_data_;
    DoneCallback on_done_;
    ErrorCallback on_error_;
    DrainCallback on_drained_;
};

}  // namespace llm_fanout
