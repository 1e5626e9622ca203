// SPDX-License-Identifier: MIT

#include "lib/stream/tcp_connection.hpp"

#include <netinet/tcp.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace llm_fanout {

TcpConnection::~TcpConnection() { Close(); }

void TcpConnection::Connect(const sockaddr_storage& addr) {
    auto self = shared_from_this();
    if (fd_ >= 0) {
        Fail(Error{ErrorCode::InvalidState, "Connect() called on an open connection"});
        return;
    }

    int family = addr.ss_family;
    int sock_fd = socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (sock_fd < 0) {
        Fail(Error{ErrorCode::ConnectFailure, "socket() failed", errno});
        return;
    }

    // Disable Nagle for lower latency
    int opt = 1;
    setsockopt(sock_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    socklen_t addr_len = family == AF_INET6 ? sizeof(sockaddr_in6) : sizeof(sockaddr_in);
    int ret = connect(sock_fd, reinterpret_cast<const sockaddr*>(&addr), addr_len);
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        ::close(sock_fd);
        Fail(Error{ErrorCode::ConnectFailure,
                   std::string("connect() failed: ") + std::strerror(err), err});
        return;
    }

    // Start with read+write to detect connect completion and early errors
    fd_ = sock_fd;
    handle_ = loop_.Register(
        sock_fd,
        /*want_read=*/true,
        /*want_write=*/true,  // For connect completion
        [this]() { HandleReadable(); },
        [this]() { HandleWritable(); },
        [this](int err) { HandleSocketError(err); });
}

void TcpConnection::Write(std::string_view data) {
    if (fd_ < 0) return;
    auto* bytes = reinterpret_cast<const std::byte*>(data.data());
    write_buffer_.insert(write_buffer_.end(), bytes, bytes + data.size());
    if (connected_) {
        auto self = shared_from_this();
        FlushWrites();
    }
}

void TcpConnection::Write(BufferChain data) {
    if (fd_ < 0) return;
    while (!data.Empty()) {
        size_t chunk_size = data.ContiguousSize();
        const std::byte* ptr = data.DataAt(0);
        write_buffer_.insert(write_buffer_.end(), ptr, ptr + chunk_size);
        data.Consume(chunk_size);
    }
    if (connected_) {
        auto self = shared_from_this();
        FlushWrites();
    }
}

void TcpConnection::Close() {
    handle_.reset();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    connected_ = false;
    watching_write_ = false;
    write_buffer_.clear();
}

void TcpConnection::ClearCallbacks() {
    on_connect_ = nullptr;
    on_data_ = nullptr;
    on_done_ = nullptr;
    on_error_ = nullptr;
    on_drained_ = nullptr;
}

void TcpConnection::Fail(const Error& e) {
    // Copy so the callback may replace itself
    auto cb = on_error_;
    Close();
    if (cb) cb(e);
}

bool TcpConnection::CompleteConnect() {
    if (connected_) return true;

    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        err = errno;
    }
    if (err != 0) {
        Fail(Error{ErrorCode::ConnectFailure,
                   std::string("connect failed: ") + std::strerror(err), err});
        return false;
    }

    connected_ = true;
    // Switch to read-only mode after connect (no EPOLLOUT unless writes pending)
    UpdateEpollFlags();
    auto cb = on_connect_;
    if (cb) cb();
    // Bytes queued before the connect completed
    if (fd_ >= 0 && !write_buffer_.empty() && !watching_write_) FlushWrites();
    return fd_ >= 0;
}

void TcpConnection::HandleReadable() {
    auto self = shared_from_this();
    if (!CompleteConnect()) return;

    BufferChain chain;
    chain.SetRecycleCallback(segment_pool_.MakeRecycler());

    while (fd_ >= 0) {
        auto seg = segment_pool_.Acquire();
        ssize_t n = ::read(fd_, seg->data.data(), Segment::kSize);
        if (n > 0) {
            seg->size = static_cast<size_t>(n);
            chain.Append(std::move(seg));
        } else if (n == 0) {
            // EOF - deliver accumulated data first, then signal done
            if (!chain.Empty()) {
                auto cb = on_data_;
                if (cb) cb(chain);
                if (fd_ < 0) return;
            }
            auto done = on_done_;
            Close();
            if (done) done();
            return;
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            int err = errno;
            if (!chain.Empty()) {
                auto cb = on_data_;
                if (cb) cb(chain);
                if (fd_ < 0) return;
            }
            Fail(Error{ErrorCode::ConnectionClosedEarly,
                       std::string("read() failed: ") + std::strerror(err), err});
            return;
        }
    }

    if (!chain.Empty() && fd_ >= 0) {
        auto cb = on_data_;
        if (cb) cb(chain);
    }
}

void TcpConnection::HandleWritable() {
    auto self = shared_from_this();
    if (!CompleteConnect()) return;
    FlushWrites();
}

void TcpConnection::HandleSocketError(int err) {
    auto self = shared_from_this();
    if (err == 0) err = ECONNRESET;
    ErrorCode code = connected_ ? ErrorCode::ConnectionClosedEarly
                                : ErrorCode::ConnectFailure;
    Fail(Error{code, std::string("socket error: ") + std::strerror(err), err});
}

void TcpConnection::FlushWrites() {
    if (write_buffer_.empty()) return;

    size_t offset = 0;
    while (offset < write_buffer_.size()) {
        ssize_t n = ::send(fd_, write_buffer_.data() + offset,
                           write_buffer_.size() - offset, MSG_NOSIGNAL);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            write_buffer_.erase(write_buffer_.begin(),
                                write_buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
            // Need to wait for writability - ensure EPOLLOUT is set
            if (!watching_write_) {
                watching_write_ = true;
                UpdateEpollFlags();
            }
            return;
        }
        int err = errno;
        Fail(Error{ErrorCode::WriteFailure,
                   std::string("send() failed: ") + std::strerror(err), err});
        return;
    }

    write_buffer_.clear();

    // Write buffer drained - stop watching for writability
    if (watching_write_) {
        watching_write_ = false;
        UpdateEpollFlags();
    }
    auto cb = on_drained_;
    if (cb) cb();
}

void TcpConnection::UpdateEpollFlags() {
    if (!handle_ || !connected_) return;
    handle_->Update(true, watching_write_);
}

}  // namespace llm_fanout
