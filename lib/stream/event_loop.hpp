// SPDX-License-Identifier: MIT

// lib/stream/event_loop.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace llm_fanout {

/// Handle for a registered file descriptor, returned by IEventLoop::Register().
class IEventHandle {
public:
    virtual ~IEventHandle() = default;

    /// Change which events (read/write) are being monitored.
    virtual void Update(bool want_read, bool want_write) = 0;

    /// Return the monitored file descriptor.
    virtual int fd() const = 0;
};

/// Event loop interface for I/O multiplexing.
///
/// Every component in llm-fanout (sockets, timers, pools, tasks) is driven
/// by one IEventLoop and must only be touched from its thread. The built-in
/// EventLoop class wraps an epoll implementation behind this interface.
///
/// All callbacks are invoked on the event loop thread.
class IEventLoop {
public:
    using ReadCallback = std::function<void()>;
    using WriteCallback = std::function<void()>;
    using ErrorCallback = std::function<void(int error_code)>;

    virtual ~IEventLoop() = default;

    /// Register a file descriptor for event monitoring.
    ///
    /// @param fd         File descriptor to monitor
    /// @param want_read  Monitor for readability
    /// @param want_write Monitor for writability
    /// @param on_read    Called when fd is readable
    /// @param on_write   Called when fd is writable
    /// @param on_error   Called on EPOLLERR/EPOLLHUP with SO_ERROR value
    /// @return Handle to modify or unregister the fd (unregisters on destruction)
    virtual std::unique_ptr<IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) = 0;

    /// Run a callback on the next event loop iteration. Safe to call from
    /// any thread; this is how Orchestrator::Cancel() reaches the loop.
    /// Deferred callbacks run in the order they were queued.
    virtual void Defer(std::function<void()> fn) = 0;

    /// Return true if the caller is on the event loop thread.
    virtual bool IsInEventLoopThread() const = 0;
};

/// Type-erased event loop using epoll internally.
///
/// Provides implicit conversion to IEventLoop& so it can be passed
/// directly to components:
/// @code
/// EventLoop loop;
/// Orchestrator orchestrator(loop, config);
/// orchestrator.Run(targets, sink, on_complete);
/// loop.Run();
/// @endcode
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    /// Block and dispatch events once.
    /// @param timeout_ms  Max wait (-1 = infinite)
    void Poll(int timeout_ms = -1);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Signal the event loop to stop after the current iteration.
    void Stop();

    /// Implicit conversion to IEventLoop&.
    operator IEventLoop&();
    /// @copydoc operator IEventLoop&()
    operator const IEventLoop&() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace llm_fanout
