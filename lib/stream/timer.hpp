// SPDX-License-Identifier: MIT

// lib/stream/timer.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "lib/stream/event_loop.hpp"

namespace llm_fanout {

/// Re-armable one-shot or periodic timer backed by a timerfd.
///
/// Restarting or stopping the timer takes effect immediately: a deadline
/// that is pushed back never fires at its old expiry. Used for per-phase deadlines (connect, write, read inactivity).
///
/// Safe to destroy while armed. Must be used from the event loop thread.
///
/// @code
/// Timer deadline(loop);
/// deadline.OnTimer([this] { Fail(ErrorCode::ReadTimeout); });
/// deadline.Start(std::chrono::seconds(30));
/// // on every chunk:
/// deadline.Start(std::chrono::seconds(30));
/// @endcode
class Timer {
public:
    using Callback = std::function<void()>;

    /// @param loop  Event loop that drives this timer
    /// @throws std::system_error if the timerfd cannot be created
    explicit Timer(IEventLoop& loop);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;
    Timer(Timer&&) = delete;
    Timer& operator=(Timer&&) = delete;

    /// Set the callback invoked on each timer tick.
    void OnTimer(Callback cb) { callback_ = std::move(cb); }

    /// Arm (or re-arm) the timer.
    /// @param delay     Initial delay before first tick
    /// @param interval  Repeat interval (0 = one-shot)
    void Start(std::chrono::milliseconds delay,
               std::chrono::milliseconds interval = std::chrono::milliseconds{0});

    /// Disarm the timer. No further callbacks will fire.
    void Stop();

    /// Return true if the timer is armed.
    bool IsArmed() const { return armed_; }

private:
    void HandleReadable();

    int fd_ = -1;
    std::unique_ptr<IEventHandle> handle_;
    Callback callback_;
    bool armed_ = false;
    bool periodic_ = false;
};

}  // namespace llm_fanout
