// SPDX-License-Identifier: MIT

#include "lib/stream/timer.hpp"

#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <system_error>

namespace llm_fanout {

namespace {

timespec ToTimespec(std::chrono::milliseconds ms) {
    timespec ts{};
    ts.tv_sec = ms.count() / 1000;
    ts.tv_nsec = (ms.count() % 1000) * 1000000;
    return ts;
}

}  // namespace

Timer::Timer(IEventLoop& loop) {
    fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd_ < 0) {
        throw std::system_error(errno, std::system_category(), "timerfd_create");
    }
    try {
        handle_ = loop.Register(
            fd_, /*want_read=*/true, /*want_write=*/false,
            [this]() { HandleReadable(); },
            nullptr,
            nullptr);
    } catch (...) {
        ::close(fd_);
        throw;
    }
}

Timer::~Timer() {
    handle_.reset();
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void Timer::Start(std::chrono::milliseconds delay,
                  std::chrono::milliseconds interval) {
    itimerspec spec{};
    spec.it_value = ToTimespec(delay);
    // A zero it_value disarms a timerfd, so round up to 1ns
    if (spec.it_value.tv_sec == 0 && spec.it_value.tv_nsec == 0) {
        spec.it_value.tv_nsec = 1;
    }
    spec.it_interval = ToTimespec(interval);

    if (timerfd_settime(fd_, 0, &spec, nullptr) < 0) {
        throw std::system_error(errno, std::system_category(), "timerfd_settime");
    }
    armed_ = true;
    periodic_ = interval.count() > 0;
}

void Timer::Stop() {
    itimerspec spec{};
    timerfd_settime(fd_, 0, &spec, nullptr);
    armed_ = false;
    periodic_ = false;

    // Drain an expiry that raced with Stop() so it is not delivered
    uint64_t expirations = 0;
    [[maybe_unused]] ssize_t n = ::read(fd_, &expirations, sizeof(expirations));
}

void Timer::HandleReadable() {
    uint64_t expirations = 0;
    ssize_t n = ::read(fd_, &expirations, sizeof(expirations));
    if (n != static_cast<ssize_t>(sizeof(expirations)) || !armed_) {
        return;
    }
    if (!periodic_) {
        armed_ = false;
    }
    if (callback_) {
        callback_();
    }
}

}  // namespace llm_fanout
