// SPDX-License-Identifier: MIT

// src/permit_pool.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>

#include "lib/stream/event_loop.hpp"

namespace llm_fanout {

/// Counting admission control: at most `capacity` Permits exist at once.
///
/// Waiters are granted in FIFO order. A slot freed while others wait is
/// handed directly to the next waiter (the grant is delivered on the next
/// loop iteration), so a released slot can never be taken twice.
///
/// Must outlive every Permit it issued. Event loop thread only.
class PermitPool {
public:
    /// Right to hold one slot. Move-only; releases the slot exactly once,
    /// on destruction or Release().
    class Permit {
    public:
        Permit() = default;
        ~Permit() { Release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                Release();
                pool_ = other.pool_;
                other.pool_ = nullptr;
            }
            return *this;
        }

        bool valid() const { return pool_ != nullptr; }

        void Release() {
            if (pool_) {
                PermitPool* pool = pool_;
                pool_ = nullptr;
                pool->ReleaseSlot();
            }
        }

    private:
        friend class PermitPool;
        explicit Permit(PermitPool* pool) : pool_(pool) {}

        PermitPool* pool_ = nullptr;
    };

    using GrantCallback = std::function<void(Permit)>;

    PermitPool(IEventLoop& loop, size_t capacity);

    PermitPool(const PermitPool&) = delete;
    PermitPool& operator=(const PermitPool&) = delete;

    /// Request a slot. If one is free the callback runs before Acquire
    /// returns; otherwise it is queued.
    /// @return Ticket for CancelWaiter()
    uint64_t Acquire(GrantCallback on_grant);

    /// Remove a queued waiter. Returns false if it was already granted.
    bool CancelWaiter(uint64_t ticket);

    size_t Capacity() const { return capacity_; }
    size_t InUse() const { return in_use_; }
    size_t Waiting() const { return waiters_.size(); }
    size_t HighWater() const { return high_water_; }

private:
    struct Waiter {
        uint64_t ticket;
        GrantCallback on_grant;
    };

    void ReleaseSlot();

    IEventLoop& loop_;
    size_t capacity_;
    size_t in_use_ = 0;
    size_t high_water_ = 0;
    uint64_t next_ticket_ = 1;
    std::deque<Waiter> waiters_;
    // Deferred grants check this before touching the pool
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace llm_fanout
