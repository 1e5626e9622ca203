// SPDX-License-Identifier: MIT

// src/permit_pool.cpp
#include "src/permit_pool.hpp"

#include <algorithm>
#include <cassert>
#include <memory>
#include <utility>

namespace llm_fanout {

PermitPool::PermitPool(IEventLoop& loop, size_t capacity)
    : loop_(loop), capacity_(capacity) {}

uint64_t PermitPool::Acquire(GrantCallback on_grant) {
    assert(loop_.IsInEventLoopThread());
    uint64_t ticket = next_ticket_++;

    if (in_use_ < capacity_ && waiters_.empty()) {
        ++in_use_;
        high_water_ = std::max(high_water_, in_use_);
        on_grant(Permit(this));
        return ticket;
    }

    waiters_.push_back(Waiter{ticket, std::move(on_grant)});
    return ticket;
}

bool PermitPool::CancelWaiter(uint64_t ticket) {
    assert(loop_.IsInEventLoopThread());
    auto it = std::find_if(waiters_.begin(), waiters_.end(),
                           [ticket](const Waiter& w) { return w.ticket == ticket; });
    if (it == waiters_.end()) return false;
    waiters_.erase(it);
    return true;
}

void PermitPool::ReleaseSlot() {
    assert(loop_.IsInEventLoopThread());
    if (waiters_.empty()) {
        --in_use_;
        return;
    }

    // Hand the slot over without releasing it; in_use_ is unchanged
    auto on_grant = std::make_shared<GrantCallback>(std::move(waiters_.front().on_grant));
    waiters_.pop_front();
    std::weak_ptr<bool> alive = alive_;
    loop_.Defer([this, alive, on_grant] {
        if (alive.expired()) return;
        (*on_grant)(Permit(this));
    });
}

}  // namespace llm_fanout
