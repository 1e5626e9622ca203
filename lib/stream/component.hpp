// SPDX-License-Identifier: MIT

// lib/stream/component.hpp
#pragma once

#include <concepts>
#include <memory>
#include <optional>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace llm_fanout {

class BufferChain;

// TerminalDownstream interface - minimal interface for error/done signals
template<typename D>
concept TerminalDownstream = requires(D& d, const Error& e) {
    { d.OnError(e) } -> std::same_as<void>;
    { d.OnDone() } -> std::same_as<void>;
};

// Downstream interface - receives data via BufferChain
// All byte-stream components use this unified interface
template<typename D>
concept Downstream = TerminalDownstream<D> && requires(D& d, BufferChain& chain) {
    { d.OnData(chain) } -> std::same_as<void>;
};

// CRTP base - reentrancy-safe close and single terminal emission.
//
// A component may be asked to close from inside one of its own callbacks
// (a downstream reacting to OnData by tearing the stream down). The
// processing guard counts active callbacks; the actual DoClose() runs on
// the event loop once the last guard is released.
//
// Derived classes must implement:
// - DoClose() - cleanup on close
// - DisableWatchers() - stop receiving input
// Derived classes must inherit std::enable_shared_from_this<Derived>.
template<typename Derived>
class PipelineComponent {
public:
    explicit PipelineComponent(IEventLoop& loop) : loop_(loop) {}

    // RAII guard for reentrancy-safe processing
    // Move-safe via active flag to prevent double-decrement
    class ProcessingGuard {
    public:
        explicit ProcessingGuard(PipelineComponent& c) : comp_(&c), active_(true) {
            ++comp_->processing_count_;
        }
        ~ProcessingGuard() {
            if (active_) {
                if (--comp_->processing_count_ == 0 && comp_->close_pending_) {
                    comp_->ScheduleClose();
                }
            }
        }
        ProcessingGuard(const ProcessingGuard&) = delete;
        ProcessingGuard& operator=(const ProcessingGuard&) = delete;
        ProcessingGuard(ProcessingGuard&& other) noexcept
            : comp_(other.comp_), active_(other.active_) {
            other.active_ = false;
        }
        ProcessingGuard& operator=(ProcessingGuard&&) = delete;
    private:
        PipelineComponent* comp_;
        bool active_;
    };

    // Combines closed check with guard creation
    [[nodiscard]] std::optional<ProcessingGuard> TryGuard() {
        if (closed_) return std::nullopt;
        return std::optional<ProcessingGuard>(std::in_place, *this);
    }

    void RequestClose() {
        if (closed_) return;
        closed_ = true;
        static_cast<Derived*>(this)->DisableWatchers();

        if (processing_count_ > 0) {
            close_pending_ = true;
            return;
        }
        ScheduleClose();
    }

    bool IsClosed() const { return closed_; }

    // Per-message terminal guard
    bool IsFinalized() const { return finalized_; }

    // Terminal emission with concept constraint
    template<TerminalDownstream D>
    void EmitError(D& downstream, const Error& e) {
        if (finalized_) return;
        finalized_ = true;
        ProcessingGuard guard(*this);
        downstream.OnError(e);
    }

    template<TerminalDownstream D>
    void EmitDone(D& downstream) {
        if (finalized_) return;
        finalized_ = true;
        ProcessingGuard guard(*this);
        downstream.OnDone();
    }

    // Propagate upstream error to downstream (common OnError pattern).
    template<TerminalDownstream D>
    void PropagateError(D& downstream, const Error& e) {
        auto guard = TryGuard();
        if (!guard) return;
        EmitError(downstream, e);
        RequestClose();
    }

protected:
    void ScheduleClose() {
        if (close_scheduled_) return;
        close_scheduled_ = true;
        close_pending_ = false;

        // Use weak_from_this to safely check if the object is still alive
        auto weak_self = static_cast<Derived*>(this)->weak_from_this();
        auto self = weak_self.lock();
        if (!self) {
            // Object is already being destroyed, skip deferred close
            return;
        }
        loop_.Defer([self]() {
            self->DoClose();
        });
    }

    IEventLoop& loop_;

private:
    int processing_count_ = 0;
    bool close_pending_ = false;
    bool close_scheduled_ = false;
    bool closed_ = false;
    bool finalized_ = false;
};

}  // namespace llm_fanout
