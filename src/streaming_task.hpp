// SPDX-License-Identifier: MIT

// src/streaming_task.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/http_client.hpp"
#include "lib/stream/timer.hpp"
#include "src/config.hpp"
#include "src/connection_pool.hpp"
#include "src/event_parser.hpp"
#include "src/line_decoder.hpp"
#include "src/output_sink.hpp"
#include "src/permit_pool.hpp"
#include "src/target.hpp"
#include "src/task_result.hpp"

namespace llm_fanout {

// StreamingTask drives one Target from admission to a terminal result.
//
//   Pending -> AcquiringPermit -> Connecting -> Streaming -> Terminated
//
// Connecting covers three phases with independent deadlines: waiting for a
// pooled connection (pool timeout, enforced by the pool), DNS + TCP connect
// (connect timeout) and sending the request (write timeout, ends when the
// socket has taken every byte). Streaming starts once the request is sent;
// its deadline is read inactivity, re-armed on every chunk.
//
// Response path:
//   TcpConnection -> HttpClient -> BodyReceiver -> LineDecoder -> EventParser
//                                                                   -> OutputSink
//
// Every path into Terminated releases the permit and the connection lease,
// disarms the deadline and detaches from the connection before the result
// callback runs. The result callback runs exactly once.
//
// Tasks are shared_ptr-owned; the owner must not drop the last reference
// from inside the result callback. Event loop thread only.
class StreamingTask : public std::enable_shared_from_this<StreamingTask> {
public:
    /// Shared run resources. Must outlive the task.
    struct Context {
        PermitPool& permits;
        ConnectionPool& connections;
        OutputSink& sink;
        const OrchestratorConfig& config;
    };

    using ResultCallback = std::function<void(TaskResult)>;
    using StateCallback = std::function<void(const StreamingTask&, TaskState from, TaskState to)>;

    static std::shared_ptr<StreamingTask> Create(IEventLoop& loop, Target target, Context context) {
        return std::shared_ptr<StreamingTask>(
            new StreamingTask(loop, std::move(target), context));
    }

    StreamingTask(const StreamingTask&) = delete;
    StreamingTask& operator=(const StreamingTask&) = delete;

    /// Receive the terminal result. Set before Start() or Cancel().
    void OnResult(ResultCallback cb) { on_result_ = std::move(cb); }

    /// Observe every state transition.
    void OnStateChange(StateCallback cb) { on_state_ = std::move(cb); }

    /// Leave Pending and queue for a permit. Ignored unless Pending.
    void Start();

    /// Terminate with Cancelled unless already terminated.
    void Cancel();

    TaskState state() const { return state_; }
    const Target& target() const { return target_; }
    bool IsTerminated() const { return state_ == TaskState::Terminated; }

    /// Response body consumer; forwards to the task while it is alive.
    class BodyReceiver {
    public:
        explicit BodyReceiver(std::weak_ptr<StreamingTask> task) : task_(std::move(task)) {}

        void OnData(BufferChain& chain);
        void OnError(const Error& e);
        void OnDone();

    private:
        std::weak_ptr<StreamingTask> task_;
    };

private:
    enum class Phase { None, Connect, Write, Read };

    StreamingTask(IEventLoop& loop, Target target, Context context);

    void Transition(TaskState to);

    // Connecting
    void OnPermit(PermitPool::Permit permit);
    void OnLease(std::expected<ConnectionPool::Lease, Error> lease);
    void AttachConnection();
    void BeginConnect();
    void SendRequest();
    void OnRequestSent();
    void EnterStreaming();

    // Transport events
    void OnResponseBytes(BufferChain& chain);
    void OnResponseEnd();
    void OnTransportError(const Error& e);

    // Body events
    void OnBody(BufferChain& chain);
    void OnBodyDone();
    void OnBodyError(const Error& e);
    bool HandleRecord(std::string_view record);

    // Deadlines
    void ArmPhase(Phase phase, std::chrono::milliseconds timeout);
    void OnDeadline();

    void Succeed();
    void Fail(Error e);
    void Terminate(TaskOutcome outcome);

    IEventLoop& loop_;
    Target target_;
    Context ctx_;
    LineDecoder decoder_;
    EventParser parser_;

    TaskState state_ = TaskState::Pending;
    ResultCallback on_result_;
    StateCallback on_state_;

    PermitPool::Permit permit_;
    uint64_t permit_ticket_ = 0;
    bool waiting_permit_ = false;

    ConnectionPool::Lease lease_;
    uint64_t lease_ticket_ = 0;
    bool waiting_lease_ = false;

    std::shared_ptr<HttpClient<BodyReceiver>> http_;

    std::unique_ptr<Timer> deadline_;
    Phase phase_ = Phase::None;
    std::chrono::milliseconds phase_timeout_{0};

    bool header_written_ = false;
    bool done_seen_ = false;
    DoneMetadata done_metadata_;
    size_t fragment_count_ = 0;
    size_t bytes_written_ = 0;
    std::chrono::steady_clock::time_point started_at_;
};

}  // namespace llm_fanout
