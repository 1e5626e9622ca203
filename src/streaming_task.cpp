// SPDX-License-Identifier: MIT

// src/streaming_task.cpp
#include "src/streaming_task.hpp"

#include <cassert>
#include <string>
#include <system_error>
#include <variant>

#include <fmt/format.h>

#include "lib/stream/dns_resolver.hpp"
#include "src/generate_request.hpp"
#include "src/logging.hpp"

namespace llm_fanout {

// BodyReceiver

void StreamingTask::BodyReceiver::OnData(BufferChain& chain) {
    if (auto task = task_.lock()) {
        task->OnBody(chain);
    } else {
        chain.Consume(chain.Size());
    }
}

void StreamingTask::BodyReceiver::OnError(const Error& e) {
    if (auto task = task_.lock()) task->OnBodyError(e);
}

void StreamingTask::BodyReceiver::OnDone() {
    if (auto task = task_.lock()) task->OnBodyDone();
}

static_assert(Downstream<StreamingTask::BodyReceiver>);

// StreamingTask

StreamingTask::StreamingTask(IEventLoop& loop, Target target, Context context)
    : loop_(loop),
      target_(std::move(target)),
      ctx_(context),
      decoder_(context.config.decoder),
      parser_(context.config.schema) {}

void StreamingTask::Transition(TaskState to) {
    TaskState from = state_;
    state_ = to;
    Log()->debug("task #{} {}: {} -> {}", target_.index, target_.model,
                 task_state_name(from), task_state_name(to));
    if (on_state_) on_state_(*this, from, to);
}

void StreamingTask::Start() {
    assert(loop_.IsInEventLoopThread());
    if (state_ != TaskState::Pending) return;

    started_at_ = std::chrono::steady_clock::now();
    Transition(TaskState::AcquiringPermit);

    std::weak_ptr<StreamingTask> weak = weak_from_this();
    waiting_permit_ = true;
    uint64_t ticket = ctx_.permits.Acquire([weak](PermitPool::Permit permit) {
        // A permit granted to a task that is gone is released right here
        if (auto self = weak.lock()) self->OnPermit(std::move(permit));
    });
    if (waiting_permit_) permit_ticket_ = ticket;
}

void StreamingTask::Cancel() {
    assert(loop_.IsInEventLoopThread());
    if (IsTerminated()) return;
    Fail(Error{ErrorCode::Cancelled, "cancelled"});
}

void StreamingTask::OnPermit(PermitPool::Permit permit) {
    if (state_ != TaskState::AcquiringPermit) return;
    waiting_permit_ = false;
    permit_ = std::move(permit);
    Transition(TaskState::Connecting);

    std::weak_ptr<StreamingTask> weak = weak_from_this();
    try {
        deadline_ = std::make_unique<Timer>(loop_);
    } catch (const std::system_error& e) {
        Fail(Error{ErrorCode::ConnectFailure,
                   std::string("cannot create deadline timer: ") + e.what(),
                   e.code().value()});
        return;
    }
    deadline_->OnTimer([weak] {
        if (auto self = weak.lock()) self->OnDeadline();
    });

    waiting_lease_ = true;
    uint64_t ticket = ctx_.connections.Acquire(
        [weak](std::expected<ConnectionPool::Lease, Error> lease) {
            if (auto self = weak.lock()) self->OnLease(std::move(lease));
        });
    if (waiting_lease_) lease_ticket_ = ticket;
}

void StreamingTask::OnLease(std::expected<ConnectionPool::Lease, Error> lease) {
    if (state_ != TaskState::Connecting || !waiting_lease_) return;
    waiting_lease_ = false;

    if (!lease) {
        Fail(lease.error());
        return;
    }
    lease_ = std::move(*lease);
    lease_.Claim();
    AttachConnection();

    if (lease_.IsReused()) {
        Log()->debug("task #{} {}: reusing pooled connection", target_.index, target_.model);
        SendRequest();
    } else {
        BeginConnect();
    }
}

void StreamingTask::AttachConnection() {
    std::weak_ptr<StreamingTask> weak = weak_from_this();
    http_ = HttpClient<BodyReceiver>::Create(loop_, std::make_shared<BodyReceiver>(weak));

    TcpConnection& conn = *lease_;
    conn.OnConnect([weak] {
        if (auto self = weak.lock()) self->SendRequest();
    });
    conn.OnWriteDrained([weak] {
        if (auto self = weak.lock()) self->OnRequestSent();
    });
    conn.OnData([weak](BufferChain& chain) {
        if (auto self = weak.lock()) {
            self->OnResponseBytes(chain);
        } else {
            chain.Consume(chain.Size());
        }
    });
    conn.OnDone([weak] {
        if (auto self = weak.lock()) self->OnResponseEnd();
    });
    conn.OnError([weak](const Error& e) {
        if (auto self = weak.lock()) self->OnTransportError(e);
    });
}

void StreamingTask::BeginConnect() {
    const Endpoint& endpoint = ctx_.config.endpoint;
    auto addr = ResolveAddress(endpoint.host, endpoint.port);
    if (!addr) {
        Fail(addr.error());
        return;
    }
    ArmPhase(Phase::Connect, ctx_.config.timeouts.connect);
    lease_->Connect(*addr);
}

void StreamingTask::SendRequest() {
    if (state_ != TaskState::Connecting || !lease_) return;
    ArmPhase(Phase::Write, ctx_.config.timeouts.write);
    // OnWriteDrained may fire before Write() returns
    lease_->Write(BuildGenerateRequest(ctx_.config.endpoint, target_));
}

void StreamingTask::OnRequestSent() {
    if (state_ != TaskState::Connecting) return;
    EnterStreaming();
}

void StreamingTask::EnterStreaming() {
    Transition(TaskState::Streaming);
    ArmPhase(Phase::Read, ctx_.config.timeouts.read);
}

void StreamingTask::OnResponseBytes(BufferChain& chain) {
    if (IsTerminated() || !http_) {
        chain.Consume(chain.Size());
        return;
    }
    // The backend answered before the request drained (early error status)
    if (state_ == TaskState::Connecting) {
        EnterStreaming();
    } else if (!done_seen_) {
        // Any response byte counts as activity, headers included
        ArmPhase(Phase::Read, ctx_.config.timeouts.read);
    }

    auto http = http_;
    http->OnData(chain);
}

void StreamingTask::OnResponseEnd() {
    if (IsTerminated()) return;
    if (state_ == TaskState::Connecting) {
        Fail(Error{ErrorCode::WriteFailure, "connection closed before the request was sent"});
        return;
    }
    auto http = http_;
    if (http) http->OnDone();
}

void StreamingTask::OnTransportError(const Error& e) {
    if (IsTerminated()) return;
    if (done_seen_) {
        Succeed();
        return;
    }
    if (state_ == TaskState::Connecting) {
        if (phase_ == Phase::Write && e.code != ErrorCode::WriteFailure) {
            Fail(Error{ErrorCode::WriteFailure, e.message, e.os_errno});
        } else {
            Fail(e);
        }
        return;
    }
    Fail(Error{ErrorCode::ConnectionClosedEarly, e.message, e.os_errno});
}

void StreamingTask::OnBody(BufferChain& chain) {
    if (state_ != TaskState::Streaming || done_seen_) {
        chain.Consume(chain.Size());
        return;
    }

    if (!header_written_) {
        header_written_ = true;
        ctx_.sink.WriteHeader(target_);
    }

    auto fed = decoder_.Feed(chain, [this](std::string_view record) {
        return HandleRecord(record);
    });
    if (!fed) {
        Fail(fed.error());
        return;
    }

    if (done_seen_ && !IsTerminated()) {
        auto http = http_;
        if (http && http->IsMessageComplete()) {
            Succeed();
            return;
        }
        // Let the parser reach the end of the message so the connection
        // can go back to the pool; OnBodyDone gets there first if it can
        if (deadline_) deadline_->Stop();
        std::weak_ptr<StreamingTask> weak = weak_from_this();
        loop_.Defer([weak] {
            if (auto self = weak.lock()) self->Succeed();
        });
    }
}

bool StreamingTask::HandleRecord(std::string_view record) {
    if (state_ != TaskState::Streaming || done_seen_) return false;

    parser_.Parse(record, [this](Event&& event) {
        if (IsTerminated()) return;
        if (auto* fragment = std::get_if<FragmentEvent>(&event)) {
            ++fragment_count_;
            if (!fragment->text.empty()) {
                ctx_.sink.Write(target_, fragment->text);
                bytes_written_ += fragment->text.size();
            }
        } else if (auto* done = std::get_if<DoneEvent>(&event)) {
            done_seen_ = true;
            done_metadata_ = std::move(done->metadata);
        } else if (auto* error = std::get_if<ErrorEvent>(&event)) {
            Fail(std::move(error->error));
        }
    });

    return state_ == TaskState::Streaming && !done_seen_;
}

void StreamingTask::OnBodyDone() {
    if (IsTerminated()) return;
    if (!done_seen_) {
        size_t discarded = decoder_.Finish([this](std::string_view record) {
            return HandleRecord(record);
        });
        if (discarded > 0) {
            Log()->debug("task #{} {}: discarded {} byte unterminated tail",
                         target_.index, target_.model, discarded);
        }
    }
    if (IsTerminated()) return;
    if (done_seen_) {
        Succeed();
        return;
    }
    Fail(Error{ErrorCode::ConnectionClosedEarly, "stream ended without a done record"});
}

void StreamingTask::OnBodyError(const Error& e) {
    if (IsTerminated()) return;
    // Whatever follows the done record cannot undo it
    if (done_seen_) {
        Succeed();
        return;
    }
    Fail(e);
}

void StreamingTask::ArmPhase(Phase phase, std::chrono::milliseconds timeout) {
    phase_ = phase;
    phase_timeout_ = timeout;
    if (!deadline_) return;
    if (timeout.count() > 0) {
        deadline_->Start(timeout);
    } else {
        deadline_->Stop();
    }
}

void StreamingTask::OnDeadline() {
    if (IsTerminated()) return;
    if (done_seen_) {
        Succeed();
        return;
    }
    switch (phase_) {
        case Phase::Connect:
            Fail(Error{ErrorCode::ConnectFailure,
                       fmt::format("connect timed out after {} ms", phase_timeout_.count())});
            break;
        case Phase::Write:
            Fail(Error{ErrorCode::WriteFailure,
                       fmt::format("request not sent within {} ms", phase_timeout_.count())});
            break;
        case Phase::Read:
            Fail(Error{ErrorCode::ReadTimeout,
                       fmt::format("no data for {} ms", phase_timeout_.count())});
            break;
        case Phase::None:
            break;
    }
}

void StreamingTask::Succeed() {
    if (IsTerminated()) return;
    Terminate(TaskOutcome::Success());
}

void StreamingTask::Fail(Error e) {
    if (IsTerminated()) return;
    Terminate(TaskOutcome::Failure(std::move(e)));
}

void StreamingTask::Terminate(TaskOutcome outcome) {
    auto self = shared_from_this();

    if (waiting_permit_) {
        ctx_.permits.CancelWaiter(permit_ticket_);
        waiting_permit_ = false;
    }
    if (waiting_lease_) {
        ctx_.connections.CancelWaiter(lease_ticket_);
        waiting_lease_ = false;
    }
    if (deadline_) deadline_->Stop();
    phase_ = Phase::None;

    if (outcome.ok() && header_written_) {
        ctx_.sink.WriteFooter(target_);
    }

    // Release resources before anyone hears about the result
    if (lease_) {
        lease_->ClearCallbacks();
        if (outcome.ok() && http_ && http_->ShouldKeepAlive()) {
            lease_.MarkReusable();
        }
        lease_.Release();
    }
    if (http_) {
        auto http = std::move(http_);
        http_.reset();
        http->RequestClose();
    }
    permit_.Release();

    Transition(TaskState::Terminated);

    TaskResult result;
    result.target = target_;
    result.fragment_count = fragment_count_;
    result.bytes_written = bytes_written_;
    if (outcome.ok()) result.metadata = done_metadata_;
    if (started_at_ != std::chrono::steady_clock::time_point{}) {
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_);
    }
    result.outcome = std::move(outcome);

    auto on_result = std::move(on_result_);
    on_result_ = nullptr;
    if (on_result) on_result(std::move(result));
}

}  // namespace llm_fanout
