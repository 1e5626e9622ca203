// SPDX-License-Identifier: MIT

// src/orchestrator.cpp
#include "src/orchestrator.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <string>
#include <utility>

#include "lib/stream/timer.hpp"
#include "src/logging.hpp"

namespace llm_fanout {

Orchestrator::Orchestrator(IEventLoop& loop, OrchestratorConfig config)
    : loop_(loop),
      config_(std::move(config)),
      connections_(loop, config_.pool, config_.timeouts.pool) {}

Orchestrator::~Orchestrator() {
    // Tear down silently: nobody is left to hear about the results
    on_complete_ = nullptr;
    on_task_result_ = nullptr;
    auto tasks = std::move(tasks_);
    tasks_.clear();
    for (auto& task : tasks) {
        task->OnResult(nullptr);
        task->OnStateChange(nullptr);
        task->Cancel();
    }
}

std::expected<void, Error> Orchestrator::Run(std::vector<Target> targets, OutputSink& sink,
                                             CompletionCallback on_complete) {
    assert(loop_.IsInEventLoopThread());
    if (running_) {
        return std::unexpected(Error{ErrorCode::InvalidState, "a run is already in progress"});
    }
    if (auto valid = Validate(config_); !valid) {
        return std::unexpected(valid.error());
    }

    running_ = true;
    cancelling_ = false;
    finishing_ = false;
    completed_ = 0;
    streaming_ = 0;
    max_streaming_ = 0;
    opened_at_start_ = connections_.OpenedTotal();
    reused_at_start_ = connections_.ReusedTotal();
    sink_ = &sink;
    on_complete_ = std::move(on_complete);
    permits_ = std::make_unique<PermitPool>(loop_, config_.concurrency_limit);

    results_.clear();
    results_.resize(targets.size());
    tasks_.clear();
    tasks_.reserve(targets.size());

    Log()->debug("run: {} targets, concurrency limit {}", targets.size(),
                 config_.concurrency_limit);

    if (targets.empty()) {
        Finish();
        return {};
    }

    StreamingTask::Context context{*permits_, connections_, sink, config_};
    for (size_t i = 0; i < targets.size(); ++i) {
        targets[i].index = i;
        auto task = StreamingTask::Create(loop_, std::move(targets[i]), context);
        task->OnResult([this, i](TaskResult result) { HandleResult(i, std::move(result)); });
        task->OnStateChange([this](const StreamingTask&, TaskState from, TaskState to) {
            HandleStateChange(from, to);
        });
        tasks_.push_back(std::move(task));
    }

    // A task may terminate (and trigger fail-fast) while later ones start;
    // Start() ignores tasks that were already cancelled
    auto tasks = tasks_;
    for (auto& task : tasks) {
        task->Start();
    }
    return {};
}

void Orchestrator::Cancel() {
    if (loop_.IsInEventLoopThread()) {
        CancelOutstanding();
        return;
    }
    std::weak_ptr<bool> alive = alive_;
    loop_.Defer([this, alive] {
        if (!alive.expired()) CancelOutstanding();
    });
}

void Orchestrator::CancelOutstanding() {
    if (!running_ || cancelling_) return;
    cancelling_ = true;
    Log()->debug("run: cancelling outstanding tasks");

    auto tasks = tasks_;
    for (auto& task : tasks) {
        task->Cancel();
    }
}

void Orchestrator::HandleStateChange(TaskState from, TaskState to) {
    if (to == TaskState::Streaming) {
        ++streaming_;
        max_streaming_ = std::max(max_streaming_, streaming_);
    } else if (from == TaskState::Streaming) {
        --streaming_;
    }
}

void Orchestrator::HandleResult(size_t index, TaskResult result) {
    const Target& target = result.target;
    if (result.ok()) {
        Log()->info("#{} {}: done ({} fragments, {} bytes, {} ms)", target.index, target.model,
                    result.fragment_count, result.bytes_written, result.elapsed.count());
    } else {
        const Error& cause = result.outcome.cause();
        Log()->warn("#{} {}: {} [{}]: {}", target.index, target.model,
                    error_name(cause.code), error_category(cause.code), cause.message);
    }

    bool trip_fail_fast = config_.fail_fast && !result.ok() &&
                          result.outcome.cause().code != ErrorCode::Cancelled;

    results_[index] = std::move(result);
    ++completed_;
    if (on_task_result_) on_task_result_(*results_[index]);

    if (trip_fail_fast && !cancelling_) {
        Log()->warn("fail-fast: cancelling outstanding tasks");
        CancelOutstanding();
    }

    if (completed_ == tasks_.size()) Finish();
}

void Orchestrator::Finish() {
    if (finishing_) return;
    finishing_ = true;

    // Deferred so no task is destroyed inside its own callbacks, and so
    // permit hand-offs already queued have settled
    std::weak_ptr<bool> alive = alive_;
    loop_.Defer([this, alive] {
        if (alive.expired()) return;

        RunReport report;
        report.results.reserve(results_.size());
        for (auto& result : results_) {
            report.results.push_back(std::move(*result));
        }
        report.stats.max_streaming = max_streaming_;
        report.stats.max_permits_in_use = permits_->HighWater();
        report.stats.permits_in_use_at_end = permits_->InUse();
        report.stats.connections_opened = connections_.OpenedTotal() - opened_at_start_;
        report.stats.connections_reused = connections_.ReusedTotal() - reused_at_start_;

        results_.clear();
        tasks_.clear();
        sink_ = nullptr;
        running_ = false;

        auto on_complete = std::move(on_complete_);
        on_complete_ = nullptr;
        if (on_complete) on_complete(std::move(report));
    });
}

std::expected<RunReport, Error> RunBlocking(const OrchestratorConfig& config,
                                            std::vector<Target> targets,
                                            OutputSink& sink,
                                            Orchestrator::ResultCallback on_result) {
    if (auto valid = Validate(config); !valid) {
        return std::unexpected(valid.error());
    }

    try {
        EventLoop loop;
        Orchestrator orchestrator(loop, config);
        if (on_result) orchestrator.OnTaskResult(std::move(on_result));

        std::optional<RunReport> report;
        auto started = orchestrator.Run(std::move(targets), sink, [&](RunReport r) {
            report = std::move(r);
            loop.Stop();
        });
        if (!started) {
            return std::unexpected(started.error());
        }

        std::unique_ptr<Timer> deadline;
        if (config.deadline) {
            deadline = std::make_unique<Timer>(loop);
            deadline->OnTimer([&orchestrator, &config] {
                Log()->warn("deadline of {} ms reached, cancelling", config.deadline->count());
                orchestrator.Cancel();
            });
            deadline->Start(*config.deadline);
        }

        loop.Run();

        if (!report) {
            return std::unexpected(Error{ErrorCode::InvalidState,
                                         "event loop stopped before the run completed"});
        }
        return std::move(*report);
    } catch (const std::runtime_error& e) {
        return std::unexpected(Error{ErrorCode::InvalidState,
                                     std::string("event loop failure: ") + e.what()});
    }
}

}  // namespace llm_fanout
