// SPDX-License-Identifier: MIT

// src/orchestrator.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/config.hpp"
#include "src/connection_pool.hpp"
#include "src/output_sink.hpp"
#include "src/permit_pool.hpp"
#include "src/streaming_task.hpp"
#include "src/target.hpp"
#include "src/task_result.hpp"

namespace llm_fanout {

// Orchestrator - runs one StreamingTask per Target and gathers the results.
//
// At most concurrency_limit tasks hold a permit at any time, so at most that
// many streams are open. Tasks fail independently: one task's failure
// affects no other unless fail_fast is set, in which case every outstanding
// task is cancelled and reported as Cancelled.
//
// The completion callback receives the results in input order once every
// task has terminated; it runs on a later loop iteration than the last
// result.
//
// @code
// EventLoop loop;
// Orchestrator orchestrator(loop, config);
// auto sink = OutputSink::ForFile(stdout);
// orchestrator.Run(MakeTargets(models, prompt), sink, [&](RunReport report) {
//     loop.Stop();
// });
// loop.Run();
// @endcode
//
// Run() and the callbacks are on the event loop thread; Cancel() may be
// called from any thread.
class Orchestrator {
public:
    using CompletionCallback = std::function<void(RunReport)>;
    using ResultCallback = std::function<void(const TaskResult&)>;

    Orchestrator(IEventLoop& loop, OrchestratorConfig config);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Start one task per target. Target indices are reassigned to input
    /// positions. The sink must outlive the run.
    /// @return InvalidConfig for a configuration no run can start with,
    ///         InvalidState if a run is already in progress
    std::expected<void, Error> Run(std::vector<Target> targets, OutputSink& sink,
                                   CompletionCallback on_complete);

    /// Called as each task terminates, before the completion callback.
    void OnTaskResult(ResultCallback cb) { on_task_result_ = std::move(cb); }

    /// Cancel every outstanding task. Thread-safe.
    void Cancel();

    bool IsRunning() const { return running_; }

    const OrchestratorConfig& config() const { return config_; }
    const ConnectionPool& connections() const { return connections_; }

private:
    void HandleResult(size_t index, TaskResult result);
    void HandleStateChange(TaskState from, TaskState to);
    void CancelOutstanding();
    void Finish();

    IEventLoop& loop_;
    OrchestratorConfig config_;
    ConnectionPool connections_;
    std::unique_ptr<PermitPool> permits_;

    std::vector<std::shared_ptr<StreamingTask>> tasks_;
    std::vector<std::optional<TaskResult>> results_;
    OutputSink* sink_ = nullptr;
    CompletionCallback on_complete_;
    ResultCallback on_task_result_;

    size_t completed_ = 0;
    size_t streaming_ = 0;
    size_t max_streaming_ = 0;
    size_t opened_at_start_ = 0;
    size_t reused_at_start_ = 0;
    bool running_ = false;
    bool cancelling_ = false;
    bool finishing_ = false;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

/// Run every target to completion on a private event loop and return the
/// report. An overall config.deadline cancels what is still running.
/// Generated text goes to `sink`; `on_result` observes each result as it
/// arrives.
/// @return The report, or the error that prevented the run from starting
std::expected<RunReport, Error> RunBlocking(const OrchestratorConfig& config,
                                            std::vector<Target> targets,
                                            OutputSink& sink,
                                            Orchestrator::ResultCallback on_result = {});

}  // namespace llm_fanout
