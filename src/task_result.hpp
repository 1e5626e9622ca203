// SPDX-License-Identifier: MIT

// src/task_result.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/event_parser.hpp"
#include "src/target.hpp"

namespace llm_fanout {

/// Lifecycle of a streaming task.
enum class TaskState {
    Pending,
    AcquiringPermit,
    Connecting,
    Streaming,
    Terminated,
};

constexpr std::string_view task_state_name(TaskState state) {
    switch (state) {
        case TaskState::Pending:         return "Pending";
        case TaskState::AcquiringPermit: return "AcquiringPermit";
        case TaskState::Connecting:      return "Connecting";
        case TaskState::Streaming:       return "Streaming";
        case TaskState::Terminated:      return "Terminated";
    }
    return "Unknown";
}

/// Success, or Failure with its cause.
class TaskOutcome {
public:
    static TaskOutcome Success() { return TaskOutcome(); }
    static TaskOutcome Failure(Error cause) { return TaskOutcome(std::move(cause)); }

    bool ok() const { return !cause_.has_value(); }
    explicit operator bool() const { return ok(); }

    /// Failure cause. Only valid when !ok().
    const Error& cause() const { return *cause_; }

private:
    TaskOutcome() = default;
    explicit TaskOutcome(Error cause) : cause_(std::move(cause)) {}

    std::optional<Error> cause_;
};

/// Terminal outcome of one target.
struct TaskResult {
    Target target;
    TaskOutcome outcome = TaskOutcome::Success();
    size_t fragment_count = 0;      ///< Fragment events received
    size_t bytes_written = 0;       ///< Fragment text bytes handed to the sink
    std::optional<DoneMetadata> metadata;  ///< Set on Success
    std::chrono::milliseconds elapsed{0};

    bool ok() const { return outcome.ok(); }
};

/// Observations of one run, for checking the concurrency bounds.
struct RunStats {
    size_t max_streaming = 0;          ///< High-water mark of Streaming tasks
    size_t max_permits_in_use = 0;     ///< High-water mark of held permits
    size_t permits_in_use_at_end = 0;  ///< Held permits once all tasks ended
    size_t connections_opened = 0;
    size_t connections_reused = 0;
};

/// All results of one run, in input order.
struct RunReport {
    std::vector<TaskResult> results;
    RunStats stats;

    bool AllSucceeded() const {
        for (const auto& r : results) {
            if (!r.ok()) return false;
        }
        return true;
    }

    size_t FailureCount() const {
        size_t n = 0;
        for (const auto& r : results) {
            if (!r.ok()) ++n;
        }
        return n;
    }
};

}  // namespace llm_fanout
