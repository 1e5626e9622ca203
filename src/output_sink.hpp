// SPDX-License-Identifier: MIT

// src/output_sink.hpp
#pragma once

#include <cstddef>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "src/target.hpp"

namespace llm_fanout {

/// How the sink renders the interleaved output of concurrent tasks.
struct SinkFormat {
    /// Print a banner before a target's first fragment and a blank line
    /// after its last one.
    bool headers = true;
    /// Prefix every fragment with "[#index model] " so interleaved output
    /// can be told apart.
    bool label_fragments = false;
};

/// The single destination all tasks render into.
///
/// Every call holds one mutex for the duration of exactly one write, so
/// the bytes of a single call are never interleaved with another call's.
/// No ordering across targets is implied. The lock is never held while
/// waiting on the network.
class OutputSink {
public:
    /// Receives the fully formatted bytes of one call.
    using Writer = std::function<void(std::string_view)>;

    explicit OutputSink(Writer writer, SinkFormat format = {})
        : writer_(std::move(writer)), format_(format) {}

    /// Sink writing to a stdio stream, flushing after every call.
    static OutputSink ForFile(std::FILE* file, SinkFormat format = {});

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;
    OutputSink(OutputSink&& other) noexcept
        : writer_(std::move(other.writer_)), format_(other.format_) {}

    void WriteHeader(const Target& target);
    void Write(const Target& target, std::string_view text);
    void WriteFooter(const Target& target);

    const SinkFormat& format() const { return format_; }

    /// Number of Write/WriteHeader/WriteFooter calls that produced output.
    size_t WriteCount() const {
        std::lock_guard lock(mutex_);
        return write_count_;
    }

private:
    void Emit(std::string_view bytes);

    mutable std::mutex mutex_;
    Writer writer_;
    SinkFormat format_;
    size_t write_count_ = 0;
};

}  // namespace llm_fanout
