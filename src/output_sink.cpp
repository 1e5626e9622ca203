// SPDX-License-Identifier: MIT

// src/output_sink.cpp
#include "src/output_sink.hpp"

#include <fmt/format.h>

namespace llm_fanout {

OutputSink OutputSink::ForFile(std::FILE* file, SinkFormat format) {
    return OutputSink(
        [file](std::string_view bytes) {
            fmt::print(file, "{}", bytes);
            std::fflush(file);
        },
        format);
}

void OutputSink::WriteHeader(const Target& target) {
    if (!format_.headers) return;
    Emit(fmt::format("\n=== {} (streaming) ===\n\n", target.model));
}

void OutputSink::Write(const Target& target, std::string_view text) {
    if (text.empty()) return;
    if (format_.label_fragments) {
        Emit(fmt::format("[#{} {}] {}", target.index, target.model, text));
    } else {
        Emit(text);
    }
}

void OutputSink::WriteFooter(const Target& /*target*/) {
    if (!format_.headers) return;
    Emit("\n\n");
}

void OutputSink::Emit(std::string_view bytes) {
    std::lock_guard lock(mutex_);
    writer_(bytes);
    ++write_count_;
}

}  // namespace llm_fanout
