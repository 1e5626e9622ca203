// SPDX-License-Identifier: MIT

// src/line_decoder.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"

namespace llm_fanout {

/// What to do with bytes left after the last line boundary when the
/// stream ends.
enum class TailPolicy {
    Yield,    ///< Emit the unterminated tail as a final record
    Discard,  ///< Drop it
};

struct DecoderConfig {
    TailPolicy tail_policy = TailPolicy::Yield;
    /// Largest record, terminator excluded, the decoder will accept.
    size_t max_record_size = 1024 * 1024;
};

/// Incremental newline-delimited record decoder.
///
/// Each Feed() appends a chunk to the retained tail, emits every complete
/// '\n'-terminated record (without the terminator, and without a trailing
/// '\r'), and keeps the unterminated suffix for the next call. Records are
/// passed as string_views that are only valid during the callback.
///
/// Empty records (keep-alive lines) are emitted like any other record.
/// The sequence of records does not depend on how the byte stream was split
/// into chunks.
///
/// The callback may return void, or bool where false stops decoding: the
/// remaining bytes of the current chunk are dropped and further Feed()
/// calls are ignored until Reset().
///
/// One decoder serves one response stream. Not thread-safe.
class LineDecoder {
public:
    explicit LineDecoder(DecoderConfig config = {}) : config_(config) {}

    /// Decode one chunk. Fails with BufferOverflow once a record, complete
    /// or not, grows past max_record_size. Records before it are emitted;
    /// the decoder then stops like a callback returning false.
    template <typename F>
    std::expected<void, Error> Feed(std::string_view chunk, F&& on_record);

    /// Decode every byte of a chain, consuming it.
    template <typename F>
    std::expected<void, Error> Feed(BufferChain& chain, F&& on_record) {
        while (!chain.Empty()) {
            std::string_view front = chain.FrontView();
            auto result = Feed(front, on_record);
            chain.Consume(front.size());
            if (!result) {
                chain.Consume(chain.Size());
                return result;
            }
        }
        return {};
    }

    /// End of stream: apply the tail policy and reset.
    /// @return Number of tail bytes discarded (0 when yielded or empty)
    template <typename F>
    size_t Finish(F&& on_record);

    /// Bytes retained after the last line boundary.
    size_t BufferedBytes() const { return tail_.size(); }

    bool IsStopped() const { return stopped_; }

    void Reset() {
        tail_.clear();
        stopped_ = false;
        overflow_size_ = 0;
    }

    const DecoderConfig& config() const { return config_; }

private:
    static std::string_view StripCarriageReturn(std::string_view record) {
        if (!record.empty() && record.back() == '\r') {
            record.remove_suffix(1);
        }
        return record;
    }

    // Invoke the callback; returns false if it asked to stop.
    template <typename F>
    bool Emit(F& on_record, std::string_view record) {
        if constexpr (std::is_same_v<std::invoke_result_t<F&, std::string_view>, bool>) {
            if (!on_record(record)) {
                stopped_ = true;
                return false;
            }
            return true;
        } else {
            on_record(record);
            return true;
        }
    }

    // Emit all complete records in `buffer`; returns the offset of the
    // first byte after the last boundary.
    template <typename F>
    size_t EmitComplete(std::string_view buffer, size_t search_from, F& on_record) {
        size_t line_start = 0;
        size_t pos;
        while ((pos = buffer.find('\n', search_from)) != std::string_view::npos) {
            std::string_view record = buffer.substr(line_start, pos - line_start);
            line_start = pos + 1;
            search_from = pos + 1;
            if (record.size() > config_.max_record_size) {
                overflow_size_ = record.size();
                stopped_ = true;
                return buffer.size();
            }
            if (!Emit(on_record, StripCarriageReturn(record))) {
                return buffer.size();
            }
        }
        return line_start;
    }

    Error OverflowError(size_t size) const {
        return Error{ErrorCode::BufferOverflow,
            "record exceeds " + std::to_string(config_.max_record_size) +
            " bytes (" + std::to_string(size) + " seen)"};
    }

    DecoderConfig config_;
    std::string tail_;
    bool stopped_ = false;
    size_t overflow_size_ = 0;
};

template <typename F>
std::expected<void, Error> LineDecoder::Feed(std::string_view chunk, F&& on_record) {
    if (stopped_ || chunk.empty()) return {};

    if (tail_.empty()) {
        // Fast path: decode straight from the chunk, keep only the remainder
        size_t consumed = EmitComplete(chunk, 0, on_record);
        if (!stopped_) {
            tail_.assign(chunk.substr(consumed));
        }
    } else {
        // Only the new bytes can contain a boundary
        size_t search_from = tail_.size();
        tail_.append(chunk);
        std::string buffer = std::move(tail_);
        tail_.clear();
        size_t consumed = EmitComplete(buffer, search_from, on_record);
        if (!stopped_) {
            tail_.assign(buffer, consumed, std::string::npos);
        }
    }

    if (!stopped_ && tail_.size() > config_.max_record_size) {
        overflow_size_ = tail_.size();
        stopped_ = true;
    }
    if (stopped_) {
        tail_.clear();
        if (overflow_size_ > 0) {
            size_t size = overflow_size_;
            overflow_size_ = 0;
            return std::unexpected(OverflowError(size));
        }
    }
    return {};
}

template <typename F>
size_t LineDecoder::Finish(F&& on_record) {
    size_t discarded = 0;
    if (!stopped_ && !tail_.empty()) {
        if (config_.tail_policy == TailPolicy::Yield) {
            std::string last = std::move(tail_);
            tail_.clear();
            Emit(on_record, StripCarriageReturn(last));
        } else {
            discarded = tail_.size();
        }
    }
    Reset();
    return discarded;
}

}  // namespace llm_fanout
