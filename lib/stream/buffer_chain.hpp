// SPDX-License-Identifier: MIT

// lib/stream/buffer_chain.hpp
#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace llm_fanout {

// Fixed-size buffer segment filled by one read() from a socket.
//
// Thread safety: Not thread-safe. Access must be externally synchronized.
struct Segment {
    static constexpr size_t kSize = 16 * 1024;  // 16KB segments

    std::array<std::byte, kSize> data;
    size_t size = 0;  // Bytes written (valid data)

    // Remaining capacity
    size_t Remaining() const noexcept { return kSize - size; }
};

// Pool for reusing Segment allocations across reads.
//
// Thread safety: Not thread-safe. All operations must be called from the
// event loop thread.
class SegmentPool {
public:
    explicit SegmentPool(size_t max_pool_size = kDefaultMaxPoolSize)
        : max_pool_size_(max_pool_size) {}

    // Acquire a segment from pool or allocate new.
    std::shared_ptr<Segment> Acquire() {
        if (!free_list_.empty()) {
            auto seg = std::move(free_list_.back());
            free_list_.pop_back();
            seg->size = 0;
            return seg;
        }
        return std::make_shared<Segment>();
    }

    // Return segment to pool for reuse.
    // Only pools segments with no external references (use_count == 1).
    void Release(std::shared_ptr<Segment> seg) {
        if (seg && seg.use_count() == 1 && free_list_.size() < max_pool_size_) {
            free_list_.push_back(std::move(seg));
        }
    }

    // Create a recycler callback for BufferChain::SetRecycleCallback().
    // The pool must outlive every chain holding the callback.
    std::function<void(std::shared_ptr<Segment>)> MakeRecycler() {
        return [this](std::shared_ptr<Segment> seg) {
            Release(std::move(seg));
        };
    }

    static constexpr size_t kDefaultMaxPoolSize = 8;

private:
    std::vector<std::shared_ptr<Segment>> free_list_;
    size_t max_pool_size_;
};

// Chain of segments representing received data (one RawChunk).
// Supports efficient append/consume operations for streaming data.
//
// Thread safety: Not thread-safe. All operations must be called from the same
// thread (the event loop thread).
class BufferChain {
public:
    using RecycleCallback = std::function<void(std::shared_ptr<Segment>)>;

    // Set callback for recycling consumed segments back to a pool.
    void SetRecycleCallback(RecycleCallback cb) {
        recycle_callback_ = std::move(cb);
    }

    // Add segment to chain (called by socket layer after read)
    void Append(std::shared_ptr<Segment> seg) {
        assert((!seg || seg->size <= Segment::kSize) &&
               "Segment size exceeds capacity - possible buffer overflow");
        if (seg && seg->size > 0) {
            total_size_ += seg->size;
            segments_.push_back(std::move(seg));
        }
    }

    // Copy bytes into the chain, filling the last segment before allocating.
    void AppendBytes(const std::byte* bytes, size_t len) {
        while (len > 0) {
            if (segments_.empty() || segments_.back()->Remaining() == 0 ||
                segments_.back().use_count() > 1) {
                segments_.push_back(std::make_shared<Segment>());
            }
            auto& tail = segments_.back();
            size_t n = std::min(len, tail->Remaining());
            std::memcpy(tail->data.data() + tail->size, bytes, n);
            tail->size += n;
            total_size_ += n;
            bytes += n;
            len -= n;
        }
    }

    void AppendBytes(std::string_view text) {
        AppendBytes(reinterpret_cast<const std::byte*>(text.data()), text.size());
    }

    // Consume bytes from front (called by the reader after processing).
    // If bytes == 0, this is a no-op.
    void Consume(size_t bytes) noexcept {
        while (bytes > 0 && !segments_.empty()) {
            auto& front = segments_.front();
            size_t available = front->size - consumed_offset_;

            if (bytes >= available) {
                bytes -= available;
                total_size_ -= available;
                consumed_offset_ = 0;

                if (recycle_callback_) {
                    recycle_callback_(std::move(front));
                }
                segments_.pop_front();
            } else {
                consumed_offset_ += bytes;
                total_size_ -= bytes;
                bytes = 0;
            }
        }
    }

    // Get raw pointer for contiguous access (offset relative to unconsumed start).
    const std::byte* DataAt(size_t offset) const noexcept {
        size_t pos = consumed_offset_ + offset;
        size_t seg_idx = 0;

        while (seg_idx < segments_.size() && pos >= segments_[seg_idx]->size) {
            pos -= segments_[seg_idx]->size;
            ++seg_idx;
        }

        assert(seg_idx < segments_.size() && "DataAt: offset out of bounds");
        return segments_[seg_idx]->data.data() + pos;
    }

    // Total unconsumed bytes. O(1) - cached value.
    size_t Size() const noexcept { return total_size_; }

    // Check if chain is empty (no unconsumed data).
    bool Empty() const noexcept { return total_size_ == 0; }

    // Contiguous bytes available from offset 0 (in first segment).
    size_t ContiguousSize() const noexcept {
        if (segments_.empty()) return 0;
        return segments_.front()->size - consumed_offset_;
    }

    // View of the first contiguous run of unconsumed bytes.
    std::string_view FrontView() const noexcept {
        if (segments_.empty()) return {};
        return std::string_view(
            reinterpret_cast<const char*>(segments_.front()->data.data() + consumed_offset_),
            ContiguousSize());
    }

    // Clear all data. Segments are recycled if callback is set.
    void Clear() {
        if (recycle_callback_) {
            for (auto& seg : segments_) {
                recycle_callback_(std::move(seg));
            }
        }
        segments_.clear();
        consumed_offset_ = 0;
        total_size_ = 0;
    }

private:
    std::deque<std::shared_ptr<Segment>> segments_;  // O(1) front removal
    size_t consumed_offset_ = 0;  // Bytes consumed from first segment
    size_t total_size_ = 0;       // Cached total unconsumed bytes
    RecycleCallback recycle_callback_;  // Optional recycling callback
};

}  // namespace llm_fanout
