// SPDX-License-Identifier: MIT

// src/event_parser.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "lib/stream/error.hpp"

namespace llm_fanout {

/// Field names a streaming backend uses in its NDJSON records.
struct RecordSchema {
    std::string text_field = "response";
    std::string done_field = "done";
    std::string error_field = "error";
};

/// Generation statistics carried by the terminal record.
/// Every field is optional: backends omit what they do not report.
struct DoneMetadata {
    std::optional<std::string> model;
    std::optional<std::string> done_reason;
    std::optional<uint64_t> total_duration_ns;
    std::optional<uint64_t> load_duration_ns;
    std::optional<uint64_t> prompt_eval_count;
    std::optional<uint64_t> prompt_eval_duration_ns;
    std::optional<uint64_t> eval_count;
    std::optional<uint64_t> eval_duration_ns;
    size_t context_tokens = 0;  ///< Length of the "context" array, if sent

    /// Generated tokens per second, when both eval fields are present.
    std::optional<double> TokensPerSecond() const {
        if (!eval_count || !eval_duration_ns || *eval_duration_ns == 0) {
            return std::nullopt;
        }
        return static_cast<double>(*eval_count) * 1e9 /
               static_cast<double>(*eval_duration_ns);
    }
};

struct FragmentEvent {
    std::string text;
};

struct DoneEvent {
    DoneMetadata metadata;
};

struct ErrorEvent {
    Error error;
};

using Event = std::variant<FragmentEvent, DoneEvent, ErrorEvent>;

/// Fields extracted from one record.
struct ParsedRecord {
    std::optional<std::string> text;
    bool done = false;
    DoneMetadata metadata;
    std::optional<std::string> error;
};

/// Turns decoded NDJSON records into stream events.
///
/// - an empty record yields nothing
/// - a record that is not a JSON object, or whose known fields have the
///   wrong type, yields ErrorEvent(MalformedRecord)
/// - a string text field yields FragmentEvent (even when empty)
/// - a string error field yields ErrorEvent(BackendError)
/// - done == true yields DoneEvent, after the record's fragment
/// - any other object yields nothing
///
/// Stateless apart from the schema; records are independent.
class EventParser {
public:
    explicit EventParser(RecordSchema schema = {}) : schema_(std::move(schema)) {}

    /// Extract the known fields of a record.
    /// @return The fields, or a description of why the record is malformed
    std::expected<ParsedRecord, std::string> ParseRecord(std::string_view record) const;

    /// Parse a record and invoke on_event for each event it produces,
    /// in order: fragment first, then error or done.
    template <typename F>
    void Parse(std::string_view record, F&& on_event) const {
        if (IsBlank(record)) return;

        auto parsed = ParseRecord(record);
        if (!parsed) {
            on_event(Event{ErrorEvent{Error{ErrorCode::MalformedRecord, parsed.error()}}});
            return;
        }

        if (parsed->text) {
            on_event(Event{FragmentEvent{std::move(*parsed->text)}});
        }
        if (parsed->error) {
            on_event(Event{ErrorEvent{Error{ErrorCode::BackendError, std::move(*parsed->error)}}});
        } else if (parsed->done) {
            on_event(Event{DoneEvent{std::move(parsed->metadata)}});
        }
    }

    const RecordSchema& schema() const { return schema_; }

private:
    static bool IsBlank(std::string_view record) {
        return record.find_first_not_of(" \t\r") == std::string_view::npos;
    }

    RecordSchema schema_;
};

}  // namespace llm_fanout
