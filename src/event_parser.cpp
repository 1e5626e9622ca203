// SPDX-License-Identifier: MIT

// src/event_parser.cpp
#include "src/event_parser.hpp"

#include <string>

#include "lib/stream/json_parser.hpp"

namespace llm_fanout {

namespace {

// Collects the top-level fields of one record object. Nested values are
// skipped except for counting the elements of the "context" array.
class RecordBuilder {
public:
    using Result = ParsedRecord;

    explicit RecordBuilder(const RecordSchema& schema) : schema_(schema) {}

    void OnKey(std::string_view key) {
        if (depth_ == 1) key_.assign(key);
    }

    void OnString(std::string_view value) {
        if (!BeginValue()) {
            if (InContextArray()) ++result_.metadata.context_tokens;
            return;
        }
        if (key_ == schema_.text_field) {
            result_.text.emplace(value);
        } else if (key_ == schema_.error_field) {
            result_.error.emplace(value.empty() ? "backend reported an error" : value);
        } else if (key_ == schema_.done_field) {
            Reject("field '" + key_ + "' must be a boolean");
        } else if (key_ == "model") {
            result_.metadata.model.emplace(value);
        } else if (key_ == "done_reason") {
            result_.metadata.done_reason.emplace(value);
        }
    }

    void OnInt(int64_t value) {
        if (!BeginValue()) {
            if (InContextArray()) ++result_.metadata.context_tokens;
            return;
        }
        if (CheckNotTextual()) {
            if (value >= 0) SetCounter(static_cast<uint64_t>(value));
        }
    }

    void OnUint(uint64_t value) {
        if (!BeginValue()) {
            if (InContextArray()) ++result_.metadata.context_tokens;
            return;
        }
        if (CheckNotTextual()) SetCounter(value);
    }

    void OnDouble(double) {
        if (!BeginValue()) {
            if (InContextArray()) ++result_.metadata.context_tokens;
            return;
        }
        CheckNotTextual();
    }

    void OnBool(bool value) {
        if (!BeginValue()) return;
        if (key_ == schema_.done_field) {
            result_.done = value;
        } else {
            CheckNotTextual();
        }
    }

    void OnNull() {
        // null counts as absent for every field
        BeginValue();
    }

    void OnStartObject() {
        if (depth_ == 0) {
            is_object_ = true;
        } else if (depth_ == 1) {
            NestedValue();
        }
        ++depth_;
    }

    void OnEndObject() { --depth_; }

    void OnStartArray() {
        if (depth_ == 0) {
            Reject("record is not a JSON object");
        } else if (depth_ == 1) {
            in_context_ = key_ == "context";
            NestedValue();
        }
        ++depth_;
    }

    void OnEndArray() {
        --depth_;
        if (depth_ == 1) in_context_ = false;
    }

    std::expected<ParsedRecord, std::string> Build() {
        if (!is_object_ && error_.empty()) {
            return std::unexpected(std::string("record is not a JSON object"));
        }
        if (!error_.empty()) return std::unexpected(error_);
        return std::move(result_);
    }

private:
    // True if the value sits directly in the record object.
    bool BeginValue() {
        if (depth_ == 0) {
            Reject("record is not a JSON object");
            return false;
        }
        return depth_ == 1;
    }

    bool InContextArray() const { return in_context_ && depth_ == 2; }

    // Nested object or array under a top-level key.
    void NestedValue() {
        if (key_ == schema_.error_field) {
            result_.error.emplace("backend reported an error");
        } else if (key_ == schema_.text_field || key_ == schema_.done_field) {
            Reject("field '" + key_ + "' has the wrong type");
        }
    }

    bool CheckNotTextual() {
        if (key_ == schema_.text_field || key_ == schema_.done_field) {
            Reject("field '" + key_ + "' has the wrong type");
            return false;
        }
        if (key_ == schema_.error_field) {
            result_.error.emplace("backend reported an error");
            return false;
        }
        return true;
    }

    void SetCounter(uint64_t value) {
        auto& m = result_.metadata;
        if (key_ == "total_duration") m.total_duration_ns = value;
        else if (key_ == "load_duration") m.load_duration_ns = value;
        else if (key_ == "prompt_eval_count") m.prompt_eval_count = value;
        else if (key_ == "prompt_eval_duration") m.prompt_eval_duration_ns = value;
        else if (key_ == "eval_count") m.eval_count = value;
        else if (key_ == "eval_duration") m.eval_duration_ns = value;
    }

    void Reject(std::string reason) {
        if (error_.empty()) error_ = std::move(reason);
    }

    const RecordSchema& schema_;
    ParsedRecord result_;
    std::string key_;
    std::string error_;
    int depth_ = 0;
    bool is_object_ = false;
    bool in_context_ = false;
};

static_assert(JsonBuilder<RecordBuilder>);

}  // namespace

std::expected<ParsedRecord, std::string> EventParser::ParseRecord(std::string_view record) const {
    RecordBuilder builder(schema_);
    return ParseJson(record, builder);
}

}  // namespace llm_fanout
