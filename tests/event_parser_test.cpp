// SPDX-License-Identifier: MIT

// tests/event_parser_test.cpp
#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

#include "src/event_parser.hpp"
#include "src/line_decoder.hpp"

using namespace llm_fanout;

namespace {

std::vector<Event> ParseOne(std::string_view record, const EventParser& parser = EventParser()) {
    std::vector<Event> events;
    parser.Parse(record, [&](Event&& e) { events.push_back(std::move(e)); });
    return events;
}

}  // namespace

TEST(EventParserTest, EmptyRecordYieldsNothing) {
    EXPECT_TRUE(ParseOne("").empty());
    EXPECT_TRUE(ParseOne("   ").empty());
}

TEST(EventParserTest, ResponseFieldYieldsFragment) {
    auto events = ParseOne(R"({"model":"llama3","response":"Hello","done":false})");
    ASSERT_EQ(events.size(), 1);
    auto* fragment = std::get_if<FragmentEvent>(&events[0]);
    ASSERT_NE(fragment, nullptr);
    EXPECT_EQ(fragment->text, "Hello");
}

TEST(EventParserTest, EmptyResponseIsStillAFragment) {
    auto events = ParseOne(R"({"response":""})");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(std::get<FragmentEvent>(events[0]).text, "");
}

TEST(EventParserTest, EscapedTextIsDecoded) {
    auto events = ParseOne(R"({"response":"a\nb \"c\" é"})");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(std::get<FragmentEvent>(events[0]).text, "a\nb \"c\" \xc3\xa9");
}

TEST(EventParserTest, DoneFollowsFragmentOfSameRecord) {
    auto events = ParseOne(R"({"response":"!","done":true})");
    ASSERT_EQ(events.size(), 2);
    EXPECT_TRUE(std::holds_alternative<FragmentEvent>(events[0]));
    EXPECT_TRUE(std::holds_alternative<DoneEvent>(events[1]));
}

TEST(EventParserTest, DoneRecordCarriesMetadata) {
    auto events = ParseOne(
        R"({"model":"llama3","created_at":"2024-01-01T00:00:00Z","response":"",)"
        R"("done":true,"done_reason":"stop","context":[1,2,3,4],)"
        R"("total_duration":5000000000,"load_duration":1000000,)"
        R"("prompt_eval_count":26,"prompt_eval_duration":130000000,)"
        R"("eval_count":290,"eval_duration":4000000000})");
    ASSERT_EQ(events.size(), 2);
    const auto& done = std::get<DoneEvent>(events[1]);
    const DoneMetadata& m = done.metadata;

    EXPECT_EQ(m.model, "llama3");
    EXPECT_EQ(m.done_reason, "stop");
    EXPECT_EQ(m.total_duration_ns, 5000000000u);
    EXPECT_EQ(m.load_duration_ns, 1000000u);
    EXPECT_EQ(m.prompt_eval_count, 26u);
    EXPECT_EQ(m.prompt_eval_duration_ns, 130000000u);
    EXPECT_EQ(m.eval_count, 290u);
    EXPECT_EQ(m.eval_duration_ns, 4000000000u);
    EXPECT_EQ(m.context_tokens, 4);
    ASSERT_TRUE(m.TokensPerSecond().has_value());
    EXPECT_DOUBLE_EQ(*m.TokensPerSecond(), 72.5);
}

TEST(EventParserTest, DoneFalseYieldsOnlyFragment) {
    auto events = ParseOne(R"({"response":"x","done":false})");
    ASSERT_EQ(events.size(), 1);
    EXPECT_TRUE(std::holds_alternative<FragmentEvent>(events[0]));
}

TEST(EventParserTest, ErrorFieldIsBackendError) {
    auto events = ParseOne(R"({"error":"model requires more system memory"})");
    ASSERT_EQ(events.size(), 1);
    const auto& error = std::get<ErrorEvent>(events[0]).error;
    EXPECT_EQ(error.code, ErrorCode::BackendError);
    EXPECT_EQ(error.message, "model requires more system memory");
}

TEST(EventParserTest, ErrorTakesPrecedenceOverDone) {
    auto events = ParseOne(R"({"error":"boom","done":true})");
    ASSERT_EQ(events.size(), 1);
    EXPECT_TRUE(std::holds_alternative<ErrorEvent>(events[0]));
}

TEST(EventParserTest, UnknownObjectYieldsNothing) {
    EXPECT_TRUE(ParseOne(R"({"status":"pulling manifest"})").empty());
    EXPECT_TRUE(ParseOne(R"({})").empty());
}

TEST(EventParserTest, NullFieldsCountAsAbsent) {
    EXPECT_TRUE(ParseOne(R"({"response":null,"done":null,"error":null})").empty());
}

TEST(EventParserTest, InvalidJsonIsMalformed) {
    auto events = ParseOne(R"({"response":"unterminated)");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(std::get<ErrorEvent>(events[0]).error.code, ErrorCode::MalformedRecord);
}

TEST(EventParserTest, NonObjectIsMalformed) {
    for (std::string_view record : {"[1,2]", "\"text\"", "42", "true", "null"}) {
        auto events = ParseOne(record);
        ASSERT_EQ(events.size(), 1) << record;
        EXPECT_EQ(std::get<ErrorEvent>(events[0]).error.code, ErrorCode::MalformedRecord)
            << record;
    }
}

TEST(EventParserTest, WrongFieldTypesAreMalformed) {
    for (std::string_view record : {R"({"response":42})", R"({"response":["a"]})",
                                    R"({"done":"yes"})", R"({"done":1})"}) {
        auto events = ParseOne(record);
        ASSERT_EQ(events.size(), 1) << record;
        EXPECT_EQ(std::get<ErrorEvent>(events[0]).error.code, ErrorCode::MalformedRecord)
            << record;
    }
}

TEST(EventParserTest, NestedKeysDoNotShadowTopLevel) {
    auto events = ParseOne(R"({"options":{"response":"inner","done":true},"response":"outer"})");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(std::get<FragmentEvent>(events[0]).text, "outer");
}

TEST(EventParserTest, CustomSchema) {
    EventParser parser(RecordSchema{"text", "finished", "failure"});

    auto fragment = ParseOne(R"({"text":"hi","response":"ignored"})", parser);
    ASSERT_EQ(fragment.size(), 1);
    EXPECT_EQ(std::get<FragmentEvent>(fragment[0]).text, "hi");

    auto done = ParseOne(R"({"finished":true})", parser);
    ASSERT_EQ(done.size(), 1);
    EXPECT_TRUE(std::holds_alternative<DoneEvent>(done[0]));

    auto failure = ParseOne(R"({"failure":"x"})", parser);
    ASSERT_EQ(failure.size(), 1);
    EXPECT_EQ(std::get<ErrorEvent>(failure[0]).error.code, ErrorCode::BackendError);
}

// Keep-alive lines between records decode to nothing: a stream of only
// blank lines plus a terminal record produces exactly one Done.
TEST(EventParserTest, BlankLinesThenDoneThroughDecoder) {
    LineDecoder decoder;
    EventParser parser;
    size_t fragments = 0;
    size_t dones = 0;
    size_t errors = 0;

    auto on_record = [&](std::string_view record) {
        parser.Parse(record, [&](Event&& e) {
            if (std::holds_alternative<FragmentEvent>(e)) ++fragments;
            if (std::holds_alternative<DoneEvent>(e)) ++dones;
            if (std::holds_alternative<ErrorEvent>(e)) ++errors;
        });
    };
    ASSERT_TRUE(decoder.Feed("\n\n\r\n\n{\"done\":true}\n", on_record));
    decoder.Finish(on_record);

    EXPECT_EQ(fragments, 0);
    EXPECT_EQ(dones, 1);
    EXPECT_EQ(errors, 0);
}
