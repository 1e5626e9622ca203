// SPDX-License-Identifier: MIT

// tests/output_sink_test.cpp
#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "src/output_sink.hpp"

using namespace llm_fanout;

namespace {

struct Capture {
    std::vector<std::string> calls;

    OutputSink MakeSink(SinkFormat format = {}) {
        return OutputSink([this](std::string_view bytes) { calls.emplace_back(bytes); }, format);
    }

    std::string Joined() const {
        std::string out;
        for (const auto& c : calls) out += c;
        return out;
    }
};

}  // namespace

TEST(OutputSinkTest, HeaderAndFooterFormat) {
    Capture capture;
    OutputSink sink = capture.MakeSink();
    Target target{"llama3", "hi", 0};

    sink.WriteHeader(target);
    sink.Write(target, "Hello");
    sink.Write(target, " world");
    sink.WriteFooter(target);

    EXPECT_EQ(capture.Joined(), "\n=== llama3 (streaming) ===\n\nHello world\n\n");
    EXPECT_EQ(capture.calls.size(), 4);
    EXPECT_EQ(sink.WriteCount(), 4);
}

TEST(OutputSinkTest, HeadersDisabled) {
    Capture capture;
    OutputSink sink = capture.MakeSink(SinkFormat{.headers = false});
    Target target{"m", "p", 0};

    sink.WriteHeader(target);
    sink.Write(target, "abc");
    sink.WriteFooter(target);

    EXPECT_EQ(capture.Joined(), "abc");
    EXPECT_EQ(sink.WriteCount(), 1);
}

TEST(OutputSinkTest, EmptyFragmentWritesNothing) {
    Capture capture;
    OutputSink sink = capture.MakeSink();
    sink.Write(Target{"m", "p", 0}, "");
    EXPECT_TRUE(capture.calls.empty());
    EXPECT_EQ(sink.WriteCount(), 0);
}

TEST(OutputSinkTest, LabelledFragments) {
    Capture capture;
    OutputSink sink = capture.MakeSink(SinkFormat{.headers = false, .label_fragments = true});

    sink.Write(Target{"mistral", "p", 2}, "token");
    ASSERT_EQ(capture.calls.size(), 1);
    EXPECT_EQ(capture.calls[0], "[#2 mistral] token");
}

TEST(OutputSinkTest, ForFileWritesThroughStdio) {
    std::FILE* file = std::tmpfile();
    ASSERT_NE(file, nullptr);
    {
        OutputSink sink = OutputSink::ForFile(file, SinkFormat{.headers = false});
        sink.Write(Target{"m", "p", 0}, "flushed");
    }
    std::rewind(file);
    char buf[32] = {};
    size_t n = std::fread(buf, 1, sizeof(buf), file);
    std::fclose(file);
    EXPECT_EQ(std::string(buf, n), "flushed");
}

TEST(OutputSinkTest, MovedSinkKeepsWriter) {
    Capture capture;
    OutputSink original = capture.MakeSink(SinkFormat{.headers = false});
    OutputSink moved(std::move(original));
    moved.Write(Target{"m", "p", 0}, "x");
    EXPECT_EQ(capture.Joined(), "x");
}

// Each call's bytes arrive intact: a writer that copies byte by byte would
// expose interleaving if two calls overlapped.
TEST(OutputSinkTest, ConcurrentWritesNeverInterleave) {
    constexpr int kThreads = 8;
    constexpr int kWritesPerThread = 500;

    std::string output;
    OutputSink sink(
        [&](std::string_view bytes) {
            for (char c : bytes) {
                output.push_back(c);
                if (c == '|') std::this_thread::yield();
            }
        },
        SinkFormat{.headers = false});

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&sink, t] {
            Target target{fmt::format("m{}", t), "p", static_cast<size_t>(t)};
            std::string record = fmt::format("<{}|{}|{}>", t, t, t);
            for (int i = 0; i < kWritesPerThread; ++i) sink.Write(target, record);
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(sink.WriteCount(), static_cast<size_t>(kThreads * kWritesPerThread));

    size_t pos = 0;
    size_t records = 0;
    while (pos < output.size()) {
        ASSERT_EQ(output[pos], '<') << "at offset " << pos;
        size_t end = output.find('>', pos);
        ASSERT_NE(end, std::string::npos);
        std::string_view record(output.data() + pos + 1, end - pos - 1);
        ASSERT_EQ(record.size(), 5u) << record;
        EXPECT_EQ(record[0], record[2]);
        EXPECT_EQ(record[0], record[4]);
        pos = end + 1;
        ++records;
    }
    EXPECT_EQ(records, static_cast<size_t>(kThreads * kWritesPerThread));
}
