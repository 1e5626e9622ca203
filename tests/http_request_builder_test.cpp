// SPDX-License-Identifier: MIT

// tests/http_request_builder_test.cpp
#include <gtest/gtest.h>

#include <array>
#include <iterator>
#include <string>

#include "lib/stream/http_request_builder.hpp"

using namespace llm_fanout;

TEST(HttpRequestBuilderTest, GetWithoutBody) {
    std::string out;
    auto builder = HttpRequestBuilder(std::back_inserter(out));
    builder.Method("GET").Path("/api/tags").EndRequestLine().Host("localhost:11434");
    builder.Finish();

    EXPECT_EQ(out,
              "GET /api/tags HTTP/1.1\r\n"
              "Host: localhost:11434\r\n"
              "\r\n");
}

TEST(HttpRequestBuilderTest, EmptyPathBecomesRoot) {
    std::string out;
    auto builder = HttpRequestBuilder(std::back_inserter(out));
    builder.Method("GET").Path("").EndRequestLine();
    builder.Finish();

    EXPECT_EQ(out, "GET / HTTP/1.1\r\n\r\n");
}

TEST(HttpRequestBuilderTest, PostWithBody) {
    std::string out;
    HttpRequestBuilder(std::back_inserter(out))
        .Method("POST")
        .Path("/api/generate")
        .EndRequestLine()
        .Host("localhost:11434")
        .Header("Accept", "application/x-ndjson")
        .Body("application/json", R"({"a":1})");

    EXPECT_EQ(out,
              "POST /api/generate HTTP/1.1\r\n"
              "Host: localhost:11434\r\n"
              "Accept: application/x-ndjson\r\n"
              "Content-Type: application/json\r\n"
              "Content-Length: 7\r\n"
              "\r\n"
              R"({"a":1})");
}

TEST(HttpRequestBuilderTest, HeadersWithoutExplicitRequestLineEnd) {
    std::string out;
    auto builder = HttpRequestBuilder(std::back_inserter(out));
    builder.Method("GET").Path("/x").Header("Connection", "close");
    builder.Finish();

    EXPECT_EQ(out, "GET /x HTTP/1.1\r\nConnection: close\r\n\r\n");
}

TEST(HttpRequestBuilderTest, FinishAfterBodyAddsNothing) {
    std::string out;
    auto builder = HttpRequestBuilder(std::back_inserter(out));
    builder.Method("POST").Path("/").EndRequestLine().Body("text/plain", "hi");
    builder.Finish();

    EXPECT_TRUE(out.ends_with("\r\n\r\nhi"));
}

TEST(HttpRequestBuilderTest, WritesToRawBuffer) {
    std::array<char, 64> buf{};
    auto builder = HttpRequestBuilder(buf.data());
    builder.Method("GET").Path("/").EndRequestLine();
    builder.Finish();

    size_t len = static_cast<size_t>(builder.GetIterator() - buf.data());
    EXPECT_EQ(std::string(buf.data(), len), "GET / HTTP/1.1\r\n\r\n");
}
