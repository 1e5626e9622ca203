// SPDX-License-Identifier: MIT

// tests/generate_request_test.cpp
#include <gtest/gtest.h>

#include <string>

#include "src/generate_request.hpp"

using namespace llm_fanout;

TEST(GenerateRequestTest, BodyFields) {
    EXPECT_EQ(BuildGenerateBody(Target{"llama3", "Why is the sky blue?", 0}),
              R"({"model":"llama3","prompt":"Why is the sky blue?","stream":true})");
}

TEST(GenerateRequestTest, BodyEscapesPrompt) {
    EXPECT_EQ(BuildGenerateBody(Target{"m", "say \"hi\"\n\\", 0}),
              R"({"model":"m","prompt":"say \"hi\"\n\\","stream":true})");
}

TEST(GenerateRequestTest, RequestFormat) {
    Endpoint endpoint;
    Target target{"llama3", "hi", 0};
    std::string body = BuildGenerateBody(target);

    std::string expected =
        "POST /api/generate HTTP/1.1\r\n"
        "Host: localhost:11434\r\n"
        "User-Agent: llm-fanout/1.0\r\n"
        "Accept: application/x-ndjson\r\n"
        "Connection: keep-alive\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body;

    EXPECT_EQ(BuildGenerateRequest(endpoint, target), expected);
}

TEST(GenerateRequestTest, CustomEndpoint) {
    auto endpoint = ParseEndpoint("http://gpu-box/v1/generate");
    ASSERT_TRUE(endpoint.has_value());
    std::string request = BuildGenerateRequest(*endpoint, Target{"m", "p", 0});
    EXPECT_EQ(request.rfind("POST /v1/generate HTTP/1.1\r\nHost: gpu-box\r\n", 0), 0u);
}
