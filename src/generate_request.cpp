// SPDX-License-Identifier: MIT

// src/generate_request.cpp
#include "src/generate_request.hpp"

#include <iterator>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "lib/stream/http_request_builder.hpp"

namespace llm_fanout {

std::string BuildGenerateBody(const Target& target) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("model");
    writer.String(target.model.data(), static_cast<rapidjson::SizeType>(target.model.size()));
    writer.Key("prompt");
    writer.String(target.prompt.data(), static_cast<rapidjson::SizeType>(target.prompt.size()));
    writer.Key("stream");
    writer.Bool(true);
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string BuildGenerateRequest(const Endpoint& endpoint, const Target& target) {
    std::string body = BuildGenerateBody(target);

    std::string request;
    request.reserve(256 + body.size());
    HttpRequestBuilder(std::back_inserter(request))
        .Method("POST")
        .Path(endpoint.path)
        .EndRequestLine()
        .Host(endpoint.HostHeader())
        .Header("User-Agent", "llm-fanout/1.0")
        .Header("Accept", "application/x-ndjson")
        .Header("Connection", "keep-alive")
        .Body("application/json", body);
    return request;
}

}  // namespace llm_fanout
