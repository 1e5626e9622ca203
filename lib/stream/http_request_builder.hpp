// SPDX-License-Identifier: MIT

// lib/stream/http_request_builder.hpp
#pragma once

#include <iterator>
#include <string_view>

#include <fmt/format.h>

namespace llm_fanout {

// HttpRequestBuilder - Builds HTTP/1.1 requests to any output iterator
//
// Template parameter OutputIt must be an output iterator accepting char.
// Examples: std::back_insert_iterator<std::string>, char*
//
// Usage:
//   std::string out;
//   HttpRequestBuilder(std::back_inserter(out))
//       .Method("POST")
//       .Path("/api/generate")
//       .Host("localhost:11434")
//       .Header("Accept", "application/x-ndjson")
//       .Body("application/json", body);
//
template<typename OutputIt>
class HttpRequestBuilder {
public:
    explicit HttpRequestBuilder(OutputIt out) : out_(out) {}

    // Set HTTP method (GET, POST, etc.)
    HttpRequestBuilder& Method(std::string_view method) {
        out_ = fmt::format_to(out_, "{}", method);
        return *this;
    }

    // Set request path (e.g., "/api/generate")
    HttpRequestBuilder& Path(std::string_view path) {
        out_ = fmt::format_to(out_, " {}", path.empty() ? std::string_view("/") : path);
        return *this;
    }

    // End the request line and start headers
    HttpRequestBuilder& EndRequestLine() {
        out_ = fmt::format_to(out_, " HTTP/1.1\r\n");
        headers_started_ = true;
        return *this;
    }

    // Add Host header
    HttpRequestBuilder& Host(std::string_view host) {
        EnsureHeadersStarted();
        out_ = fmt::format_to(out_, "Host: {}\r\n", host);
        return *this;
    }

    // Add arbitrary header
    HttpRequestBuilder& Header(std::string_view name, std::string_view value) {
        EnsureHeadersStarted();
        out_ = fmt::format_to(out_, "{}: {}\r\n", name, value);
        return *this;
    }

    // Add a body with Content-Type and Content-Length headers; terminates the request
    HttpRequestBuilder& Body(std::string_view content_type, std::string_view body) {
        EnsureHeadersStarted();
        out_ = fmt::format_to(out_, "Content-Type: {}\r\n", content_type);
        out_ = fmt::format_to(out_, "Content-Length: {}\r\n", body.size());
        out_ = fmt::format_to(out_, "\r\n");
        out_ = fmt::format_to(out_, "{}", body);
        body_written_ = true;
        return *this;
    }

    // Finish the request (writes final CRLF if no body)
    void Finish() {
        EnsureHeadersStarted();
        if (!body_written_) {
            out_ = fmt::format_to(out_, "\r\n");
        }
    }

    // Get current iterator position (for determining output size)
    OutputIt GetIterator() const { return out_; }

private:
    void EnsureHeadersStarted() {
        if (!headers_started_) {
            out_ = fmt::format_to(out_, " HTTP/1.1\r\n");
            headers_started_ = true;
        }
    }

    OutputIt out_;
    bool headers_started_ = false;
    bool body_written_ = false;
};

// Deduction guide
template<typename OutputIt>
HttpRequestBuilder(OutputIt) -> HttpRequestBuilder<OutputIt>;

}  // namespace llm_fanout
