// SPDX-License-Identifier: MIT

// src/config.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"
#include "src/event_parser.hpp"
#include "src/line_decoder.hpp"

namespace llm_fanout {

/// Backend HTTP endpoint.
struct Endpoint {
    std::string host = "localhost";
    uint16_t port = 11434;
    std::string path = "/api/generate";

    /// Value for the Host header ("host" or "host:port").
    std::string HostHeader() const;
};

/// Parse "http://host[:port][/path]". The scheme is optional; https is
/// rejected since the transport is plain TCP. IPv6 literals go in
/// brackets: "http://[::1]:11434/api/generate".
std::expected<Endpoint, Error> ParseEndpoint(std::string_view url);

/// Independent per-phase deadlines. Zero disables a deadline.
struct Timeouts {
    std::chrono::milliseconds connect{10'000};  ///< DNS + TCP connect
    std::chrono::milliseconds read{0};          ///< Inactivity between chunks
    std::chrono::milliseconds write{60'000};    ///< Sending the request
    std::chrono::milliseconds pool{15'000};     ///< Waiting for a pooled connection

    /// Local inference: generation may pause arbitrarily long, so reads are
    /// unbounded while connecting, writing and pooling stay bounded.
    static Timeouts LocalInferenceDefaults() { return Timeouts{}; }
};

/// Connection pool limits.
struct PoolConfig {
    /// Cap on open connections, idle or leased. 0 means no cap beyond the
    /// concurrency limit.
    size_t max_connections = 0;
    /// Idle keep-alive connections retained for reuse.
    size_t max_idle = 8;
};

struct OrchestratorConfig {
    Endpoint endpoint;
    Timeouts timeouts = Timeouts::LocalInferenceDefaults();
    PoolConfig pool;
    /// Maximum number of tasks holding a permit at once.
    size_t concurrency_limit = 3;
    /// Cancel outstanding tasks on the first failure.
    bool fail_fast = false;
    DecoderConfig decoder;
    RecordSchema schema;
    /// Overall wall-clock bound for RunBlocking; expiry cancels the run.
    std::optional<std::chrono::milliseconds> deadline;
};

/// Reject configurations no run could start with.
std::expected<void, Error> Validate(const OrchestratorConfig& config);

}  // namespace llm_fanout
