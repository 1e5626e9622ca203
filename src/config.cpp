// SPDX-License-Identifier: MIT

// src/config.cpp
#include "src/config.hpp"

#include <charconv>

#include <fmt/format.h>

namespace llm_fanout {

std::string Endpoint::HostHeader() const {
    // IPv6 literals are bracketed
    std::string name = host.find(':') != std::string::npos ? fmt::format("[{}]", host) : host;
    if (port == 80) return name;
    return fmt::format("{}:{}", name, port);
}

std::expected<Endpoint, Error> ParseEndpoint(std::string_view url) {
    auto invalid = [&](std::string_view why) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
                                     fmt::format("invalid url '{}': {}", url, why)});
    };

    std::string_view rest = url;
    if (auto scheme_end = rest.find("://"); scheme_end != std::string_view::npos) {
        std::string_view scheme = rest.substr(0, scheme_end);
        if (scheme != "http") {
            return invalid(fmt::format("unsupported scheme '{}'", scheme));
        }
        rest.remove_prefix(scheme_end + 3);
    }

    Endpoint endpoint;
    endpoint.port = 80;

    std::string_view authority = rest;
    if (auto slash = rest.find('/'); slash != std::string_view::npos) {
        authority = rest.substr(0, slash);
        endpoint.path = std::string(rest.substr(slash));
    } else {
        endpoint.path = "/";
    }

    std::string_view host = authority;
    std::string_view port_str;
    bool has_port = false;
    if (authority.starts_with('[')) {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return invalid("unterminated IPv6 address");
        }
        host = authority.substr(1, close - 1);
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return invalid("junk after IPv6 address");
            port_str = after.substr(1);
            has_port = true;
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port_str = authority.substr(colon + 1);
        has_port = true;
    }

    if (has_port) {
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() ||
            port == 0 || port > 65535) {
            return invalid(fmt::format("bad port '{}'", port_str));
        }
        endpoint.port = static_cast<uint16_t>(port);
    }

    if (host.empty()) {
        return invalid("missing host");
    }
    endpoint.host = std::string(host);
    return endpoint;
}

std::expected<void, Error> Validate(const OrchestratorConfig& config) {
    if (config.concurrency_limit == 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
                                     "concurrency limit must be at least 1"});
    }
    if (config.endpoint.host.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, "endpoint host is empty"});
    }
    if (config.endpoint.port == 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, "endpoint port is 0"});
    }
    if (config.decoder.max_record_size == 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
                                     "max record size must be positive"});
    }
    if (config.schema.text_field.empty() || config.schema.done_field.empty() ||
        config.schema.error_field.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
                                     "record schema field names must be non-empty"});
    }
    if (config.timeouts.connect.count() < 0 || config.timeouts.read.count() < 0 ||
        config.timeouts.write.count() < 0 || config.timeouts.pool.count() < 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, "timeouts must not be negative"});
    }
    if (config.deadline && config.deadline->count() <= 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, "deadline must be positive"});
    }
    return {};
}

}  // namespace llm_fanout
