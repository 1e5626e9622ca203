// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace llm_fanout {

/// Error codes for transport, protocol and orchestration failures.
enum class ErrorCode {
    // Connect phase
    ConnectFailure,         ///< TCP connect refused, reset or timed out before any bytes were sent
    DnsResolutionFailed,    ///< Hostname could not be resolved
    PoolTimeout,            ///< No pooled connection became available in time

    // Write phase
    WriteFailure,           ///< Request could not be sent (error or write deadline)

    // Read phase
    ReadTimeout,            ///< No data within the read-phase deadline
    ConnectionClosedEarly,  ///< Stream ended without a terminal record

    // Protocol
    MalformedRecord,        ///< Non-empty record failed structured decoding
    BackendError,           ///< Backend sent an error record
    BufferOverflow,         ///< Record exceeded the decoder size limit
    HttpError,              ///< Unexpected HTTP status or malformed HTTP response
    NotFound,               ///< HTTP 404 (typically an unknown model)
    ServerError,            ///< HTTP 5xx

    // Orchestration
    Cancelled,              ///< Cancellation reached the task before it terminated
    InvalidConfig,          ///< Configuration rejected before any task started
    InvalidState,           ///< Method called in wrong state
};

/// Error payload delivered to OnError callbacks and task results.
struct Error {
    ErrorCode code;          ///< Classified error code
    std::string message;     ///< Human-readable description
    int os_errno = 0;        ///< OS errno if applicable, 0 otherwise
};

/// Return the code's enumerator name (e.g. "ReadTimeout").
constexpr std::string_view error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectFailure:        return "ConnectFailure";
        case ErrorCode::DnsResolutionFailed:   return "DnsResolutionFailed";
        case ErrorCode::PoolTimeout:           return "PoolTimeout";
        case ErrorCode::WriteFailure:          return "WriteFailure";
        case ErrorCode::ReadTimeout:           return "ReadTimeout";
        case ErrorCode::ConnectionClosedEarly: return "ConnectionClosedEarly";
        case ErrorCode::MalformedRecord:       return "MalformedRecord";
        case ErrorCode::BackendError:          return "BackendError";
        case ErrorCode::BufferOverflow:        return "BufferOverflow";
        case ErrorCode::HttpError:             return "HttpError";
        case ErrorCode::NotFound:              return "NotFound";
        case ErrorCode::ServerError:           return "ServerError";
        case ErrorCode::Cancelled:             return "Cancelled";
        case ErrorCode::InvalidConfig:         return "InvalidConfig";
        case ErrorCode::InvalidState:          return "InvalidState";
    }
    return "Unknown";
}

/// Return a short category string for an error code (e.g. "connect", "read").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectFailure:
        case ErrorCode::DnsResolutionFailed:
        case ErrorCode::PoolTimeout:
            return "connect";
        case ErrorCode::WriteFailure:
            return "write";
        case ErrorCode::ReadTimeout:
        case ErrorCode::ConnectionClosedEarly:
            return "read";
        case ErrorCode::MalformedRecord:
        case ErrorCode::BackendError:
        case ErrorCode::BufferOverflow:
            return "protocol";
        case ErrorCode::HttpError:
        case ErrorCode::NotFound:
        case ErrorCode::ServerError:
            return "http";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::InvalidConfig:
        case ErrorCode::InvalidState:
            return "state";
    }
    return "unknown";
}

}  // namespace llm_fanout
