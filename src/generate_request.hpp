// SPDX-License-Identifier: MIT

// src/generate_request.hpp
#pragma once

#include <string>

#include "src/config.hpp"
#include "src/target.hpp"

namespace llm_fanout {

/// JSON body of a streaming generate call:
/// {"model": ..., "prompt": ..., "stream": true}
std::string BuildGenerateBody(const Target& target);

/// Complete HTTP/1.1 POST request for `target`, asking for keep-alive.
std::string BuildGenerateRequest(const Endpoint& endpoint, const Target& target);

}  // namespace llm_fanout
