// SPDX-License-Identifier: MIT

// src/logging.hpp
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace llm_fanout {

/// Diagnostic logger ("llm_fanout", stderr). Created on first use.
/// Generated text never goes here; it goes to the OutputSink.
std::shared_ptr<spdlog::logger> Log();

void SetLogLevel(spdlog::level::level_enum level);

}  // namespace llm_fanout
