// SPDX-License-Identifier: MIT

// src/logging.cpp
#include "src/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace llm_fanout {

namespace {

constexpr const char* kLoggerName = "llm_fanout";

std::shared_ptr<spdlog::logger> CreateLogger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> Log() {
    static std::shared_ptr<spdlog::logger> logger = CreateLogger();
    return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
    Log()->set_level(level);
}

}  // namespace llm_fanout
