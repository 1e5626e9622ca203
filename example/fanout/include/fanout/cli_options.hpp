// SPDX-License-Identifier: MIT

#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "src/config.hpp"
#include "src/output_sink.hpp"
#include "src/task_result.hpp"

namespace fanout {

constexpr int kExitSuccess = 0;
constexpr int kExitTaskFailed = 1;
constexpr int kExitUsage = 2;

constexpr std::string_view kDefaultUrl = "http://localhost:11434/api/generate";

struct CliOptions {
    llm_fanout::OrchestratorConfig config;
    llm_fanout::SinkFormat sink;
    std::vector<std::string> models;
    std::optional<std::string> prompt;  // read from stdin when unset
    bool verbose = false;
    bool show_help = false;
};

// Parse the command line. Returns a message suitable for stderr on error.
std::expected<CliOptions, std::string> ParseArgs(int argc, char* argv[]);

std::string Usage(std::string_view program);

// Collapse every whitespace run to one space and trim both ends.
std::string CollapseWhitespace(std::string_view text);

// 0 if every task succeeded, 1 otherwise.
int ExitCodeFor(const llm_fanout::RunReport& report);

}  // namespace fanout
