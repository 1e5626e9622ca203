// SPDX-License-Identifier: MIT

#include <cstdio>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "fanout/cli_options.hpp"
#include "src/logging.hpp"
#include "src/orchestrator.hpp"
#include "src/target.hpp"

using namespace llm_fanout;

namespace {

void PrintSummary(const RunReport& report) {
    fmt::print(stderr, "\n--- {} targets, {} failed ---\n", report.results.size(),
               report.FailureCount());
    for (const auto& result : report.results) {
        const Target& target = result.target;
        if (result.ok()) {
            std::string rate;
            if (result.metadata) {
                if (auto tps = result.metadata->TokensPerSecond()) {
                    rate = fmt::format(", {:.1f} tok/s", *tps);
                }
            }
            fmt::print(stderr, "#{:<3} {:<28} ok      {} fragments, {} ms{}\n", target.index,
                       target.model, result.fragment_count, result.elapsed.count(), rate);
        } else {
            const Error& cause = result.outcome.cause();
            fmt::print(stderr, "#{:<3} {:<28} FAILED  {}: {}\n", target.index, target.model,
                       error_name(cause.code), cause.message);
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto opts = fanout::ParseArgs(argc, argv);
    if (!opts) {
        fmt::print(stderr, "error: {}\n\n{}", opts.error(), fanout::Usage(argv[0]));
        return fanout::kExitUsage;
    }
    if (opts->show_help) {
        fmt::print("{}", fanout::Usage(argv[0]));
        return fanout::kExitSuccess;
    }

    SetLogLevel(opts->verbose ? spdlog::level::debug : spdlog::level::info);

    std::string prompt;
    if (opts->prompt) {
        prompt = *opts->prompt;
    } else {
        std::string input((std::istreambuf_iterator<char>(std::cin)),
                          std::istreambuf_iterator<char>());
        prompt = fanout::CollapseWhitespace(input);
    }
    if (prompt.empty()) {
        fmt::print(stderr, "error: empty prompt\n");
        return fanout::kExitUsage;
    }

    auto sink = OutputSink::ForFile(stdout, opts->sink);
    auto targets = MakeTargets(opts->models, prompt);

    auto report = RunBlocking(opts->config, std::move(targets), sink);
    if (!report) {
        Log()->error("run failed to start: {}", report.error().message);
        return fanout::kExitUsage;
    }

    PrintSummary(*report);
    return fanout::ExitCodeFor(*report);
}
