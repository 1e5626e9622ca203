// SPDX-License-Identifier: MIT

// src/target.hpp
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace llm_fanout {

/// One (model, prompt) pair to stream.
///
/// `index` is the position in the run's input sequence and identifies the
/// target in results; model names may repeat.
struct Target {
    std::string model;
    std::string prompt;
    size_t index = 0;
};

/// Build one target per model, all sharing `prompt`, indexed in order.
inline std::vector<Target> MakeTargets(const std::vector<std::string>& models,
                                       std::string_view prompt) {
    std::vector<Target> targets;
    targets.reserve(models.size());
    for (const auto& model : models) {
        targets.push_back(Target{model, std::string(prompt), targets.size()});
    }
    return targets;
}

}  // namespace llm_fanout
