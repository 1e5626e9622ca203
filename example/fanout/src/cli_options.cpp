// SPDX-License-Identifier: MIT

#include "fanout/cli_options.hpp"

#include <getopt.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <utility>

#include <fmt/format.h>

namespace fanout {

namespace {

enum LongOnly {
    kConnectTimeout = 256,
    kReadTimeout,
    kWriteTimeout,
    kPoolTimeout,
    kDeadline,
    kFailFast,
    kLabel,
    kNoHeaders,
    kDiscardTail,
};

const option kLongOptions[] = {
    {"concurrency", required_argument, nullptr, 'c'},
    {"model", required_argument, nullptr, 'm'},
    {"prompt", required_argument, nullptr, 'p'},
    {"url", required_argument, nullptr, 'u'},
    {"connect-timeout", required_argument, nullptr, kConnectTimeout},
    {"read-timeout", required_argument, nullptr, kReadTimeout},
    {"write-timeout", required_argument, nullptr, kWriteTimeout},
    {"pool-timeout", required_argument, nullptr, kPoolTimeout},
    {"deadline", required_argument, nullptr, kDeadline},
    {"fail-fast", no_argument, nullptr, kFailFast},
    {"label", no_argument, nullptr, kLabel},
    {"no-headers", no_argument, nullptr, kNoHeaders},
    {"discard-tail", no_argument, nullptr, kDiscardTail},
    {"verbose", no_argument, nullptr, 'v'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

std::expected<std::chrono::milliseconds, std::string> ParseSeconds(std::string_view flag,
                                                                   std::string_view value) {
    double seconds = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ec != std::errc{} || ptr != value.data() + value.size() ||
        !std::isfinite(seconds) || seconds < 0) {
        return std::unexpected(fmt::format("--{}: expected seconds >= 0, got '{}'", flag, value));
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

}  // namespace

std::expected<CliOptions, std::string> ParseArgs(int argc, char* argv[]) {
    CliOptions opts;
    opts.config.timeouts = llm_fanout::Timeouts::LocalInferenceDefaults();
    std::string url(kDefaultUrl);

    // Full re-initialization, so the parser can run more than once
    optind = 0;
    opterr = 0;

    int opt;
    int long_index = 0;
    while ((opt = getopt_long(argc, argv, ":c:m:p:u:vh", kLongOptions, &long_index)) != -1) {
        std::string_view arg = optarg ? std::string_view(optarg) : std::string_view();
        switch (opt) {
            case 'c': {
                size_t limit = 0;
                auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), limit);
                if (ec != std::errc{} || ptr != arg.data() + arg.size() || limit == 0) {
                    return std::unexpected(
                        fmt::format("--concurrency: expected an integer >= 1, got '{}'", arg));
                }
                opts.config.concurrency_limit = limit;
                break;
            }
            case 'm':
                if (arg.empty()) {
                    return std::unexpected(std::string("--model: name must not be empty"));
                }
                opts.models.emplace_back(arg);
                break;
            case 'p':
                opts.prompt = std::string(arg);
                break;
            case 'u':
                url = std::string(arg);
                break;
            case kConnectTimeout:
            case kReadTimeout:
            case kWriteTimeout:
            case kPoolTimeout:
            case kDeadline: {
                std::string_view flag = kLongOptions[long_index].name;
                auto ms = ParseSeconds(flag, arg);
                if (!ms) return std::unexpected(ms.error());
                if (opt == kConnectTimeout) opts.config.timeouts.connect = *ms;
                if (opt == kReadTimeout) opts.config.timeouts.read = *ms;
                if (opt == kWriteTimeout) opts.config.timeouts.write = *ms;
                if (opt == kPoolTimeout) opts.config.timeouts.pool = *ms;
                if (opt == kDeadline) {
                    if (ms->count() == 0) {
                        return std::unexpected(std::string("--deadline: must be > 0"));
                    }
                    opts.config.deadline = *ms;
                }
                break;
            }
            case kFailFast:
                opts.config.fail_fast = true;
                break;
            case kLabel:
                opts.sink.label_fragments = true;
                break;
            case kNoHeaders:
                opts.sink.headers = false;
                break;
            case kDiscardTail:
                opts.config.decoder.tail_policy = llm_fanout::TailPolicy::Discard;
                break;
            case 'v':
                opts.verbose = true;
                break;
            case 'h':
                opts.show_help = true;
                return opts;
            case ':':
                return std::unexpected(fmt::format("option '{}' requires an argument",
                                                   argv[optind - 1]));
            default:
                return std::unexpected(fmt::format("unknown option '{}'", argv[optind - 1]));
        }
    }

    if (optind < argc) {
        return std::unexpected(fmt::format("unexpected argument '{}'", argv[optind]));
    }
    if (opts.models.empty()) {
        return std::unexpected(std::string("at least one --model is required"));
    }

    auto endpoint = llm_fanout::ParseEndpoint(url);
    if (!endpoint) return std::unexpected(endpoint.error().message);
    opts.config.endpoint = std::move(*endpoint);

    if (opts.prompt) {
        opts.prompt = CollapseWhitespace(*opts.prompt);
    }
    return opts;
}

std::string Usage(std::string_view program) {
    return fmt::format(
        "Usage: {} -m MODEL [-m MODEL ...] [-p PROMPT] [options]\n"
        "\n"
        "Stream one prompt to several models concurrently.\n"
        "The prompt is read from stdin when -p is not given.\n"
        "\n"
        "  -c, --concurrency N      streams open at once (default 3)\n"
        "  -m, --model NAME         target model, repeatable\n"
        "  -p, --prompt TEXT        prompt text\n"
        "  -u, --url URL            generate endpoint (default {})\n"
        "      --connect-timeout S  connect deadline in seconds (default 10)\n"
        "      --read-timeout S     inactivity deadline while streaming (default 0, unbounded)\n"
        "      --write-timeout S    request send deadline (default 60)\n"
        "      --pool-timeout S     wait for a pooled connection (default 15)\n"
        "      --deadline S         cancel whatever is still running after S seconds\n"
        "      --fail-fast          cancel all targets on the first failure\n"
        "      --label              prefix each fragment with [#index model]\n"
        "      --no-headers         omit per-model banners\n"
        "      --discard-tail       drop an unterminated final record\n"
        "  -v, --verbose            debug logging\n"
        "  -h, --help               show this help\n",
        program, kDefaultUrl);
}

std::string CollapseWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

int ExitCodeFor(const llm_fanout::RunReport& report) {
    return report.AllSucceeded() ? kExitSuccess : kExitTaskFailed;
}

}  // namespace fanout
