#include "cli.h"

#include "vaultrig/log.h"
#include "vaultrig/orchestrator.h"
#include "vaultrig/supervisor.h"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace vaultrig::cli {
namespace {

enum class ParseU64DecimalStatus {
    Ok,
    Empty,
    NonDecimal,
    Overflow,
};

struct ParseU64DecimalResult {
    std::uint64_t         value  = 0;
    ParseU64DecimalStatus status = ParseU64DecimalStatus::Ok;
};

ParseU64DecimalResult parse_u64_decimal_strict(std::string_view s) {
    if (s.empty())
        return ParseU64DecimalResult{0, ParseU64DecimalStatus::Empty};

    std::uint64_t v = 0;
    for (const char ch : s) {
        if (ch < '0' || ch > '9')
            return ParseU64DecimalResult{0, ParseU64DecimalStatus::NonDecimal};

        const std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        const std::uint64_t maxv  = static_cast<std::uint64_t>(-1);
        if (v > (maxv - digit) / 10)
            return ParseU64DecimalResult{0, ParseU64DecimalStatus::Overflow};
        v = v * 10 + digit;
    }

    return ParseU64DecimalResult{v, ParseU64DecimalStatus::Ok};
}

std::chrono::milliseconds to_ms(std::uint64_t value) {
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
}

} // namespace

void print_usage() {
    fmt::print("Usage: vaultrig [run] [options]\n");
    fmt::print("       vaultrig stop --pid-file <file> [--stop-timeout-ms N]\n");
    fmt::print("  --help                  Show this help\n");
    fmt::print("  --config <file>         JSON config file\n");
    fmt::print("  --base-dir <dir>        Directory relative paths resolve against (default: cwd)\n");
    fmt::print("  --sandbox <dir>         Sandbox directory (default: sandbox)\n");
    fmt::print("  --junit <file>          Write a JUnit report with one testcase per stage\n");
    fmt::print("  --readiness delay|probe Wait a fixed delay or probe the server port\n");
    fmt::print("  --settle-delay-ms N     Fixed delay after start (default 3000)\n");
    fmt::print("  --port N                Server port, applied to the config and the probe\n");
    fmt::print("  --probe-timeout-ms N    Give up probing after N ms\n");
    fmt::print("  --no-tls                Probe with a plain TCP connect\n");
    fmt::print("  --foreground            Keep the server as a child instead of a daemon\n");
    fmt::print("  --stop-timeout-ms N     Wait N ms after SIGINT before SIGKILL\n");
    fmt::print("  --test-timeout-ms N     Kill the test suite after N ms\n");
    fmt::print("  --no-coverage           Run without the coverage launcher\n");
    fmt::print("  --no-test-mode          Do not export the test mode variable\n");
    fmt::print("  --verbose               Debug logging\n");
    fmt::print("  --no-color              Disable colorized output (or set NO_COLOR/VAULTRIG_NO_COLOR)\n");
}

bool parse_cli(std::span<const char *> args, CliOptions &out_opt) {
    CliOptions opt{};

    enum class ValueMatch { No, Yes, Error };
    auto match_value = [&](std::size_t &i, std::string_view s, std::string_view opt_name, std::string_view &value) -> ValueMatch {
        if (s == opt_name) {
            if (i + 1 >= args.size() || !args[i + 1]) {
                fmt::print(stderr, "error: {} requires a value\n", opt_name);
                return ValueMatch::Error;
            }
            value = std::string_view(args[i + 1]);
            if (value.empty()) {
                fmt::print(stderr, "error: {} requires a non-empty value\n", opt_name);
                return ValueMatch::Error;
            }
            ++i;
            return ValueMatch::Yes;
        }
        if (s.rfind(opt_name, 0) == 0 && s.size() > opt_name.size() && s[opt_name.size()] == '=') {
            value = s.substr(opt_name.size() + 1);
            if (value.empty()) {
                fmt::print(stderr, "error: {} requires a non-empty value\n", opt_name);
                return ValueMatch::Error;
            }
            return ValueMatch::Yes;
        }
        return ValueMatch::No;
    };
    enum class OptionParseResult { NoMatch, Consumed, Error };
    auto parse_value_option = [&](std::size_t &i, std::string_view s, std::string_view opt_name, auto &&on_value) -> OptionParseResult {
        std::string_view value;
        switch (match_value(i, s, opt_name, value)) {
        case ValueMatch::Error: return OptionParseResult::Error;
        case ValueMatch::Yes:
            if (!on_value(value))
                return OptionParseResult::Error;
            return OptionParseResult::Consumed;
        case ValueMatch::No: return OptionParseResult::NoMatch;
        }
        return OptionParseResult::NoMatch;
    };

    auto set_unique_string_option = [&](const char *&out_value, std::string_view opt_name, std::string_view value) -> bool {
        if (out_value) {
            fmt::print(stderr, "error: duplicate {}\n", opt_name);
            return false;
        }
        out_value = value.data();
        return true;
    };

    auto set_u64_option = [&](std::optional<std::uint64_t> &out, std::string_view opt_name, std::string_view value) -> bool {
        if (out) {
            fmt::print(stderr, "error: duplicate {}\n", opt_name);
            return false;
        }
        const ParseU64DecimalResult parsed = parse_u64_decimal_strict(value);
        if (parsed.status == ParseU64DecimalStatus::Overflow) {
            fmt::print(stderr, "error: {} value is out of range: '{}'\n", opt_name, value);
            return false;
        }
        if (parsed.status != ParseU64DecimalStatus::Ok) {
            fmt::print(stderr, "error: {} must be a non-negative decimal integer, got: '{}'\n", opt_name, value);
            return false;
        }
        out = parsed.value;
        return true;
    };

    auto set_ms_option = [&](std::optional<std::uint64_t> &out, std::string_view opt_name, std::string_view value) -> bool {
        if (!set_u64_option(out, opt_name, value))
            return false;
        if (*out > static_cast<std::uint64_t>(kMaxDuration.count())) {
            fmt::print(stderr, "error: {} must be at most {}, got: '{}'\n", opt_name, kMaxDuration.count(), value);
            return false;
        }
        return true;
    };

    std::size_t start = 0;
    if (!args.empty() && args[0] && args[0][0] != '-') {
        start = 1; // Skip argv[0] (program name) when present.
    }
    if (start < args.size() && args[start]) {
        const std::string_view first(args[start]);
        if (first == "run") {
            ++start;
        } else if (first == "stop") {
            opt.command = Command::Stop;
            ++start;
        } else if (first == "help") {
            opt.command = Command::Help;
            ++start;
        }
    }

    for (std::size_t i = start; i < args.size(); ++i) {
        const char *arg = args[i];
        if (!arg)
            continue;
        const std::string_view s(arg);

        if (s == "--help" || s == "-h") {
            opt.command = Command::Help;
            continue;
        }
        if (s == "--verbose" || s == "-v") {
            opt.verbose = true;
            continue;
        }
        if (s == "--no-color") {
            opt.no_color = true;
            continue;
        }
        if (s == "--no-tls") {
            opt.no_tls = true;
            continue;
        }
        if (s == "--foreground") {
            opt.foreground = true;
            continue;
        }
        if (s == "--no-coverage") {
            opt.no_coverage = true;
            continue;
        }
        if (s == "--no-test-mode") {
            opt.no_test_mode = true;
            continue;
        }

        OptionParseResult r = OptionParseResult::NoMatch;
        auto consumed = [&](OptionParseResult result) {
            r = result;
            return result != OptionParseResult::NoMatch;
        };

        if (consumed(parse_value_option(i, s, "--config",
                                        [&](std::string_view v) { return set_unique_string_option(opt.config_path, "--config", v); }))
            || consumed(parse_value_option(i, s, "--base-dir",
                                           [&](std::string_view v) { return set_unique_string_option(opt.base_dir, "--base-dir", v); }))
            || consumed(parse_value_option(i, s, "--sandbox",
                                           [&](std::string_view v) { return set_unique_string_option(opt.sandbox, "--sandbox", v); }))
            || consumed(parse_value_option(i, s, "--junit",
                                           [&](std::string_view v) { return set_unique_string_option(opt.junit_path, "--junit", v); }))
            || consumed(parse_value_option(i, s, "--pid-file",
                                           [&](std::string_view v) { return set_unique_string_option(opt.pid_file, "--pid-file", v); }))
            || consumed(parse_value_option(i, s, "--settle-delay-ms",
                                           [&](std::string_view v) { return set_ms_option(opt.settle_delay_ms, "--settle-delay-ms", v); }))
            || consumed(parse_value_option(i, s, "--port", [&](std::string_view v) { return set_u64_option(opt.port, "--port", v); }))
            || consumed(parse_value_option(i, s, "--probe-timeout-ms",
                                           [&](std::string_view v) { return set_ms_option(opt.probe_timeout_ms, "--probe-timeout-ms", v); }))
            || consumed(parse_value_option(i, s, "--stop-timeout-ms",
                                           [&](std::string_view v) { return set_ms_option(opt.stop_timeout_ms, "--stop-timeout-ms", v); }))
            || consumed(parse_value_option(i, s, "--test-timeout-ms",
                                           [&](std::string_view v) { return set_ms_option(opt.test_timeout_ms, "--test-timeout-ms", v); }))
            || consumed(parse_value_option(i, s, "--readiness", [&](std::string_view v) {
                   if (v == "delay") {
                       opt.readiness_mode = ReadinessMode::Delay;
                       return true;
                   }
                   if (v == "probe") {
                       opt.readiness_mode = ReadinessMode::Probe;
                       return true;
                   }
                   fmt::print(stderr, "error: --readiness must be one of delay,probe; got: '{}'\n", v);
                   return false;
               }))) {
            if (r == OptionParseResult::Error)
                return false;
            continue;
        }

        fmt::print(stderr, "error: unknown argument '{}'\n", s);
        return false;
    }

    if (opt.port && (*opt.port == 0 || *opt.port > 65535)) {
        fmt::print(stderr, "error: --port must be in [1, 65535], got: {}\n", *opt.port);
        return false;
    }
    if (opt.command == Command::Stop && !opt.pid_file) {
        fmt::print(stderr, "error: stop requires --pid-file\n");
        return false;
    }

    out_opt = opt;
    return true;
}

HarnessConfig build_config(const CliOptions &opt) {
    const std::filesystem::path base =
        opt.base_dir ? std::filesystem::absolute(opt.base_dir) : std::filesystem::current_path();
    HarnessConfig config = default_config(base);
    if (opt.config_path)
        load_config_json(opt.config_path, config);
    // --base-dir wins over the config file's own directory.
    if (opt.base_dir)
        config.base_dir = base;

    if (opt.sandbox)
        config.sandbox_dir = opt.sandbox;
    if (opt.junit_path)
        config.junit_path = std::filesystem::absolute(opt.junit_path);
    if (opt.readiness_mode)
        config.readiness.mode = *opt.readiness_mode;
    if (opt.settle_delay_ms)
        config.readiness.settle_delay = to_ms(*opt.settle_delay_ms);
    if (opt.probe_timeout_ms)
        config.readiness.timeout = to_ms(*opt.probe_timeout_ms);
    if (opt.port) {
        const std::string port = std::to_string(*opt.port);
        config.readiness.port  = static_cast<std::uint16_t>(*opt.port);
        for (auto &tpl : config.templates) {
            for (auto &ov : tpl.overrides) {
                if (ov.key == "port")
                    ov.value = port;
            }
        }
    }
    if (opt.no_tls)
        config.readiness.tls = false;
    if (opt.foreground)
        config.server.daemon = false;
    if (opt.stop_timeout_ms)
        config.server.stop_timeout = to_ms(*opt.stop_timeout_ms);
    if (opt.test_timeout_ms)
        config.tests.timeout = to_ms(*opt.test_timeout_ms);
    if (opt.no_coverage)
        config.coverage.enabled = false;
    if (opt.no_test_mode)
        config.server.test_mode = false;

    validate(config);
    return config;
}

namespace {

int run_stop(const CliOptions &opt) {
    ServerConfig defaults;
    const auto timeout = opt.stop_timeout_ms ? to_ms(*opt.stop_timeout_ms) : defaults.stop_timeout;
    ServerSupervisor supervisor(defaults, CoverageSession(CoverageConfig{}));
    ServerProcess    server = ServerSupervisor::recover(opt.pid_file);
    try {
        supervisor.stop(server, timeout);
    } catch (const ShutdownTimeoutError &e) {
        log::warn("{}", e.what());
        supervisor.kill(server, defaults.kill_timeout);
    }
    return EXIT_SUCCESS;
}

} // namespace

int run(std::span<const char *> args) {
    CliOptions opt;
    if (!parse_cli(args, opt)) {
        fmt::print(stderr, "Try 'vaultrig --help'.\n");
        return kUsageExitStatus;
    }
    if (opt.command == Command::Help) {
        print_usage();
        return EXIT_SUCCESS;
    }

    log::set_verbose(opt.verbose);
    log::set_color(!opt.no_color && log::color_supported());

    try {
        if (opt.command == Command::Stop)
            return run_stop(opt);

        HarnessConfig config = build_config(opt);
        const auto &interrupted = install_interrupt_handlers();
        Orchestrator orchestrator(std::move(config), &interrupted);
        const RunResult result = orchestrator.run();
        return result.exit_code();
    } catch (const error &e) {
        log::error("{}: {}", to_string(e.kind()), e.what());
        return EXIT_FAILURE;
    } catch (const std::exception &e) {
        log::error("{}", e.what());
        return EXIT_FAILURE;
    }
}

} // namespace vaultrig::cli
