#pragma once

#include "vaultrig/config.h"

#include <cstdint>
#include <optional>
#include <span>

namespace vaultrig::cli {

enum class Command {
    Run,
    Stop,
    Help,
};

struct CliOptions {
    Command command = Command::Run;

    bool verbose  = false;
    bool no_color = false;

    const char *config_path = nullptr;
    const char *base_dir    = nullptr;
    const char *sandbox     = nullptr;
    const char *junit_path  = nullptr;
    const char *pid_file    = nullptr; // stop

    std::optional<ReadinessMode> readiness_mode;
    std::optional<std::uint64_t> settle_delay_ms;
    std::optional<std::uint64_t> port;
    std::optional<std::uint64_t> probe_timeout_ms;
    std::optional<std::uint64_t> stop_timeout_ms;
    std::optional<std::uint64_t> test_timeout_ms;

    bool no_tls       = false;
    bool foreground   = false;
    bool no_coverage  = false;
    bool no_test_mode = false;
};

// Reports problems on stderr and returns false.
bool parse_cli(std::span<const char *> args, CliOptions &out_opt);

void print_usage();

// Defaults, then the config file, then command-line overrides. Throws ConfigError.
HarnessConfig build_config(const CliOptions &opt);

// EX_USAGE; distinct from any status the test suite reports.
inline constexpr int kUsageExitStatus = 64;

// Parses `args` (argv[0] included) and dispatches the subcommand. Returns the
// process exit status.
int run(std::span<const char *> args);

} // namespace vaultrig::cli
