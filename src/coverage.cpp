#include "vaultrig/coverage.h"
#include "vaultrig/log.h"
#include "vaultrig/process.h"

#include <algorithm>
#include <set>
#include <system_error>

namespace vaultrig {

namespace fs = std::filesystem;

CoverageSession::CoverageSession(CoverageConfig config) : config_(std::move(config)) {}

std::vector<std::string> CoverageSession::wrap(const std::vector<std::string> &argv) const {
    if (!config_.enabled)
        return argv;
    std::vector<std::string> out = config_.launcher;
    out.insert(out.end(), argv.begin(), argv.end());
    // The launcher runs a script file, not a command name.
    if (!argv.empty()) {
        if (auto program = process::find_program(argv.front()))
            out[config_.launcher.size()] = *program;
    }
    return out;
}

bool CoverageSession::is_artifact(const std::string &name) const {
    if (!config_.data_prefix.empty() && name.rfind(config_.data_prefix, 0) == 0)
        return true;
    return std::find(config_.artifacts.begin(), config_.artifacts.end(), name) != config_.artifacts.end();
}

std::vector<fs::path> CoverageSession::finalize(const SandboxDirectory &sandbox, const std::vector<fs::path> &dirs) const {
    if (!config_.enabled)
        return {};

    const std::map<std::string, std::string> values{{"sandbox", sandbox.path.string()}};
    for (const auto &command : config_.finalize) {
        process::SubprocessOptions opts;
        try {
            opts.argv = expand_command(command, values);
        } catch (const ConfigError &e) {
            log::warn("coverage: {}", e.what());
            continue;
        }
        opts.working_dir = sandbox.path.string();
        log::info("coverage: {}", process::format_command(opts.argv));
        const auto result = process::run_subprocess(opts);
        if (!result.error.empty()) {
            log::warn("coverage: {}", result.error);
        } else if (result.exit_code != 0) {
            log::warn("coverage: '{}' exited with {}", opts.argv.front(), result.exit_code);
            if (!result.stderr_text.empty())
                log::debug("{}", result.stderr_text);
        }
    }

    std::set<fs::path> found;
    for (const auto &dir : dirs) {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            log::debug("coverage: cannot list {}: {}", dir.string(), ec.message());
            continue;
        }
        for (const auto &entry : it) {
            std::error_code type_ec;
            if (!entry.is_regular_file(type_ec))
                continue;
            if (is_artifact(entry.path().filename().string()))
                found.insert(fs::absolute(entry.path()).lexically_normal());
        }
    }
    return {found.begin(), found.end()};
}

} // namespace vaultrig
