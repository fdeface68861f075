#pragma once

#include "vaultrig/config.h"
#include "vaultrig/sandbox.h"

#include <filesystem>
#include <string>
#include <vector>

namespace vaultrig {

class CoverageSession {
public:
    explicit CoverageSession(CoverageConfig config);

    bool enabled() const { return config_.enabled; }

    // Prefixes the coverage launcher and resolves the wrapped program through
    // PATH; identity when disabled.
    std::vector<std::string> wrap(const std::vector<std::string> &argv) const;

    // Runs the finalize commands in the sandbox, then lists the coverage
    // files found directly under `dirs`, sorted. Command failures are logged.
    std::vector<std::filesystem::path> finalize(const SandboxDirectory &sandbox,
                                                const std::vector<std::filesystem::path> &dirs) const;

private:
    bool is_artifact(const std::string &name) const;

    CoverageConfig config_;
};

} // namespace vaultrig
