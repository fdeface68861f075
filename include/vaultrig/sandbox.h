#pragma once

#include "vaultrig/config.h"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace vaultrig {

struct SandboxDirectory {
    std::filesystem::path path;

    std::filesystem::path file(const std::string &name) const { return path / name; }
};

// Exclusive lock on `<sandbox>.lock`, a sibling of the sandbox so wiping the
// sandbox does not drop it. One run per sandbox path at a time.
class RunLock {
public:
    RunLock() = default;
    ~RunLock();
    RunLock(const RunLock &) = delete;
    RunLock &operator=(const RunLock &) = delete;
    RunLock(RunLock &&other) noexcept;
    RunLock &operator=(RunLock &&other) noexcept;

    // Throws ProvisionError when another run holds the lock.
    static RunLock acquire(const std::filesystem::path &sandbox);

    bool held() const { return fd_ >= 0; }
    const std::filesystem::path &path() const { return path_; }

private:
    void release() noexcept;

    int fd_{-1};
    std::filesystem::path path_;
};

class SandboxProvisioner {
public:
    explicit SandboxProvisioner(std::filesystem::path root);

    const std::filesystem::path &root() const { return root_; }

    // Wipes and recreates the sandbox, then copies every template verbatim.
    // Throws ProvisionError.
    SandboxDirectory provision(const std::vector<ConfigurationTemplate> &templates) const;
    SandboxDirectory provision_sources(const std::set<std::filesystem::path> &sources) const;

    // Rewrites `key = value` lines of the copied template in place.
    // Throws ProvisionError when an override matches nothing.
    void parametrize(const SandboxDirectory &sandbox, const ConfigurationTemplate &tpl) const;

private:
    std::filesystem::path root_;
};

std::string apply_ini_overrides(const std::string &text, const std::vector<IniOverride> &overrides,
                                std::vector<std::size_t> &match_counts);

} // namespace vaultrig
