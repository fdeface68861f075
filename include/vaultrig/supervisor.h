#pragma once

#include "vaultrig/config.h"
#include "vaultrig/coverage.h"
#include "vaultrig/sandbox.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace vaultrig {

struct ServerLaunch {
    SandboxDirectory             sandbox;
    std::filesystem::path        config_path;
    std::filesystem::path        pid_file;
    bool                         test_mode = false;
    std::vector<process::EnvVar> env;
};

// Owning handle to a running server. Signals and waits go through it; the
// pid file only exists so a crashed run can be cleaned up later.
class ServerProcess {
public:
    ServerProcess() = default;
    ServerProcess(pid_t pid, std::filesystem::path config_path, std::filesystem::path pid_file, bool owned_child);
    ~ServerProcess();

    ServerProcess(const ServerProcess &) = delete;
    ServerProcess &operator=(const ServerProcess &) = delete;
    ServerProcess(ServerProcess &&other) noexcept;
    ServerProcess &operator=(ServerProcess &&other) noexcept;

    bool  empty() const { return pid_ <= 0; }
    pid_t pid() const { return pid_; }
    bool  owned_child() const { return owned_child_; }
    bool  running() const;

    const std::filesystem::path &config_path() const { return config_path_; }
    const std::filesystem::path &pid_file_path() const { return pid_file_; }

    // Budget for the destructor's SIGINT and SIGKILL waits.
    void set_release_timeouts(std::chrono::milliseconds stop, std::chrono::milliseconds kill);

private:
    friend class ServerSupervisor;

    void release() noexcept;
    void clear() noexcept;

    pid_t                     pid_{-1};
    std::filesystem::path     config_path_;
    std::filesystem::path     pid_file_;
    bool                      owned_child_{false};
    std::chrono::milliseconds stop_timeout_{10000};
    std::chrono::milliseconds kill_timeout_{5000};
};

class ServerSupervisor {
public:
    ServerSupervisor(ServerConfig config, CoverageSession coverage);

    // Launches without waiting for readiness. Throws ServerStartError.
    ServerProcess start(const ServerLaunch &launch) const;

    // SIGINT, then waits; the pid file goes away once the exit is confirmed.
    // Throws ProcessNotFoundError for an empty handle and
    // ShutdownTimeoutError when the server outlives `timeout`.
    void stop(ServerProcess &server, std::chrono::milliseconds timeout) const;

    // SIGKILL escalation. Throws ProcessNotFoundError or ShutdownTimeoutError.
    void kill(ServerProcess &server, std::chrono::milliseconds timeout) const;

    // Handle for a server left behind by another run. Throws ProcessNotFoundError.
    static ServerProcess recover(const std::filesystem::path &pid_file, const std::filesystem::path &config_path = {});

    // Environment handed to the server and the test suite.
    std::vector<process::EnvVar> child_env(bool test_mode, const std::vector<process::EnvVar> &extra) const;

    const ServerConfig &config() const { return config_; }

private:
    ServerProcess start_daemon(const ServerLaunch &launch, const std::vector<std::string> &argv,
                               const std::vector<process::EnvVar> &env) const;
    ServerProcess start_foreground(const ServerLaunch &launch, const std::vector<std::string> &argv,
                                   const std::vector<process::EnvVar> &env) const;

    ServerConfig    config_;
    CoverageSession coverage_;
};

// Positive pid other than init, or nullopt with `error` set.
std::optional<pid_t> read_pid_file(const std::filesystem::path &path, std::string *error = nullptr);

} // namespace vaultrig
