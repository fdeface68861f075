#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace vaultrig::process {

struct EnvVar {
    std::string key;
    std::string value;
};

struct SubprocessOptions {
    std::vector<std::string> argv;
    std::vector<EnvVar> env;
    std::chrono::milliseconds timeout{0};
    std::optional<std::string> working_dir;
    // When false the child shares the harness's stdio instead of pipes.
    bool capture_output = true;
    // Polled while waiting; once set the child gets SIGTERM.
    const std::atomic<bool> *cancel = nullptr;
};

struct SubprocessResult {
    int         exit_code = -1;
    bool        started   = false;
    bool        timed_out = false;
    bool        cancelled = false;
    bool        signaled  = false;
    int         signal    = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::string error;
};

struct SpawnOptions {
    std::vector<std::string> argv;
    std::vector<EnvVar> env;
    std::optional<std::string> working_dir;
    // stdout and stderr are appended here; /dev/null when unset.
    std::optional<std::string> output_path;
    bool new_session = true;
};

struct SpawnResult {
    pid_t       pid = -1;
    std::string error;
};

struct WaitResult {
    bool        exited    = false;
    bool        timed_out = false;
    int         exit_code = -1;
    bool        signaled  = false;
    int         signal    = 0;
    std::string error;
};

auto run_subprocess(const SubprocessOptions &options) -> SubprocessResult;

// Starts a child without waiting for it. Exec failures are reported here,
// not as exit code 127.
auto spawn_detached(const SpawnOptions &options) -> SpawnResult;

// Waits for a child of this process. A zero timeout blocks.
auto wait_child(pid_t pid, std::chrono::milliseconds timeout) -> WaitResult;

// Liveness of any process, child or not. Zombies count as dead.
auto is_alive(pid_t pid) -> bool;

// False with "no such process" when the target is already gone.
auto send_signal(pid_t pid, int signal, std::string *error = nullptr) -> bool;

auto current_executable_path() -> std::string;

// PATH lookup for names without a slash, like `which`.
auto find_program(const std::string &name) -> std::optional<std::string>;

auto format_command(const std::vector<std::string> &argv) -> std::string;

} // namespace vaultrig::process
