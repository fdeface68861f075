#include "vaultrig/supervisor.h"
#include "vaultrig/log.h"
#include "vaultrig/process.h"

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <csignal>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

#include <fmt/format.h>

namespace vaultrig {

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};

bool wait_for_exit(pid_t pid, bool owned_child, std::chrono::milliseconds timeout) {
    if (owned_child) {
        const auto waited = process::wait_child(pid, timeout);
        if (waited.exited) {
            log::debug("server pid {} exited with {}", pid, waited.exit_code);
            return true;
        }
        if (waited.timed_out)
            return false;
        // ECHILD: reaped elsewhere, fall back to plain liveness.
        log::debug("server pid {}: {}", pid, waited.error);
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (process::is_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(kPollInterval);
    }
    return true;
}

void remove_pid_file(const fs::path &path) {
    if (path.empty())
        return;
    std::error_code ec;
    fs::remove(path, ec);
    if (ec)
        log::warn("cannot remove pid file {}: {}", path.string(), ec.message());
}

void write_pid_file(const fs::path &path, pid_t pid) {
    const fs::path tmp = path.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << pid << '\n';
        out.flush();
        if (!out)
            throw ServerStartError(fmt::format("cannot write pid file '{}'", tmp.string()));
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec)
        throw ServerStartError(fmt::format("cannot write pid file '{}': {}", path.string(), ec.message()));
}

} // namespace

std::optional<pid_t> read_pid_file(const fs::path &path, std::string *error) {
    std::ifstream in(path);
    if (!in) {
        if (error)
            *error = fmt::format("cannot read pid file '{}'", path.string());
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string text = ss.str();
    const auto first = text.find_first_not_of(" \t\r\n");
    const auto last  = text.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) {
        if (error)
            *error = fmt::format("pid file '{}' is empty", path.string());
        return std::nullopt;
    }
    text = text.substr(first, last - first + 1);

    long long value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value <= 1 || value > INT32_MAX) {
        if (error)
            *error = fmt::format("pid file '{}' holds an invalid pid: '{}'", path.string(), text);
        return std::nullopt;
    }
    return static_cast<pid_t>(value);
}

ServerProcess::ServerProcess(pid_t pid, fs::path config_path, fs::path pid_file, bool owned_child)
    : pid_(pid), config_path_(std::move(config_path)), pid_file_(std::move(pid_file)), owned_child_(owned_child) {}

ServerProcess::~ServerProcess() { release(); }

ServerProcess::ServerProcess(ServerProcess &&other) noexcept
    : pid_(other.pid_), config_path_(std::move(other.config_path_)), pid_file_(std::move(other.pid_file_)),
      owned_child_(other.owned_child_), stop_timeout_(other.stop_timeout_), kill_timeout_(other.kill_timeout_) {
    other.clear();
}

ServerProcess &ServerProcess::operator=(ServerProcess &&other) noexcept {
    if (this != &other) {
        release();
        pid_          = other.pid_;
        config_path_  = std::move(other.config_path_);
        pid_file_     = std::move(other.pid_file_);
        owned_child_  = other.owned_child_;
        stop_timeout_ = other.stop_timeout_;
        kill_timeout_ = other.kill_timeout_;
        other.clear();
    }
    return *this;
}

bool ServerProcess::running() const { return !empty() && process::is_alive(pid_); }

void ServerProcess::set_release_timeouts(std::chrono::milliseconds stop, std::chrono::milliseconds kill) {
    stop_timeout_ = stop;
    kill_timeout_ = kill;
}

void ServerProcess::clear() noexcept {
    pid_         = -1;
    owned_child_ = false;
    config_path_.clear();
    pid_file_.clear();
}

// Last resort for paths that never reached an orderly stop.
void ServerProcess::release() noexcept {
    if (empty())
        return;
    const pid_t pid = pid_;
    const bool owned = owned_child_;
    const fs::path pid_file = pid_file_;
    clear();
    try {
        if (!process::is_alive(pid)) {
            if (owned)
                (void)process::wait_child(pid, std::chrono::milliseconds(1));
            remove_pid_file(pid_file);
            return;
        }
        log::warn("server pid {} still running; stopping it", pid);
        std::string err;
        if (process::send_signal(pid, SIGINT, &err) && wait_for_exit(pid, owned, stop_timeout_)) {
            remove_pid_file(pid_file);
            return;
        }
        if (process::send_signal(pid, SIGKILL, &err) && wait_for_exit(pid, owned, kill_timeout_)) {
            remove_pid_file(pid_file);
            return;
        }
        if (process::is_alive(pid))
            log::error("server pid {} survived SIGKILL; pid file kept at {}", pid, pid_file.string());
        else
            remove_pid_file(pid_file);
    } catch (const std::exception &e) {
        std::fprintf(stderr, "vaultrig: error: releasing server pid %d: %s\n", static_cast<int>(pid), e.what());
    }
}

ServerSupervisor::ServerSupervisor(ServerConfig config, CoverageSession coverage)
    : config_(std::move(config)), coverage_(std::move(coverage)) {}

std::vector<process::EnvVar> ServerSupervisor::child_env(bool test_mode, const std::vector<process::EnvVar> &extra) const {
    std::vector<process::EnvVar> env = config_.env;
    env.insert(env.end(), extra.begin(), extra.end());
    if (test_mode)
        env.push_back(process::EnvVar{config_.test_mode_env, "true"});
    return env;
}

ServerProcess ServerSupervisor::start(const ServerLaunch &launch) const {
    std::vector<std::string> argv;
    try {
        argv = coverage_.wrap(expand_command(config_.command, {
                                                                  {"config", launch.config_path.string()},
                                                                  {"pid_file", launch.pid_file.string()},
                                                                  {"sandbox", launch.sandbox.path.string()},
                                                              }));
    } catch (const ConfigError &e) {
        throw ServerStartError(e.what());
    }

    std::error_code ec;
    if (fs::exists(launch.pid_file, ec)) {
        log::warn("removing stale pid file {}", launch.pid_file.string());
        remove_pid_file(launch.pid_file);
    }

    const auto env = child_env(launch.test_mode, launch.env);
    log::info("starting server: {}", process::format_command(argv));
    ServerProcess server = config_.daemon ? start_daemon(launch, argv, env) : start_foreground(launch, argv, env);
    server.set_release_timeouts(config_.stop_timeout, config_.kill_timeout);
    log::info("server running with pid {}", server.pid());
    return server;
}

ServerProcess ServerSupervisor::start_daemon(const ServerLaunch &launch, const std::vector<std::string> &argv,
                                             const std::vector<process::EnvVar> &env) const {
    const auto deadline = std::chrono::steady_clock::now() + config_.start_timeout;

    process::SubprocessOptions opts;
    opts.argv           = argv;
    opts.env            = env;
    opts.working_dir    = launch.sandbox.path.string();
    opts.timeout        = config_.start_timeout;
    opts.capture_output = false;
    const auto result = process::run_subprocess(opts);
    if (!result.error.empty())
        throw ServerStartError(fmt::format("server launch failed: {}", result.error));
    if (result.timed_out)
        throw ServerStartError(fmt::format("server launcher did not detach within {}ms", config_.start_timeout.count()));
    if (result.exit_code != 0)
        throw ServerStartError(fmt::format("server launcher exited with {}", result.exit_code));

    std::string last_error;
    while (true) {
        std::error_code ec;
        if (fs::exists(launch.pid_file, ec)) {
            if (auto pid = read_pid_file(launch.pid_file, &last_error)) {
                ServerProcess server(*pid, launch.config_path, launch.pid_file, false);
                if (!server.running())
                    throw ServerStartError(fmt::format("server pid {} exited right after start", *pid));
                return server;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline)
            break;
        std::this_thread::sleep_for(kPollInterval);
    }
    if (last_error.empty())
        last_error = fmt::format("pid file '{}' did not appear", launch.pid_file.string());
    throw ServerStartError(fmt::format("{} within {}ms", last_error, config_.start_timeout.count()));
}

ServerProcess ServerSupervisor::start_foreground(const ServerLaunch &launch, const std::vector<std::string> &argv,
                                                 const std::vector<process::EnvVar> &env) const {
    process::SpawnOptions opts;
    opts.argv        = argv;
    opts.env         = env;
    opts.working_dir = launch.sandbox.path.string();
    opts.output_path = launch.sandbox.file("server.log").string();
    const auto spawned = process::spawn_detached(opts);
    if (!spawned.error.empty())
        throw ServerStartError(fmt::format("server launch failed: {}", spawned.error));

    ServerProcess server(spawned.pid, launch.config_path, launch.pid_file, true);
    write_pid_file(launch.pid_file, spawned.pid);
    return server;
}

void ServerSupervisor::stop(ServerProcess &server, std::chrono::milliseconds timeout) const {
    if (server.empty())
        throw ProcessNotFoundError("no server process to stop");

    const pid_t pid = server.pid();
    log::info("stopping server pid {} (SIGINT)", pid);
    std::string err;
    if (!process::send_signal(pid, SIGINT, &err)) {
        if (process::is_alive(pid))
            throw ShutdownTimeoutError(fmt::format("cannot signal server pid {}: {}", pid, err));
        log::warn("server pid {} was already gone", pid);
        if (server.owned_child())
            (void)process::wait_child(pid, std::chrono::milliseconds(1));
    } else if (!wait_for_exit(pid, server.owned_child(), timeout)) {
        throw ShutdownTimeoutError(fmt::format("server pid {} did not exit within {}ms of SIGINT", pid, timeout.count()));
    }
    remove_pid_file(server.pid_file_path());
    server.clear();
    log::info("server stopped");
}

void ServerSupervisor::kill(ServerProcess &server, std::chrono::milliseconds timeout) const {
    if (server.empty())
        throw ProcessNotFoundError("no server process to kill");

    const pid_t pid = server.pid();
    log::warn("killing server pid {}", pid);
    std::string err;
    if (!process::send_signal(pid, SIGKILL, &err) && process::is_alive(pid))
        throw ShutdownTimeoutError(fmt::format("cannot kill server pid {}: {}", pid, err));
    if (!wait_for_exit(pid, server.owned_child(), timeout))
        throw ShutdownTimeoutError(fmt::format("server pid {} survived SIGKILL for {}ms", pid, timeout.count()));
    remove_pid_file(server.pid_file_path());
    server.clear();
}

ServerProcess ServerSupervisor::recover(const fs::path &pid_file, const fs::path &config_path) {
    std::error_code ec;
    if (!fs::exists(pid_file, ec))
        throw ProcessNotFoundError(fmt::format("pid file '{}' does not exist", pid_file.string()));
    std::string err;
    const auto pid = read_pid_file(pid_file, &err);
    if (!pid)
        throw ProcessNotFoundError(err);
    log::debug("recovered server pid {} from {}", *pid, pid_file.string());
    return ServerProcess(*pid, config_path, pid_file, false);
}

} // namespace vaultrig
