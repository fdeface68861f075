#include "vaultrig/process.h"

#include <array>
#include <chrono>
#include <fstream>
#include <thread>
#include <utility>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vaultrig::process {
namespace {

enum ChildStage : int {
    StageChdir  = 1,
    StageOutput = 2,
    StageExec   = 3,
};

const char *stage_name(int stage) {
    switch (stage) {
    case StageChdir: return "chdir";
    case StageOutput: return "open output";
    case StageExec: return "exec";
    default: return "child setup";
    }
}

void read_fd(int fd, std::string &out) {
    constexpr size_t kBufferSize = 4096;
    char buffer[kBufferSize];
    while (true) {
        const ssize_t bytes_read = read(fd, buffer, kBufferSize);
        if (bytes_read > 0) {
            out.append(buffer, buffer + bytes_read);
            continue;
        }
        if (bytes_read < 0 && errno == EINTR)
            continue;
        break;
    }
    close(fd);
}

// Only async-signal-safe calls from here on; the child reports the failing
// stage and errno through the close-on-exec pipe.
[[noreturn]] void report_child_failure(int report_fd, int stage) {
    const std::array<int, 2> payload{stage, errno};
    ssize_t ignored = write(report_fd, payload.data(), sizeof(payload));
    (void)ignored;
    _exit(127);
}

[[noreturn]] void exec_child(const std::vector<std::string> &argv, const std::vector<EnvVar> &env,
                             const std::optional<std::string> &working_dir, int report_fd) {
    // A harness started in the background has SIGINT ignored, and exec keeps that.
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    sigaction(SIGINT, &dfl, nullptr);
    sigaction(SIGTERM, &dfl, nullptr);

    if (working_dir.has_value()) {
        if (chdir(working_dir.value().c_str()) != 0)
            report_child_failure(report_fd, StageChdir);
    }

    for (const auto &var : env) {
        setenv(var.key.c_str(), var.value.c_str(), 1);
    }

    std::vector<char *> argv_c;
    argv_c.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        argv_c.push_back(const_cast<char *>(arg.c_str()));
    }
    argv_c.push_back(nullptr);
    execvp(argv_c[0], argv_c.data());
    report_child_failure(report_fd, StageExec);
}

// Blocks until the child either execs (pipe closes) or reports a failure.
std::string collect_child_failure(int report_fd, const std::string &program) {
    std::array<int, 2> payload{0, 0};
    std::size_t got = 0;
    auto *bytes = reinterpret_cast<char *>(payload.data());
    while (got < sizeof(payload)) {
        const ssize_t n = read(report_fd, bytes + got, sizeof(payload) - got);
        if (n > 0) {
            got += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        break;
    }
    close(report_fd);
    if (got < sizeof(payload))
        return std::string();
    return std::string(stage_name(payload[0])) + " failed for '" + program + "': " + std::strerror(payload[1]);
}

void apply_wait_status(int status, int &exit_code, bool &signaled, int &signal) {
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        signaled  = true;
        signal    = WTERMSIG(status);
        exit_code = 128 + signal;
    }
}

} // namespace

SubprocessResult run_subprocess(const SubprocessOptions &options) {
    SubprocessResult result;
    if (options.argv.empty()) {
        result.error = "argv is empty";
        return result;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int report_pipe[2] = {-1, -1};
    if (options.capture_output) {
        if (pipe(stdout_pipe) != 0) {
            result.error = "pipe stdout failed";
            return result;
        }
        if (pipe(stderr_pipe) != 0) {
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            result.error = "pipe stderr failed";
            return result;
        }
    }
    if (pipe2(report_pipe, O_CLOEXEC) != 0) {
        if (options.capture_output) {
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            close(stderr_pipe[0]);
            close(stderr_pipe[1]);
        }
        result.error = "pipe failed";
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        if (options.capture_output) {
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            close(stderr_pipe[0]);
            close(stderr_pipe[1]);
        }
        close(report_pipe[0]);
        close(report_pipe[1]);
        result.error = "fork failed";
        return result;
    }

    if (pid == 0) {
        close(report_pipe[0]);
        if (options.capture_output) {
            dup2(stdout_pipe[1], STDOUT_FILENO);
            dup2(stderr_pipe[1], STDERR_FILENO);
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            close(stderr_pipe[0]);
            close(stderr_pipe[1]);
        }
        exec_child(options.argv, options.env, options.working_dir, report_pipe[1]);
    }

    close(report_pipe[1]);
    if (options.capture_output) {
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);
    }

    std::thread stdout_thread;
    std::thread stderr_thread;
    if (options.capture_output) {
        stdout_thread = std::thread(read_fd, stdout_pipe[0], std::ref(result.stdout_text));
        stderr_thread = std::thread(read_fd, stderr_pipe[0], std::ref(result.stderr_text));
    }

    result.error   = collect_child_failure(report_pipe[0], options.argv.front());
    result.started = result.error.empty();

    int status = 0;
    const bool has_timeout = options.timeout.count() > 0;
    const bool polling     = has_timeout || options.cancel != nullptr;
    const auto deadline    = std::chrono::steady_clock::now() + options.timeout;

    while (true) {
        const pid_t wait_result = waitpid(pid, &status, polling ? WNOHANG : 0);
        if (wait_result == pid)
            break;
        if (wait_result == 0) {
            const bool expired   = has_timeout && std::chrono::steady_clock::now() >= deadline;
            const bool cancelled = options.cancel != nullptr && options.cancel->load();
            if (expired || cancelled) {
                result.timed_out = expired;
                result.cancelled = cancelled && !expired;
                kill(pid, SIGTERM);
                waitpid(pid, &status, 0);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (wait_result < 0 && errno == EINTR)
            continue;
        if (result.error.empty())
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
        break;
    }

    apply_wait_status(status, result.exit_code, result.signaled, result.signal);

    if (stdout_thread.joinable())
        stdout_thread.join();
    if (stderr_thread.joinable())
        stderr_thread.join();

    return result;
}

SpawnResult spawn_detached(const SpawnOptions &options) {
    SpawnResult result;
    if (options.argv.empty()) {
        result.error = "argv is empty";
        return result;
    }

    int report_pipe[2] = {-1, -1};
    if (pipe2(report_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed";
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close(report_pipe[0]);
        close(report_pipe[1]);
        result.error = "fork failed";
        return result;
    }

    if (pid == 0) {
        close(report_pipe[0]);
        if (options.new_session) {
            // Keep going without a new session; the supervisor still owns the pid.
            (void)setsid();
        }
        int null_fd = open("/dev/null", O_RDWR);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
        }
        int out_fd = null_fd;
        if (options.output_path.has_value()) {
            out_fd = open(options.output_path.value().c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (out_fd < 0)
                report_child_failure(report_pipe[1], StageOutput);
        }
        if (out_fd >= 0) {
            dup2(out_fd, STDOUT_FILENO);
            dup2(out_fd, STDERR_FILENO);
            if (out_fd > STDERR_FILENO && out_fd != null_fd)
                close(out_fd);
        }
        if (null_fd > STDERR_FILENO)
            close(null_fd);
        exec_child(options.argv, options.env, options.working_dir, report_pipe[1]);
    }

    close(report_pipe[1]);
    result.error = collect_child_failure(report_pipe[0], options.argv.front());
    if (!result.error.empty()) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return result;
    }
    result.pid = pid;
    return result;
}

WaitResult wait_child(pid_t pid, std::chrono::milliseconds timeout) {
    WaitResult result;
    if (pid <= 0) {
        result.error = "invalid pid";
        return result;
    }
    const bool has_timeout = timeout.count() > 0;
    const auto deadline    = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    while (true) {
        const pid_t rc = waitpid(pid, &status, has_timeout ? WNOHANG : 0);
        if (rc == pid) {
            result.exited = true;
            apply_wait_status(status, result.exit_code, result.signaled, result.signal);
            return result;
        }
        if (rc == 0) {
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                return result;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (errno == EINTR)
            continue;
        result.error = std::string("waitpid failed: ") + std::strerror(errno);
        return result;
    }
}

bool is_alive(pid_t pid) {
    if (pid <= 0)
        return false;
    if (kill(pid, 0) != 0)
        return errno == EPERM;

    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat)
        return true;
    std::string content;
    std::getline(stat, content);
    // The command name may contain ')' itself; the state follows the last one.
    const auto close_paren = content.rfind(')');
    if (close_paren != std::string::npos && close_paren + 2 < content.size()) {
        const char state = content[close_paren + 2];
        if (state == 'Z' || state == 'X')
            return false;
    }
    return true;
}

bool send_signal(pid_t pid, int signal, std::string *error) {
    if (pid <= 1) {
        if (error)
            *error = "refusing to signal pid " + std::to_string(pid);
        return false;
    }
    if (kill(pid, signal) != 0) {
        if (error)
            *error = errno == ESRCH ? std::string("no such process") : std::string(std::strerror(errno));
        return false;
    }
    return true;
}

std::string current_executable_path() {
    std::string buffer(1024, '\0');
    while (true) {
        ssize_t count = readlink("/proc/self/exe", buffer.data(), buffer.size() - 1);
        if (count < 0) {
            return std::string();
        }
        if (static_cast<size_t>(count) < buffer.size() - 1) {
            buffer.resize(static_cast<size_t>(count));
            return buffer;
        }
        buffer.resize(buffer.size() * 2);
    }
}

std::optional<std::string> find_program(const std::string &name) {
    if (name.empty())
        return std::nullopt;
    if (name.find('/') != std::string::npos)
        return access(name.c_str(), X_OK) == 0 ? std::optional<std::string>(name) : std::nullopt;
    const char *path_env = std::getenv("PATH");
    std::string_view dirs = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    while (true) {
        const auto sep = dirs.find(':');
        std::string dir(dirs.substr(0, sep));
        if (dir.empty())
            dir = ".";
        std::string candidate = dir + "/" + name;
        struct stat st {};
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0)
            return candidate;
        if (sep == std::string_view::npos)
            break;
        dirs.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

std::string format_command(const std::vector<std::string> &argv) {
    std::string out;
    for (std::size_t idx = 0; idx < argv.size(); ++idx) {
        if (idx > 0)
            out.push_back(' ');
        const std::string &arg = argv[idx];
        if (!arg.empty() && arg.find_first_of(" \t\"'") == std::string::npos) {
            out += arg;
            continue;
        }
        out.push_back('\'');
        for (char ch : arg) {
            if (ch == '\'')
                out += "'\\''";
            else
                out.push_back(ch);
        }
        out.push_back('\'');
    }
    return out;
}

} // namespace vaultrig::process
