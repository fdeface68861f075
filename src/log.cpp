#include "vaultrig/log.h"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include <fmt/color.h>
#include <unistd.h>

namespace vaultrig::log {
namespace {

std::atomic<bool> g_verbose{false};
std::atomic<bool> g_color{false};

std::mutex &errs_mutex() {
    static std::mutex mu;
    return mu;
}

bool env_has_value(const char *name) {
    const char *value = std::getenv(name);
    return value != nullptr && value[0] != '\0';
}

} // namespace

void set_verbose(bool verbose) { g_verbose.store(verbose); }
bool verbose() { return g_verbose.load(); }
void set_color(bool color) { g_color.store(color); }

bool color_supported() {
    if (env_has_value("NO_COLOR") || env_has_value("VAULTRIG_NO_COLOR"))
        return false;
    return ::isatty(STDERR_FILENO) == 1;
}

void write(Level level, std::string_view message) {
    std::lock_guard<std::mutex> lock(errs_mutex());
    const bool color = g_color.load();
    fmt::print(stderr, "vaultrig: ");
    switch (level) {
    case Level::Debug:
        if (color)
            fmt::print(stderr, fmt::fg(fmt::color::gray), "debug: ");
        else
            fmt::print(stderr, "debug: ");
        break;
    case Level::Info: break;
    case Level::Warn:
        if (color)
            fmt::print(stderr, fmt::fg(fmt::color::yellow), "warning: ");
        else
            fmt::print(stderr, "warning: ");
        break;
    case Level::Error:
        if (color)
            fmt::print(stderr, fmt::fg(fmt::color::red), "error: ");
        else
            fmt::print(stderr, "error: ");
        break;
    }
    fmt::print(stderr, "{}\n", message);
    std::fflush(stderr);
}

} // namespace vaultrig::log
