// Thread-safe stderr logging for the harness.
#pragma once

#include <fmt/format.h>

#include <iterator>
#include <string_view>
#include <utility>

namespace vaultrig::log {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
};

void set_verbose(bool verbose);
bool verbose();
void set_color(bool color);

// Honors NO_COLOR / VAULTRIG_NO_COLOR and whether stderr is a terminal.
bool color_supported();

void write(Level level, std::string_view message);

template <typename... Args>
void emit(Level level, fmt::format_string<Args...> format_string, Args &&...args) {
    if (level == Level::Debug && !verbose())
        return;
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    write(level, std::string_view(buffer.data(), buffer.size()));
}

template <typename... Args>
void debug(fmt::format_string<Args...> format_string, Args &&...args) {
    emit(Level::Debug, format_string, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> format_string, Args &&...args) {
    emit(Level::Info, format_string, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(fmt::format_string<Args...> format_string, Args &&...args) {
    emit(Level::Warn, format_string, std::forward<Args>(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> format_string, Args &&...args) {
    emit(Level::Error, format_string, std::forward<Args>(args)...);
}

} // namespace vaultrig::log
