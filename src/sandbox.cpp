#include "vaultrig/sandbox.h"
#include "vaultrig/log.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <system_error>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <fmt/format.h>

namespace vaultrig {

namespace fs = std::filesystem;

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

// INI keys are case-insensitive for the Python config parsers the server uses.
bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

std::string read_file(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw ProvisionError(fmt::format("cannot read '{}'", path.string()));
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void ensure_safe_to_wipe(const fs::path &root) {
    std::error_code ec;
    const fs::path canonical = fs::weakly_canonical(root, ec);
    if (ec)
        throw ProvisionError(fmt::format("cannot resolve sandbox path '{}': {}", root.string(), ec.message()));
    if (canonical.empty() || canonical == canonical.root_path())
        throw ProvisionError(fmt::format("refusing to use '{}' as a sandbox", root.string()));

    const fs::path cwd = fs::weakly_canonical(fs::current_path(ec), ec);
    if (ec)
        return;
    // The sandbox must not contain the directory the harness runs from.
    auto rel = cwd.lexically_relative(canonical);
    if (!rel.empty() && *rel.begin() != "..")
        throw ProvisionError(fmt::format("refusing to wipe '{}': it contains the working directory", canonical.string()));
}

} // namespace

RunLock::~RunLock() { release(); }

RunLock::RunLock(RunLock &&other) noexcept : fd_(other.fd_), path_(std::move(other.path_)) { other.fd_ = -1; }

RunLock &RunLock::operator=(RunLock &&other) noexcept {
    if (this != &other) {
        release();
        fd_       = other.fd_;
        path_     = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

void RunLock::release() noexcept {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

RunLock RunLock::acquire(const fs::path &sandbox) {
    fs::path target = sandbox.lexically_normal();
    if (!target.has_filename())
        target = target.parent_path();
    RunLock lock;
    lock.path_ = target.parent_path() / (target.filename().string() + ".lock");

    std::error_code ec;
    fs::create_directories(lock.path_.parent_path(), ec);
    if (ec)
        throw ProvisionError(fmt::format("cannot create '{}': {}", lock.path_.parent_path().string(), ec.message()));

    lock.fd_ = ::open(lock.path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (lock.fd_ < 0)
        throw ProvisionError(fmt::format("cannot open lock file '{}': {}", lock.path_.string(), std::strerror(errno)));
    if (::flock(lock.fd_, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        if (err == EWOULDBLOCK)
            throw ProvisionError(fmt::format("sandbox '{}' is in use by another run", target.string()));
        throw ProvisionError(fmt::format("cannot lock '{}': {}", lock.path_.string(), std::strerror(err)));
    }
    return lock;
}

SandboxProvisioner::SandboxProvisioner(fs::path root) : root_(std::move(root)) {}

SandboxDirectory SandboxProvisioner::provision_sources(const std::set<fs::path> &sources) const {
    std::vector<ConfigurationTemplate> templates;
    templates.reserve(sources.size());
    for (const auto &source : sources) {
        ConfigurationTemplate tpl;
        tpl.source = source;
        templates.push_back(std::move(tpl));
    }
    return provision(templates);
}

SandboxDirectory SandboxProvisioner::provision(const std::vector<ConfigurationTemplate> &templates) const {
    if (root_.empty())
        throw ProvisionError("sandbox path is empty");

    std::map<std::string, fs::path> targets;
    for (const auto &tpl : templates) {
        std::error_code ec;
        if (!fs::is_regular_file(tpl.source, ec))
            throw ProvisionError(fmt::format("template '{}' does not exist or is not a regular file", tpl.source.string()));
        if (::access(tpl.source.c_str(), R_OK) != 0)
            throw ProvisionError(fmt::format("template '{}' is not readable", tpl.source.string()));
        const std::string name = tpl.target_name();
        auto [it, inserted] = targets.emplace(name, tpl.source);
        if (!inserted)
            throw ProvisionError(fmt::format("templates '{}' and '{}' both map to '{}'", it->second.string(),
                                             tpl.source.string(), name));
    }

    ensure_safe_to_wipe(root_);

    log::info("wiping sandbox {}", root_.string());
    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec)
        throw ProvisionError(fmt::format("cannot remove '{}': {}", root_.string(), ec.message()));
    fs::create_directories(root_, ec);
    if (ec)
        throw ProvisionError(fmt::format("cannot create '{}': {}", root_.string(), ec.message()));

    if (fs::directory_iterator(root_, ec) != fs::directory_iterator() || ec)
        throw ProvisionError(fmt::format("sandbox '{}' is not empty after recreation", root_.string()));
    if (::access(root_.c_str(), W_OK | X_OK) != 0)
        throw ProvisionError(fmt::format("sandbox '{}' is not writable", root_.string()));

    SandboxDirectory sandbox{fs::absolute(root_).lexically_normal()};
    for (const auto &[name, source] : targets) {
        const fs::path dest = sandbox.file(name);
        if (!fs::copy_file(source, dest, fs::copy_options::none, ec) || ec)
            throw ProvisionError(fmt::format("cannot copy '{}' to '{}': {}", source.string(), dest.string(),
                                             ec ? ec.message() : std::string("copy failed")));
        log::debug("seeded {}", dest.string());
    }
    return sandbox;
}

std::string apply_ini_overrides(const std::string &text, const std::vector<IniOverride> &overrides,
                                std::vector<std::size_t> &match_counts) {
    match_counts.assign(overrides.size(), 0);
    std::string out;
    out.reserve(text.size() + 32);
    std::string section;

    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t end = text.find('\n', pos);
        const bool has_newline = end != std::string::npos;
        if (!has_newline)
            end = text.size();
        std::string_view line(text.data() + pos, end - pos);
        std::string_view eol = has_newline ? "\n" : "";
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
            eol = has_newline ? "\r\n" : "\r";
        }
        pos = has_newline ? end + 1 : end;

        const std::string_view stripped = trim(line);
        if (stripped.size() >= 2 && stripped.front() == '[') {
            const auto close = stripped.find(']');
            if (close != std::string_view::npos)
                section = std::string(trim(stripped.substr(1, close - 1)));
        }
        const bool comment = !stripped.empty() && (stripped.front() == '#' || stripped.front() == ';');
        const auto delim   = line.find_first_of("=:");
        if (comment || stripped.empty() || stripped.front() == '[' || delim == std::string_view::npos) {
            out.append(line);
            out.append(eol);
            continue;
        }

        const std::string_view key = trim(line.substr(0, delim));
        std::optional<std::size_t> hit;
        for (std::size_t idx = 0; idx < overrides.size(); ++idx) {
            const auto &ov = overrides[idx];
            if (iequals(key, ov.key) && (ov.section.empty() || ov.section == section)) {
                hit = idx;
                ++match_counts[idx];
            }
        }
        if (!hit) {
            out.append(line);
            out.append(eol);
            continue;
        }

        // Keep the original layout up to the value, then substitute.
        std::size_t value_start = delim + 1;
        while (value_start < line.size() && (line[value_start] == ' ' || line[value_start] == '\t'))
            ++value_start;
        out.append(line.substr(0, value_start));
        if (value_start == delim + 1)
            out.push_back(' ');
        out.append(overrides[*hit].value);
        out.append(eol);
    }
    return out;
}

void SandboxProvisioner::parametrize(const SandboxDirectory &sandbox, const ConfigurationTemplate &tpl) const {
    if (tpl.overrides.empty())
        return;
    const fs::path target = sandbox.file(tpl.target_name());
    const std::string original = read_file(target);

    std::vector<std::size_t> counts;
    const std::string rewritten = apply_ini_overrides(original, tpl.overrides, counts);
    for (std::size_t idx = 0; idx < counts.size(); ++idx) {
        const auto &ov = tpl.overrides[idx];
        if (counts[idx] == 0) {
            throw ProvisionError(fmt::format("'{}' has no key '{}'{}", target.string(), ov.key,
                                             ov.section.empty() ? std::string() : fmt::format(" in [{}]", ov.section)));
        }
        log::info("{}: {} = {}", tpl.target_name(), ov.key, ov.value);
    }

    const fs::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
            throw ProvisionError(fmt::format("cannot write '{}'", tmp.string()));
        out << rewritten;
        out.flush();
        if (!out)
            throw ProvisionError(fmt::format("cannot write '{}'", tmp.string()));
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec)
        throw ProvisionError(fmt::format("cannot replace '{}': {}", target.string(), ec.message()));
}

} // namespace vaultrig
