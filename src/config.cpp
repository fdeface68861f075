#include "vaultrig/config.h"

#include <set>

#include <fmt/args.h>
#include <fmt/format.h>

namespace vaultrig {
namespace {

bool is_plain_filename(const std::string &name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

void require_filename(std::string_view what, const std::string &name) {
    if (!is_plain_filename(name))
        throw ConfigError(fmt::format("{} must be a plain file name, got: '{}'", what, name));
}

void require_bounded(std::string_view what, std::chrono::milliseconds value) {
    if (value.count() < 0)
        throw ConfigError(fmt::format("{} must not be negative, got: {}ms", what, value.count()));
    if (value > kMaxDuration)
        throw ConfigError(fmt::format("{} must be at most {}ms, got: {}ms", what, kMaxDuration.count(), value.count()));
}

void require_positive(std::string_view what, std::chrono::milliseconds value) {
    if (value.count() <= 0)
        throw ConfigError(fmt::format("{} must be positive, got: {}ms", what, value.count()));
    require_bounded(what, value);
}

void require_command(std::string_view what, const std::vector<std::string> &command,
                     const std::map<std::string, std::string> &placeholders) {
    if (command.empty() || command.front().empty())
        throw ConfigError(fmt::format("{} must not be empty", what));
    try {
        (void)expand_command(command, placeholders);
    } catch (const ConfigError &e) {
        throw ConfigError(fmt::format("{}: {}", what, e.what()));
    }
}

} // namespace

std::string ConfigurationTemplate::target_name() const {
    if (!name.empty())
        return name;
    return source.filename().string();
}

std::filesystem::path HarnessConfig::resolve(const std::filesystem::path &path) const {
    if (path.empty() || path.is_absolute())
        return path;
    return (base_dir / path).lexically_normal();
}

std::filesystem::path HarnessConfig::sandbox_path() const {
    return std::filesystem::absolute(resolve(sandbox_dir)).lexically_normal();
}

HarnessConfig default_config(const std::filesystem::path &base_dir) {
    HarnessConfig config;
    config.base_dir = base_dir;

    ConfigurationTemplate server_ini;
    server_ini.source = "../server/test.ini";
    server_ini.name   = "test-server.ini";
    server_ini.overrides.push_back(IniOverride{"server:main", "port", "5767"});
    config.templates.push_back(std::move(server_ini));

    ConfigurationTemplate development_ini;
    development_ini.source = "../server/development.ini";
    config.templates.push_back(std::move(development_ini));

    config.certificate.subject_config = "../test-certif-config";

    config.server.command = {"paster", "serve", "-v", "--daemon", "--pid-file", "{pid_file}", "{config}"};
    config.tests.command  = {"nosetests", "-w", "{target}", "-s", "--with-xunit", "--xunit-file={report}"};
    // Server and suite each write their own data file; finalize merges them.
    config.coverage.launcher = {"coverage", "run", "-p", "--rcfile=../coverage.conf"};
    config.coverage.finalize = {{"coverage", "combine", "--rcfile=../coverage.conf"}};
    return config;
}

std::vector<std::string> expand_command(const std::vector<std::string> &command,
                                        const std::map<std::string, std::string> &values) {
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto &[name, value] : values) {
        store.push_back(fmt::arg(name.c_str(), value));
    }
    std::vector<std::string> out;
    out.reserve(command.size());
    for (const auto &arg : command) {
        try {
            out.push_back(fmt::vformat(arg, store));
        } catch (const fmt::format_error &e) {
            throw ConfigError(fmt::format("bad placeholder in '{}': {}", arg, e.what()));
        }
    }
    return out;
}

void validate(const HarnessConfig &config) {
    if (config.sandbox_dir.empty())
        throw ConfigError("sandbox directory must not be empty");

    std::set<std::string> names;
    for (const auto &tpl : config.templates) {
        if (tpl.source.empty())
            throw ConfigError("template source must not be empty");
        const std::string name = tpl.target_name();
        require_filename("template name", name);
        if (!names.insert(name).second)
            throw ConfigError(fmt::format("two templates map to '{}'", name));
        for (const auto &ov : tpl.overrides) {
            if (ov.key.empty())
                throw ConfigError(fmt::format("override in '{}' has an empty key", name));
        }
    }

    const auto &cert = config.certificate;
    if (cert.subject_config.empty())
        throw ConfigError("certificate subject config must be set");
    if (cert.key_bits < 1024)
        throw ConfigError(fmt::format("key size must be at least 1024 bits, got: {}", cert.key_bits));
    if (cert.validity_days <= 0)
        throw ConfigError(fmt::format("certificate validity must be positive, got: {} days", cert.validity_days));
    if (cert.digest.empty())
        throw ConfigError("certificate digest must be set");
    require_filename("key file name", cert.key_name);
    require_filename("certificate file name", cert.cert_name);
    require_filename("bundle file name", cert.bundle_name);

    const auto &server = config.server;
    require_filename("server config name", server.config_name);
    require_filename("pid file name", server.pid_file_name);
    if (names.count(server.config_name) == 0)
        throw ConfigError(fmt::format("server config '{}' is not produced by any template", server.config_name));
    require_command("server command", server.command,
                    {{"config", "x"}, {"pid_file", "x"}, {"sandbox", "x"}});
    require_positive("server start timeout", server.start_timeout);
    require_positive("server stop timeout", server.stop_timeout);
    require_positive("server kill timeout", server.kill_timeout);
    if (server.test_mode && server.test_mode_env.empty())
        throw ConfigError("test mode needs an environment variable name");

    const auto &ready = config.readiness;
    if (ready.mode == ReadinessMode::Delay) {
        require_bounded("settle delay", ready.settle_delay);
    } else {
        if (ready.host.empty() || ready.port == 0)
            throw ConfigError("readiness probe needs a host and a non-zero port");
        require_positive("readiness timeout", ready.timeout);
        require_positive("readiness initial backoff", ready.initial_backoff);
        require_positive("readiness max backoff", ready.max_backoff);
        if (ready.max_backoff < ready.initial_backoff)
            throw ConfigError("readiness max backoff is below the initial backoff");
    }

    require_command("test command", config.tests.command,
                    {{"target", "x"}, {"report", "x"}, {"sandbox", "x"}});
    require_filename("test report name", config.tests.report_name);
    require_bounded("test timeout", config.tests.timeout);

    if (config.coverage.enabled) {
        if (config.coverage.launcher.empty())
            throw ConfigError("coverage is enabled but the launcher is empty");
        for (const auto &cmd : config.coverage.finalize) {
            require_command("coverage finalize command", cmd, {{"sandbox", "x"}});
        }
    }
}

} // namespace vaultrig
