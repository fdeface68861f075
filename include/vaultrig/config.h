#pragma once

#include "vaultrig/error.h"
#include "vaultrig/process.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace vaultrig {

// Upper bound for every millisecond setting, so deadlines stay representable.
inline constexpr std::chrono::milliseconds kMaxDuration{std::chrono::hours(24)};

struct IniOverride {
    std::string section; // empty matches the key in any section
    std::string key;
    std::string value;
};

struct ConfigurationTemplate {
    std::filesystem::path    source;
    std::string              name; // defaults to source.filename()
    std::vector<IniOverride> overrides;

    std::string target_name() const;
};

struct CertificateConfig {
    std::filesystem::path subject_config;
    int                   key_bits      = 2048;
    int                   validity_days = 365;
    std::string           digest        = "sha256";
    std::string           key_name      = "host.key";
    std::string           cert_name     = "host.cert";
    std::string           bundle_name   = "host.pem";
};

struct ServerConfig {
    std::vector<std::string>    command;
    std::string                 config_name   = "test-server.ini";
    std::string                 pid_file_name = "test-server.pid";
    bool                        daemon        = true;
    bool                        test_mode     = true;
    std::string                 test_mode_env = "SFLVAULT_IN_TEST";
    std::vector<process::EnvVar> env;
    std::chrono::milliseconds   start_timeout{10000};
    std::chrono::milliseconds   stop_timeout{10000};
    std::chrono::milliseconds   kill_timeout{5000};
};

enum class ReadinessMode {
    Delay,
    Probe,
};

struct ReadinessConfig {
    ReadinessMode             mode = ReadinessMode::Delay;
    std::chrono::milliseconds settle_delay{3000};
    std::string               host = "127.0.0.1";
    std::uint16_t             port = 5767;
    bool                      tls  = true;
    std::chrono::milliseconds initial_backoff{50};
    std::chrono::milliseconds max_backoff{1000};
    std::chrono::milliseconds timeout{30000};
};

struct TestsConfig {
    std::vector<std::string>  command;
    std::filesystem::path     target_dir = "..";
    std::filesystem::path     working_dir; // empty means the sandbox
    std::string               report_name = "nosetests.xml";
    std::chrono::milliseconds timeout{0};
};

struct CoverageConfig {
    bool                                  enabled = true;
    std::vector<std::string>              launcher;
    std::string                           data_prefix = ".coverage";
    std::vector<std::vector<std::string>> finalize;
    std::vector<std::string>              artifacts;
};

struct HarnessConfig {
    std::filesystem::path              base_dir; // relative paths resolve here
    std::filesystem::path              sandbox_dir = "sandbox";
    std::vector<ConfigurationTemplate> templates;
    CertificateConfig                  certificate;
    ServerConfig                       server;
    ReadinessConfig                    readiness;
    TestsConfig                        tests;
    CoverageConfig                     coverage;
    std::filesystem::path              junit_path;

    std::filesystem::path resolve(const std::filesystem::path &path) const;
    std::filesystem::path sandbox_path() const;
};

// Layout of the shell harness that ships with the vault server sources.
HarnessConfig default_config(const std::filesystem::path &base_dir);

// Throws ConfigError.
void validate(const HarnessConfig &config);

// Expands {name} placeholders; unknown names throw ConfigError.
std::vector<std::string> expand_command(const std::vector<std::string> &command,
                                        const std::map<std::string, std::string> &values);

#ifdef VAULTRIG_USE_BOOST_JSON
// Layers the file's values over `config`. Throws ConfigError.
void load_config_json(const std::filesystem::path &path, HarnessConfig &config);
#else
inline void load_config_json(const std::filesystem::path &, HarnessConfig &) {
    throw ConfigError("JSON support disabled");
}
#endif

} // namespace vaultrig
