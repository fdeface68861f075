#include "vaultrig/config.h"

#include <fstream>
#include <limits>
#include <sstream>

#include <boost/json.hpp>
#include <boost/json/src.hpp>
#include <fmt/format.h>

namespace vaultrig {

namespace bjson = boost::json;

namespace {

[[noreturn]] void invalid(std::string_view section, std::string_view key, std::string_view expected) {
    throw ConfigError(fmt::format("invalid {}.{}: expected {}", section, key, expected));
}

const bjson::object *get_section(const bjson::object &root, std::string_view key) {
    const bjson::value *value = root.if_contains(key);
    if (value == nullptr)
        return nullptr;
    if (!value->is_object())
        invalid("config", key, "an object");
    return &value->as_object();
}

void assign_string(const bjson::object &obj, std::string_view section, std::string_view key, std::string &target) {
    if (const bjson::value *value = obj.if_contains(key)) {
        if (!value->is_string())
            invalid(section, key, "a string");
        target = std::string(value->as_string());
    }
}

void assign_path(const bjson::object &obj, std::string_view section, std::string_view key, std::filesystem::path &target) {
    std::string text;
    if (obj.if_contains(key) == nullptr)
        return;
    assign_string(obj, section, key, text);
    target = text;
}

void assign_bool(const bjson::object &obj, std::string_view section, std::string_view key, bool &target) {
    if (const bjson::value *value = obj.if_contains(key)) {
        if (!value->is_bool())
            invalid(section, key, "a boolean");
        target = value->as_bool();
    }
}

void assign_int(const bjson::object &obj, std::string_view section, std::string_view key, std::int64_t min,
                std::int64_t max, std::int64_t &target) {
    const bjson::value *value = obj.if_contains(key);
    if (value == nullptr)
        return;
    std::int64_t n = 0;
    if (value->is_int64()) {
        n = value->as_int64();
    } else if (value->is_uint64() && value->as_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        n = static_cast<std::int64_t>(value->as_uint64());
    } else {
        invalid(section, key, "an integer");
    }
    if (n < min || n > max)
        invalid(section, key, fmt::format("an integer in [{}, {}]", min, max));
    target = n;
}

void assign_ms(const bjson::object &obj, std::string_view section, std::string_view key, std::chrono::milliseconds &target) {
    std::int64_t n = target.count();
    assign_int(obj, section, key, 0, static_cast<std::int64_t>(kMaxDuration.count()), n);
    target = std::chrono::milliseconds(n);
}

std::vector<std::string> to_string_array(const bjson::value &value, std::string_view section, std::string_view key) {
    if (!value.is_array())
        invalid(section, key, "an array of strings");
    std::vector<std::string> out;
    for (const bjson::value &item : value.as_array()) {
        if (!item.is_string())
            invalid(section, key, "an array of strings");
        out.emplace_back(item.as_string());
    }
    return out;
}

void assign_string_array(const bjson::object &obj, std::string_view section, std::string_view key,
                         std::vector<std::string> &target) {
    if (const bjson::value *value = obj.if_contains(key))
        target = to_string_array(*value, section, key);
}

void assign_env(const bjson::object &obj, std::string_view section, std::string_view key,
                std::vector<process::EnvVar> &target) {
    const bjson::value *value = obj.if_contains(key);
    if (value == nullptr)
        return;
    if (!value->is_object())
        invalid(section, key, "an object of strings");
    target.clear();
    for (const auto &item : value->as_object()) {
        if (!item.value().is_string())
            invalid(section, key, "an object of strings");
        target.push_back(process::EnvVar{std::string(item.key()), std::string(item.value().as_string())});
    }
}

ConfigurationTemplate parse_template(const bjson::value &value) {
    ConfigurationTemplate tpl;
    if (value.is_string()) {
        tpl.source = std::string(value.as_string());
        return tpl;
    }
    if (!value.is_object())
        invalid("templates", "[]", "a path or an object");
    const bjson::object &jt = value.as_object();
    assign_path(jt, "templates", "source", tpl.source);
    assign_string(jt, "templates", "name", tpl.name);
    if (const bjson::value *overrides = jt.if_contains("overrides")) {
        if (!overrides->is_array())
            invalid("templates", "overrides", "an array");
        for (const bjson::value &item : overrides->as_array()) {
            if (!item.is_object())
                invalid("templates", "overrides", "an array of objects");
            const bjson::object &jo = item.as_object();
            IniOverride ov;
            assign_string(jo, "overrides", "section", ov.section);
            assign_string(jo, "overrides", "key", ov.key);
            if (const bjson::value *v = jo.if_contains("value")) {
                if (v->is_string())
                    ov.value = std::string(v->as_string());
                else if (v->is_int64() || v->is_uint64() || v->is_bool())
                    ov.value = bjson::serialize(*v);
                else
                    invalid("overrides", "value", "a string, number or boolean");
            }
            tpl.overrides.push_back(std::move(ov));
        }
    }
    return tpl;
}

void load_certificate(const bjson::object &jc, CertificateConfig &cert) {
    std::int64_t n = 0;
    assign_path(jc, "certificate", "subject_config", cert.subject_config);
    n = cert.key_bits;
    assign_int(jc, "certificate", "key_bits", 0, 16384, n);
    cert.key_bits = static_cast<int>(n);
    n = cert.validity_days;
    assign_int(jc, "certificate", "validity_days", 0, 36500, n);
    cert.validity_days = static_cast<int>(n);
    assign_string(jc, "certificate", "digest", cert.digest);
    assign_string(jc, "certificate", "key_name", cert.key_name);
    assign_string(jc, "certificate", "cert_name", cert.cert_name);
    assign_string(jc, "certificate", "bundle_name", cert.bundle_name);
}

void load_server(const bjson::object &js, ServerConfig &server) {
    assign_string_array(js, "server", "command", server.command);
    assign_string(js, "server", "config_name", server.config_name);
    assign_string(js, "server", "pid_file_name", server.pid_file_name);
    assign_bool(js, "server", "daemon", server.daemon);
    assign_bool(js, "server", "test_mode", server.test_mode);
    assign_string(js, "server", "test_mode_env", server.test_mode_env);
    assign_env(js, "server", "env", server.env);
    assign_ms(js, "server", "start_timeout_ms", server.start_timeout);
    assign_ms(js, "server", "stop_timeout_ms", server.stop_timeout);
    assign_ms(js, "server", "kill_timeout_ms", server.kill_timeout);
}

void load_readiness(const bjson::object &jr, ReadinessConfig &ready) {
    std::string mode;
    assign_string(jr, "readiness", "mode", mode);
    if (mode == "delay")
        ready.mode = ReadinessMode::Delay;
    else if (mode == "probe")
        ready.mode = ReadinessMode::Probe;
    else if (!mode.empty())
        invalid("readiness", "mode", "one of delay,probe");
    assign_ms(jr, "readiness", "settle_delay_ms", ready.settle_delay);
    assign_string(jr, "readiness", "host", ready.host);
    std::int64_t port = ready.port;
    assign_int(jr, "readiness", "port", 1, 65535, port);
    ready.port = static_cast<std::uint16_t>(port);
    assign_bool(jr, "readiness", "tls", ready.tls);
    assign_ms(jr, "readiness", "initial_backoff_ms", ready.initial_backoff);
    assign_ms(jr, "readiness", "max_backoff_ms", ready.max_backoff);
    assign_ms(jr, "readiness", "timeout_ms", ready.timeout);
}

void load_tests(const bjson::object &jt, TestsConfig &tests) {
    assign_string_array(jt, "tests", "command", tests.command);
    assign_path(jt, "tests", "target_dir", tests.target_dir);
    assign_path(jt, "tests", "working_dir", tests.working_dir);
    assign_string(jt, "tests", "report_name", tests.report_name);
    assign_ms(jt, "tests", "timeout_ms", tests.timeout);
}

void load_coverage(const bjson::object &jc, CoverageConfig &coverage) {
    assign_bool(jc, "coverage", "enabled", coverage.enabled);
    assign_string_array(jc, "coverage", "launcher", coverage.launcher);
    assign_string(jc, "coverage", "data_prefix", coverage.data_prefix);
    assign_string_array(jc, "coverage", "artifacts", coverage.artifacts);
    if (const bjson::value *finalize = jc.if_contains("finalize")) {
        if (!finalize->is_array())
            invalid("coverage", "finalize", "an array of commands");
        coverage.finalize.clear();
        for (const bjson::value &cmd : finalize->as_array()) {
            coverage.finalize.push_back(to_string_array(cmd, "coverage", "finalize"));
        }
    }
}

} // namespace

void load_config_json(const std::filesystem::path &path, HarnessConfig &config) {
    std::ifstream file(path);
    if (!file)
        throw ConfigError(fmt::format("failed to open config file '{}'", path.string()));

    std::ostringstream input;
    input << file.rdbuf();

    boost::system::error_code ec;
    bjson::value root = bjson::parse(input.str(), ec);
    if (ec)
        throw ConfigError(fmt::format("invalid JSON in '{}': {}", path.string(), ec.message()));
    if (!root.is_object())
        throw ConfigError(fmt::format("config file '{}' must hold a JSON object", path.string()));
    const bjson::object &j = root.as_object();

    // Relative paths in the file are relative to the file itself.
    const auto file_dir = std::filesystem::absolute(path).parent_path();
    config.base_dir     = file_dir;
    if (const bjson::object *sandbox = get_section(j, "sandbox")) {
        assign_path(*sandbox, "sandbox", "base_dir", config.base_dir);
        if (config.base_dir.is_relative())
            config.base_dir = (file_dir / config.base_dir).lexically_normal();
        assign_path(*sandbox, "sandbox", "path", config.sandbox_dir);
    }
    if (const bjson::value *templates = j.if_contains("templates")) {
        if (!templates->is_array())
            invalid("config", "templates", "an array");
        config.templates.clear();
        for (const bjson::value &item : templates->as_array()) {
            config.templates.push_back(parse_template(item));
        }
    }
    if (const bjson::object *cert = get_section(j, "certificate"))
        load_certificate(*cert, config.certificate);
    if (const bjson::object *server = get_section(j, "server"))
        load_server(*server, config.server);
    if (const bjson::object *ready = get_section(j, "readiness"))
        load_readiness(*ready, config.readiness);
    if (const bjson::object *tests = get_section(j, "tests"))
        load_tests(*tests, config.tests);
    if (const bjson::object *coverage = get_section(j, "coverage"))
        load_coverage(*coverage, config.coverage);
    if (const bjson::object *report = get_section(j, "report"))
        assign_path(*report, "report", "junit", config.junit_path);
}

} // namespace vaultrig
