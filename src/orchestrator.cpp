#include "vaultrig/orchestrator.h"

#include "vaultrig/certificate.h"
#include "vaultrig/coverage.h"
#include "vaultrig/log.h"
#include "vaultrig/readiness.h"
#include "vaultrig/sandbox.h"
#include "vaultrig/supervisor.h"
#include "vaultrig/test_runner.h"

#include <chrono>
#include <csignal>
#include <set>

#include <fmt/format.h>

namespace vaultrig {

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_interrupted{false};

constexpr RunState kStages[] = {
    RunState::Provisioning,      RunState::IssuingCertificate, RunState::ServerStarting,
    RunState::AwaitingReadiness, RunState::TestingRunning,     RunState::ServerStopping,
};

} // namespace

std::string_view to_string(RunState state) {
    switch (state) {
    case RunState::Idle: return "Idle";
    case RunState::Provisioning: return "Provisioning";
    case RunState::IssuingCertificate: return "IssuingCertificate";
    case RunState::ServerStarting: return "ServerStarting";
    case RunState::AwaitingReadiness: return "AwaitingReadiness";
    case RunState::TestingRunning: return "TestingRunning";
    case RunState::ServerStopping: return "ServerStopping";
    case RunState::Done: return "Done";
    }
    return "Unknown";
}

int RunResult::exit_code() const {
    if (test_exit_status)
        return *test_exit_status;
    if (interrupted)
        return 130;
    return 1;
}

const std::atomic<bool> &install_interrupt_handlers() {
    std::signal(SIGINT, [](int) { g_interrupted.store(true); });
    std::signal(SIGTERM, [](int) { g_interrupted.store(true); });
    return g_interrupted;
}

Orchestrator::Orchestrator(HarnessConfig config, const std::atomic<bool> *interrupted)
    : config_(std::move(config)), interrupted_(interrupted) {}

void Orchestrator::transition(RunResult &result, RunState next) {
    log::info("{} -> {}", to_string(result.state), to_string(next));
    result.state = next;
}

StageRecord &Orchestrator::record_for(RunState state) {
    for (auto &rec : stages_) {
        if (rec.name == to_string(state))
            return rec;
    }
    stages_.push_back(StageRecord{std::string(to_string(state))});
    return stages_.back();
}

void Orchestrator::record(RunResult &result, const error &e, bool fatal) {
    if (fatal)
        log::error("{}: {}", to_string(e.kind()), e.what());
    else
        log::warn("{}: {}", to_string(e.kind()), e.what());
    result.errors.push_back(RunError{e.kind(), result.state, fatal, e.what()});
}

bool Orchestrator::stage(RunResult &result, RunState state, const std::function<void(StageRecord &)> &body, bool cleanup) {
    if (!cleanup && interrupted()) {
        result.interrupted = true;
        return false;
    }
    transition(result, state);
    StageRecord &rec = record_for(state);
    rec.ran = true;
    const auto started = std::chrono::steady_clock::now();
    bool ok = true;
    try {
        body(rec);
    } catch (const error &e) {
        record(result, e, true);
        rec.failed  = true;
        rec.message = fmt::format("{}: {}", to_string(e.kind()), e.what());
        ok          = false;
    } catch (const std::exception &e) {
        log::error("{}: {}", to_string(ErrorKind::Internal), e.what());
        result.errors.push_back(RunError{ErrorKind::Internal, result.state, true, e.what()});
        rec.failed  = true;
        rec.message = fmt::format("{}: {}", to_string(ErrorKind::Internal), e.what());
        ok          = false;
    }
    rec.time_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    if (!cleanup && interrupted()) {
        log::warn("interrupted during {}", to_string(state));
        result.interrupted = true;
        return false;
    }
    return ok && !rec.failed;
}

RunResult Orchestrator::run() {
    RunResult result;
    stages_.clear();
    for (RunState state : kStages) {
        record_for(state);
    }

    fs::path               sandbox_root;
    const CoverageSession  coverage(config_.coverage);
    const ServerSupervisor supervisor(config_.server, coverage);

    RunLock          lock;
    SandboxDirectory sandbox;
    TLSIdentity      identity;
    ServerProcess    server;

    bool ok = stage(result, RunState::Provisioning, [&](StageRecord &) {
        sandbox_root = config_.sandbox_path();
        lock         = RunLock::acquire(sandbox_root);
        SandboxProvisioner provisioner(sandbox_root);
        std::vector<ConfigurationTemplate> templates = config_.templates;
        for (auto &tpl : templates) {
            tpl.name   = tpl.target_name();
            tpl.source = config_.resolve(tpl.source);
        }
        sandbox = provisioner.provision(templates);
        for (const auto &tpl : templates) {
            provisioner.parametrize(sandbox, tpl);
        }
    });

    ok = ok && stage(result, RunState::IssuingCertificate, [&](StageRecord &) {
        CertificateIssuer issuer(config_.certificate);
        identity = issuer.issue(sandbox, config_.resolve(config_.certificate.subject_config));
        const CertificateInfo info = inspect_certificate(identity.cert_path);
        log::info("issued {} valid for {} days", info.subject, info.validity_days);
    });

    ok = ok && stage(result, RunState::ServerStarting, [&](StageRecord &) {
        ServerLaunch launch;
        launch.sandbox     = sandbox;
        launch.config_path = sandbox.file(config_.server.config_name);
        launch.pid_file    = sandbox.file(config_.server.pid_file_name);
        launch.test_mode   = config_.server.test_mode;
        server             = supervisor.start(launch);
    });

    // Interrupted or not, a started server goes through ServerStopping.
    if (!server.empty()) {
        const bool ready = stage(result, RunState::AwaitingReadiness, [&](StageRecord &) {
            ReadinessProbe probe(config_.readiness, interrupted_);
            probe.wait(server, identity.cert_path);
        });

        if (ready) {
            stage(result, RunState::TestingRunning, [&](StageRecord &rec) {
                TestRunner runner(config_.tests, sandbox, coverage, supervisor.child_env(config_.server.test_mode, {}),
                                  interrupted_);
                const TestOutcome outcome = runner.run(config_.tests.target_dir, config_.resolve(config_.tests.working_dir));
                result.report_path = outcome.report_path;
                if (!outcome.cancelled)
                    result.test_exit_status = outcome.exit_code;
                if (outcome.exit_code != 0) {
                    std::string message = outcome.error.empty() ? fmt::format("tests exited with {}", outcome.exit_code)
                                                                : fmt::format("{} (exit {})", outcome.error, outcome.exit_code);
                    log::warn("{}", message);
                    result.errors.push_back(RunError{ErrorKind::TestExecution, result.state, false, message});
                    rec.failed  = true;
                    rec.message = std::move(message);
                }
            });
        }

        stage(
            result, RunState::ServerStopping,
            [&](StageRecord &rec) {
                try {
                    supervisor.stop(server, config_.server.stop_timeout);
                } catch (const ShutdownTimeoutError &e) {
                    record(result, e, false);
                    rec.failed  = true;
                    rec.message = e.what();
                    try {
                        supervisor.kill(server, config_.server.kill_timeout);
                    } catch (const error &kill_error) {
                        record(result, kill_error, false);
                        rec.message = kill_error.what();
                    }
                } catch (const error &e) {
                    record(result, e, false);
                    rec.failed  = true;
                    rec.message = e.what();
                }

                std::set<fs::path> dirs{sandbox.path};
                if (!config_.tests.working_dir.empty())
                    dirs.insert(config_.resolve(config_.tests.working_dir));
                result.coverage_artifact_paths = coverage.finalize(sandbox, {dirs.begin(), dirs.end()});
                for (const auto &artifact : result.coverage_artifact_paths) {
                    log::debug("coverage artifact {}", artifact.string());
                }
            },
            true);
    }

    if (interrupted())
        result.interrupted = true;
    transition(result, RunState::Done);
    write_report(result);
    log::info("run finished with exit status {}", result.exit_code());
    return result;
}

void Orchestrator::write_report(const RunResult &result) const {
    if (config_.junit_path.empty())
        return;
    std::vector<std::string> cleanup_errors;
    for (const auto &err : result.errors) {
        if (!err.fatal && err.kind != ErrorKind::TestExecution)
            cleanup_errors.push_back(fmt::format("{}: {}", to_string(err.kind), err.message));
    }
    std::string message;
    const fs::path path = config_.resolve(config_.junit_path);
    if (!write_junit_report(path, stages_, cleanup_errors, &message))
        log::warn("{}", message);
    else
        log::info("wrote {}", path.string());
}

} // namespace vaultrig
