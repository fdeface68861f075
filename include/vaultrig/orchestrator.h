#pragma once

#include "vaultrig/config.h"
#include "vaultrig/error.h"
#include "vaultrig/report.h"

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultrig {

enum class RunState {
    Idle,
    Provisioning,
    IssuingCertificate,
    ServerStarting,
    AwaitingReadiness,
    TestingRunning,
    ServerStopping,
    Done,
};

std::string_view to_string(RunState state);

struct RunError {
    ErrorKind   kind;
    RunState    state;
    bool        fatal = true;
    std::string message;
};

struct RunResult {
    RunState                           state = RunState::Idle;
    std::optional<int>                 test_exit_status;
    std::vector<std::filesystem::path> coverage_artifact_paths;
    std::filesystem::path              report_path;
    std::vector<RunError>              errors;
    bool                               interrupted = false;

    // Test exit status when the suite ran; 130 when interrupted; 1 otherwise.
    int exit_code() const;
};

class Orchestrator {
public:
    explicit Orchestrator(HarnessConfig config, const std::atomic<bool> *interrupted = nullptr);

    RunResult run();

    const std::vector<StageRecord> &stages() const { return stages_; }

private:
    bool interrupted() const { return interrupted_ != nullptr && interrupted_->load(); }
    void transition(RunResult &result, RunState next);
    // Runs one stage, recording its time and outcome. A thrown error is fatal
    // to the run; cleanup stages also run after an interrupt.
    bool stage(RunResult &result, RunState state, const std::function<void(StageRecord &)> &body, bool cleanup = false);
    StageRecord &record_for(RunState state);
    void record(RunResult &result, const error &e, bool fatal);
    void write_report(const RunResult &result) const;

    HarnessConfig            config_;
    const std::atomic<bool> *interrupted_;
    std::vector<StageRecord> stages_;
};

// SIGINT/SIGTERM set the returned flag instead of killing the harness.
const std::atomic<bool> &install_interrupt_handlers();

} // namespace vaultrig
