#include "test_util.h"

#include "vaultrig/process.h"

#include <gtest/gtest.h>

#include <atomic>
#include <csignal>
#include <thread>

using namespace std::chrono_literals;
using vaultrig_tests::TempDir;

TEST(Process, RunSubprocessCapturesOutputAndExitCode) {
    vaultrig::process::SubprocessOptions opts;
    opts.argv = {"sh", "-c", "echo out; echo err >&2; exit 3"};
    const auto result = vaultrig::process::run_subprocess(opts);
    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.error.empty()) << result.error;
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
}

TEST(Process, RunSubprocessPassesEnvironmentAndWorkingDirectory) {
    TempDir tmp("cwd");
    vaultrig::process::SubprocessOptions opts;
    opts.argv        = {"sh", "-c", "pwd; echo \"$VAULTRIG_PROBE\""};
    opts.env         = {{"VAULTRIG_PROBE", "yes"}};
    opts.working_dir = tmp.path().string();
    const auto result = vaultrig::process::run_subprocess(opts);
    ASSERT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, std::filesystem::canonical(tmp.path()).string() + "\nyes\n");
    EXPECT_EQ(std::getenv("VAULTRIG_PROBE"), nullptr);
}

TEST(Process, ExecFailureIsReportedNotHidden) {
    vaultrig::process::SubprocessOptions opts;
    opts.argv = {"vaultrig-no-such-program-xyz"};
    const auto result = vaultrig::process::run_subprocess(opts);
    EXPECT_FALSE(result.started);
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.error.find("exec failed for 'vaultrig-no-such-program-xyz'"), std::string::npos) << result.error;
}

TEST(Process, TimeoutTerminatesTheChild) {
    vaultrig::process::SubprocessOptions opts;
    opts.argv    = {"sleep", "30"};
    opts.timeout = 200ms;
    const auto started = std::chrono::steady_clock::now();
    const auto result  = vaultrig::process::run_subprocess(opts);
    EXPECT_TRUE(result.timed_out);
    EXPECT_TRUE(result.signaled);
    EXPECT_EQ(result.exit_code, 128 + SIGTERM);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
}

TEST(Process, CancelFlagStopsTheChild) {
    std::atomic<bool> cancel{false};
    std::thread trigger([&] {
        std::this_thread::sleep_for(100ms);
        cancel.store(true);
    });
    vaultrig::process::SubprocessOptions opts;
    opts.argv   = {"sleep", "30"};
    opts.cancel = &cancel;
    const auto result = vaultrig::process::run_subprocess(opts);
    trigger.join();
    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
}

TEST(Process, SpawnWaitAndSignal) {
    vaultrig::process::SpawnOptions opts;
    opts.argv = {"sleep", "30"};
    const auto spawned = vaultrig::process::spawn_detached(opts);
    ASSERT_TRUE(spawned.error.empty()) << spawned.error;
    ASSERT_GT(spawned.pid, 1);
    EXPECT_TRUE(vaultrig::process::is_alive(spawned.pid));

    const auto early = vaultrig::process::wait_child(spawned.pid, 50ms);
    EXPECT_TRUE(early.timed_out);

    std::string error;
    EXPECT_TRUE(vaultrig::process::send_signal(spawned.pid, SIGINT, &error)) << error;
    const auto waited = vaultrig::process::wait_child(spawned.pid, 5000ms);
    EXPECT_TRUE(waited.exited);
    EXPECT_TRUE(waited.signaled);
    EXPECT_EQ(waited.signal, SIGINT);
    EXPECT_FALSE(vaultrig::process::is_alive(spawned.pid));

    EXPECT_FALSE(vaultrig::process::send_signal(spawned.pid, SIGINT, &error));
    EXPECT_EQ(error, "no such process");
}

TEST(Process, SpawnRedirectsOutputToFile) {
    TempDir tmp("spawnlog");
    vaultrig::process::SpawnOptions opts;
    opts.argv        = {"sh", "-c", "echo hello"};
    opts.output_path = (tmp / "out.log").string();
    const auto spawned = vaultrig::process::spawn_detached(opts);
    ASSERT_TRUE(spawned.error.empty()) << spawned.error;
    const auto waited = vaultrig::process::wait_child(spawned.pid, 0ms);
    EXPECT_EQ(waited.exit_code, 0);
    EXPECT_EQ(vaultrig_tests::read_file_text(tmp / "out.log"), "hello\n");
}

TEST(Process, SpawnReportsExecFailure) {
    vaultrig::process::SpawnOptions opts;
    opts.argv = {"vaultrig-no-such-program-xyz"};
    const auto spawned = vaultrig::process::spawn_detached(opts);
    EXPECT_EQ(spawned.pid, -1);
    EXPECT_FALSE(spawned.error.empty());
}

TEST(Process, RefusesToSignalInitOrInvalidPids) {
    std::string error;
    EXPECT_FALSE(vaultrig::process::send_signal(1, SIGINT, &error));
    EXPECT_NE(error.find("refusing"), std::string::npos);
    EXPECT_FALSE(vaultrig::process::send_signal(0, SIGINT, &error));
    EXPECT_FALSE(vaultrig::process::send_signal(-1, SIGINT, &error));
    EXPECT_FALSE(vaultrig::process::is_alive(-1));
    EXPECT_TRUE(vaultrig::process::is_alive(::getpid()));
}

TEST(Process, FindProgramSearchesPath) {
    const auto sh = vaultrig::process::find_program("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->front(), '/');
    EXPECT_FALSE(vaultrig::process::find_program("vaultrig-no-such-program-xyz").has_value());
    EXPECT_EQ(vaultrig::process::find_program(vaultrig_tests::self_path()), vaultrig_tests::self_path());
}

TEST(Process, FormatCommandQuotesWhereNeeded) {
    EXPECT_EQ(vaultrig::process::format_command({"paster", "serve", "--daemon"}), "paster serve --daemon");
    EXPECT_EQ(vaultrig::process::format_command({"sh", "-c", "exit 2"}), "sh -c 'exit 2'");
    EXPECT_EQ(vaultrig::process::format_command({"echo", "it's", ""}), "echo 'it'\\''s' ''");
}
