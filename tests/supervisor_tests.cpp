#include "test_util.h"

#include "vaultrig/supervisor.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <csignal>
#include <thread>

using namespace std::chrono_literals;
using vaultrig_tests::fake_server_command;
using vaultrig_tests::TempDir;
using vaultrig_tests::write_file;

namespace {

vaultrig::ServerConfig server_config(std::vector<std::string> command, bool daemon = true) {
    vaultrig::ServerConfig config;
    config.command       = std::move(command);
    config.daemon        = daemon;
    config.start_timeout = 5000ms;
    config.stop_timeout  = 5000ms;
    config.kill_timeout  = 2000ms;
    return config;
}

vaultrig::ServerLaunch make_launch(const TempDir &tmp) {
    std::filesystem::create_directories(tmp / "sandbox");
    vaultrig::ServerLaunch launch;
    launch.sandbox.path = tmp / "sandbox";
    launch.config_path  = launch.sandbox.file("test-server.ini");
    launch.pid_file     = launch.sandbox.file("test-server.pid");
    write_file(launch.config_path, vaultrig_tests::kServerIni);
    return launch;
}

vaultrig::CoverageSession no_coverage() {
    vaultrig::CoverageConfig config;
    config.enabled = false;
    return vaultrig::CoverageSession(config);
}

bool wait_until_dead(pid_t pid, std::chrono::milliseconds budget) {
    const auto deadline = std::chrono::steady_clock::now() + budget;
    while (vaultrig::process::is_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(20ms);
    }
    return true;
}

} // namespace

TEST(ServerSupervisor, DaemonStartAndStop) {
    TempDir tmp("daemon");
    const auto launch = make_launch(tmp);
    vaultrig::ServerSupervisor supervisor(server_config(fake_server_command("daemon", {"{pid_file}"})), no_coverage());

    auto server = supervisor.start(launch);
    ASSERT_FALSE(server.empty());
    EXPECT_FALSE(server.owned_child());
    EXPECT_TRUE(server.running());
    EXPECT_EQ(server.config_path(), launch.config_path);
    const pid_t pid = server.pid();
    EXPECT_EQ(vaultrig::read_pid_file(launch.pid_file), pid);

    supervisor.stop(server, 5000ms);
    EXPECT_TRUE(server.empty());
    EXPECT_FALSE(std::filesystem::exists(launch.pid_file));
    EXPECT_FALSE(vaultrig::process::is_alive(pid));
}

TEST(ServerSupervisor, ForegroundStartWritesPidFile) {
    TempDir tmp("foreground");
    const auto launch = make_launch(tmp);
    vaultrig::ServerSupervisor supervisor(server_config(fake_server_command("foreground"), false), no_coverage());

    auto server = supervisor.start(launch);
    ASSERT_FALSE(server.empty());
    EXPECT_TRUE(server.owned_child());
    EXPECT_EQ(vaultrig::read_pid_file(launch.pid_file), server.pid());
    EXPECT_TRUE(std::filesystem::exists(launch.sandbox.file("server.log")));

    supervisor.stop(server, 5000ms);
    EXPECT_FALSE(std::filesystem::exists(launch.pid_file));
}

TEST(ServerSupervisor, StalePidFileIsReplaced) {
    TempDir tmp("stale");
    const auto launch = make_launch(tmp);
    write_file(launch.pid_file, "999999999\n");
    vaultrig::ServerSupervisor supervisor(server_config(fake_server_command("daemon", {"{pid_file}"})), no_coverage());

    auto server = supervisor.start(launch);
    EXPECT_EQ(vaultrig::read_pid_file(launch.pid_file), server.pid());
    supervisor.stop(server, 5000ms);
}

TEST(ServerSupervisor, StubbornServerTimesOutThenGetsKilled) {
    TempDir tmp("stubborn");
    const auto launch = make_launch(tmp);
    vaultrig::ServerSupervisor supervisor(server_config(fake_server_command("stubborn", {"{pid_file}"})), no_coverage());

    auto server = supervisor.start(launch);
    const pid_t pid = server.pid();
    EXPECT_THROW(supervisor.stop(server, 300ms), vaultrig::ShutdownTimeoutError);
    EXPECT_FALSE(server.empty());
    EXPECT_TRUE(std::filesystem::exists(launch.pid_file));

    supervisor.kill(server, 2000ms);
    EXPECT_TRUE(server.empty());
    EXPECT_FALSE(std::filesystem::exists(launch.pid_file));
    EXPECT_FALSE(vaultrig::process::is_alive(pid));
}

TEST(ServerSupervisor, StopOnEmptyHandleIsProcessNotFound) {
    vaultrig::ServerSupervisor supervisor(server_config({"true"}), no_coverage());
    vaultrig::ServerProcess    server;
    EXPECT_THROW(supervisor.stop(server, 100ms), vaultrig::ProcessNotFoundError);
    EXPECT_THROW(supervisor.kill(server, 100ms), vaultrig::ProcessNotFoundError);
}

TEST(ServerSupervisor, FailingLauncherIsAStartError) {
    TempDir tmp("exit3");
    const auto launch = make_launch(tmp);
    vaultrig::ServerSupervisor supervisor(server_config(fake_server_command("exit", {"3"})), no_coverage());
    try {
        (void)supervisor.start(launch);
        FAIL() << "expected ServerStartError";
    } catch (const vaultrig::ServerStartError &e) {
        EXPECT_NE(std::string(e.what()).find("exited with 3"), std::string::npos) << e.what();
    }
}

TEST(ServerSupervisor, MissingProgramIsAStartError) {
    TempDir tmp("noexec");
    const auto launch = make_launch(tmp);
    vaultrig::ServerSupervisor supervisor(server_config({"vaultrig-no-such-server", "{config}"}), no_coverage());
    EXPECT_THROW((void)supervisor.start(launch), vaultrig::ServerStartError);

    vaultrig::ServerSupervisor fg(server_config({"vaultrig-no-such-server"}, false), no_coverage());
    EXPECT_THROW((void)fg.start(launch), vaultrig::ServerStartError);
}

TEST(ServerSupervisor, LauncherWithoutPidFileTimesOut) {
    TempDir tmp("nopid");
    const auto launch = make_launch(tmp);
    auto config = server_config({"true"});
    config.start_timeout = 300ms;
    vaultrig::ServerSupervisor supervisor(config, no_coverage());
    try {
        (void)supervisor.start(launch);
        FAIL() << "expected ServerStartError";
    } catch (const vaultrig::ServerStartError &e) {
        EXPECT_NE(std::string(e.what()).find("did not appear"), std::string::npos) << e.what();
    }
}

TEST(ServerSupervisor, UnknownPlaceholderIsAStartError) {
    TempDir tmp("placeholder");
    const auto launch = make_launch(tmp);
    vaultrig::ServerSupervisor supervisor(server_config({"true", "{nope}"}), no_coverage());
    EXPECT_THROW((void)supervisor.start(launch), vaultrig::ServerStartError);
}

TEST(ServerSupervisor, RecoverReadsPidFile) {
    TempDir tmp("recover");
    EXPECT_THROW((void)vaultrig::ServerSupervisor::recover(tmp / "missing.pid"), vaultrig::ProcessNotFoundError);

    write_file(tmp / "bad.pid", "not-a-pid\n");
    EXPECT_THROW((void)vaultrig::ServerSupervisor::recover(tmp / "bad.pid"), vaultrig::ProcessNotFoundError);

    const auto launch = make_launch(tmp);
    vaultrig::ServerSupervisor supervisor(server_config(fake_server_command("daemon", {"{pid_file}"})), no_coverage());
    auto started = supervisor.start(launch);
    const pid_t pid = started.pid();

    auto recovered = vaultrig::ServerSupervisor::recover(launch.pid_file, launch.config_path);
    EXPECT_EQ(recovered.pid(), pid);
    EXPECT_FALSE(recovered.owned_child());
    supervisor.stop(recovered, 5000ms);
    EXPECT_FALSE(vaultrig::process::is_alive(pid));

    // The original handle now points at a dead process; stopping it is not an error.
    supervisor.stop(started, 1000ms);
    EXPECT_TRUE(started.empty());
}

TEST(ServerSupervisor, DestructorReleasesTheServer) {
    TempDir tmp("release");
    const auto launch = make_launch(tmp);
    vaultrig::ServerSupervisor supervisor(server_config(fake_server_command("daemon", {"{pid_file}"})), no_coverage());

    pid_t pid = -1;
    {
        auto server = supervisor.start(launch);
        pid         = server.pid();
        auto moved  = std::move(server);
        EXPECT_TRUE(server.empty());
        EXPECT_EQ(moved.pid(), pid);
    }
    EXPECT_TRUE(wait_until_dead(pid, 2000ms));
    EXPECT_FALSE(std::filesystem::exists(launch.pid_file));
}

TEST(ServerSupervisor, ChildEnvironmentCarriesTestMode) {
    auto config = server_config({"true"});
    config.env  = {{"A", "1"}};
    vaultrig::ServerSupervisor supervisor(config, no_coverage());

    const auto with = supervisor.child_env(true, {{"B", "2"}});
    ASSERT_EQ(with.size(), 3u);
    EXPECT_EQ(with[0].key, "A");
    EXPECT_EQ(with[1].key, "B");
    EXPECT_EQ(with[2].key, "SFLVAULT_IN_TEST");
    EXPECT_EQ(with[2].value, "true");

    const auto without = supervisor.child_env(false, {});
    EXPECT_TRUE(std::none_of(without.begin(), without.end(), [](const auto &var) { return var.key == "SFLVAULT_IN_TEST"; }));
}

TEST(ReadPidFile, RejectsGarbageAndReservedPids) {
    TempDir tmp("pidfile");
    std::string error;

    write_file(tmp / "ok.pid", "  4242 \n");
    EXPECT_EQ(vaultrig::read_pid_file(tmp / "ok.pid"), 4242);

    EXPECT_FALSE(vaultrig::read_pid_file(tmp / "missing.pid", &error));
    EXPECT_NE(error.find("cannot read"), std::string::npos);

    write_file(tmp / "empty.pid", "\n");
    EXPECT_FALSE(vaultrig::read_pid_file(tmp / "empty.pid", &error));
    EXPECT_NE(error.find("empty"), std::string::npos);

    for (const char *text : {"1", "0", "-5", "12abc", "99999999999"}) {
        write_file(tmp / "bad.pid", text);
        EXPECT_FALSE(vaultrig::read_pid_file(tmp / "bad.pid", &error)) << text;
        EXPECT_NE(error.find("invalid pid"), std::string::npos) << text;
    }
}
