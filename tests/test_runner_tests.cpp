#include "test_util.h"

#include "vaultrig/test_runner.h"

#include <gtest/gtest.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <thread>

using namespace std::chrono_literals;
using vaultrig_tests::read_file_text;
using vaultrig_tests::TempDir;
using vaultrig_tests::write_file;

namespace {

vaultrig::CoverageSession no_coverage() {
    vaultrig::CoverageConfig config;
    config.enabled = false;
    return vaultrig::CoverageSession(config);
}

vaultrig::SandboxDirectory make_sandbox(const TempDir &tmp) {
    std::filesystem::create_directories(tmp / "sandbox");
    return vaultrig::SandboxDirectory{tmp / "sandbox"};
}

vaultrig::TestsConfig tests_config(std::vector<std::string> command) {
    vaultrig::TestsConfig config;
    config.command = std::move(command);
    return config;
}

} // namespace

TEST(TestRunner, ExitStatusPassesThrough) {
    TempDir tmp("status");
    const auto sandbox = make_sandbox(tmp);

    vaultrig::TestRunner failing(tests_config({"sh", "-c", "exit 2"}), sandbox, no_coverage(), {});
    const auto failed = failing.run("..", {});
    EXPECT_EQ(failed.exit_code, 2);
    EXPECT_FALSE(failed.passed());
    EXPECT_TRUE(failed.error.empty()) << failed.error;
    EXPECT_FALSE(failed.summary.has_value());

    vaultrig::TestRunner passing(tests_config({"true"}), sandbox, no_coverage(), {});
    EXPECT_TRUE(passing.run("..", {}).passed());
}

TEST(TestRunner, RunsInSandboxWithTargetAndReportPlaceholders) {
    TempDir tmp("report");
    const auto sandbox = make_sandbox(tmp);

    // $0 is the report path, $1 the target directory.
    const std::string script = "pwd > cwd.txt; echo \"$1\" > target.txt; "
                               "printf '<?xml version=\"1.0\"?><testsuite name=\"nosetests\" tests=\"7\" errors=\"1\" "
                               "failures=\"2\" skip=\"3\"></testsuite>' > \"$0\"";
    vaultrig::TestRunner runner(tests_config({"sh", "-c", script, "{report}", "{target}"}), sandbox, no_coverage(), {});
    const auto outcome = runner.run("..", {});

    ASSERT_EQ(outcome.exit_code, 0) << outcome.error;
    EXPECT_EQ(outcome.report_path, sandbox.file("nosetests.xml"));
    EXPECT_EQ(vaultrig_tests::trim_copy(read_file_text(sandbox.file("cwd.txt"))),
              std::filesystem::canonical(sandbox.path).string());
    EXPECT_EQ(vaultrig_tests::trim_copy(read_file_text(sandbox.file("target.txt"))), "..");
    ASSERT_TRUE(outcome.summary.has_value());
    EXPECT_EQ(outcome.summary->tests, 7);
    EXPECT_EQ(outcome.summary->failures, 2);
    EXPECT_EQ(outcome.summary->errors, 1);
    EXPECT_EQ(outcome.summary->skipped, 3);
}

TEST(TestRunner, ExplicitWorkingDirectoryWins) {
    TempDir tmp("workdir");
    const auto sandbox = make_sandbox(tmp);
    std::filesystem::create_directories(tmp / "suite");

    vaultrig::TestRunner runner(tests_config({"sh", "-c", "pwd > \"$0\"", "{sandbox}/cwd.txt"}), sandbox, no_coverage(), {});
    ASSERT_TRUE(runner.run(".", tmp / "suite").passed());
    EXPECT_EQ(vaultrig_tests::trim_copy(read_file_text(sandbox.file("cwd.txt"))),
              std::filesystem::canonical(tmp / "suite").string());
}

TEST(TestRunner, TestModeReachesChildOnly) {
    TempDir tmp("env");
    const auto sandbox = make_sandbox(tmp);

    vaultrig::TestRunner runner(tests_config({"sh", "-c", "test \"$SFLVAULT_IN_TEST\" = true"}), sandbox, no_coverage(),
                                {{"SFLVAULT_IN_TEST", "true"}});
    EXPECT_TRUE(runner.run("..", {}).passed());
    EXPECT_EQ(std::getenv("SFLVAULT_IN_TEST"), nullptr);

    vaultrig::TestRunner bare(tests_config({"sh", "-c", "test -z \"$SFLVAULT_IN_TEST\""}), sandbox, no_coverage(), {});
    EXPECT_TRUE(bare.run("..", {}).passed());
}

TEST(TestRunner, TimeoutReportsTerminatedSuite) {
    TempDir tmp("timeout");
    const auto sandbox = make_sandbox(tmp);

    auto config    = tests_config({"sleep", "30"});
    config.timeout = 200ms;
    vaultrig::TestRunner runner(config, sandbox, no_coverage(), {});
    const auto outcome = runner.run("..", {});
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.exit_code, 128 + SIGTERM);
    EXPECT_NE(outcome.error.find("timed out"), std::string::npos);
}

TEST(TestRunner, CancelStopsTheSuite) {
    TempDir tmp("cancel");
    const auto sandbox = make_sandbox(tmp);

    std::atomic<bool> cancel{false};
    std::thread trigger([&] {
        std::this_thread::sleep_for(100ms);
        cancel.store(true);
    });
    vaultrig::TestRunner runner(tests_config({"sleep", "30"}), sandbox, no_coverage(), {}, &cancel);
    const auto outcome = runner.run("..", {});
    trigger.join();
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_EQ(outcome.error, "tests interrupted");
}

TEST(TestRunner, MissingProgramIs127) {
    TempDir tmp("missing");
    const auto sandbox = make_sandbox(tmp);

    vaultrig::TestRunner runner(tests_config({"vaultrig-no-such-nosetests"}), sandbox, no_coverage(), {});
    const auto outcome = runner.run("..", {});
    EXPECT_EQ(outcome.exit_code, 127);
    EXPECT_NE(outcome.error.find("vaultrig-no-such-nosetests"), std::string::npos);

    vaultrig::TestRunner bad_placeholder(tests_config({"nosetests", "{nope}"}), sandbox, no_coverage(), {});
    EXPECT_EQ(bad_placeholder.run("..", {}).exit_code, 127);
}

TEST(JunitSummary, ReadsRootElementAttributes) {
    TempDir tmp("junit");

    EXPECT_FALSE(vaultrig::read_junit_summary(tmp / "missing.xml").has_value());

    write_file(tmp / "none.xml", "<?xml version=\"1.0\"?><report/>");
    EXPECT_FALSE(vaultrig::read_junit_summary(tmp / "none.xml").has_value());

    write_file(tmp / "suites.xml", "<testsuites tests='4' failures='1'>\n"
                                   "  <testsuite name='a' tests='4' failures='1' errors='0' skipped='0'/>\n"
                                   "</testsuites>\n");
    auto suites = vaultrig::read_junit_summary(tmp / "suites.xml");
    ASSERT_TRUE(suites.has_value());
    EXPECT_EQ(suites->tests, 4);
    EXPECT_EQ(suites->failures, 1);
    EXPECT_EQ(suites->errors, 0);

    // "tests" must not match inside another attribute name.
    write_file(tmp / "tricky.xml", "<testsuite name=\"x\" mytests=\"99\" tests = \"5\" skipped=\"2\">");
    auto tricky = vaultrig::read_junit_summary(tmp / "tricky.xml");
    ASSERT_TRUE(tricky.has_value());
    EXPECT_EQ(tricky->tests, 5);
    EXPECT_EQ(tricky->skipped, 2);
}
