#include "test_util.h"

#include "vaultrig/certificate.h"
#include "vaultrig/readiness.h"
#include "vaultrig/supervisor.h"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>

using namespace std::chrono_literals;
using vaultrig_tests::fake_server_command;
using vaultrig_tests::TempDir;

namespace {

// Fake server started in the foreground, owned by the test.
class ForegroundServer {
public:
    ForegroundServer(const TempDir &tmp, std::vector<std::string> args) {
        std::filesystem::create_directories(tmp / "sandbox");
        launch_.sandbox.path = tmp / "sandbox";
        launch_.config_path  = launch_.sandbox.file("test-server.ini");
        launch_.pid_file     = launch_.sandbox.file("test-server.pid");

        vaultrig::ServerConfig config;
        config.command      = fake_server_command("foreground", std::move(args));
        config.daemon       = false;
        config.stop_timeout = 5000ms;
        vaultrig::CoverageConfig coverage;
        coverage.enabled = false;
        supervisor_      = std::make_unique<vaultrig::ServerSupervisor>(config, vaultrig::CoverageSession(coverage));
        server_          = supervisor_->start(launch_);
    }

    const vaultrig::ServerProcess &server() const { return server_; }

private:
    vaultrig::ServerLaunch                      launch_;
    std::unique_ptr<vaultrig::ServerSupervisor> supervisor_;
    vaultrig::ServerProcess                     server_;
};

vaultrig::ReadinessConfig probe_config(std::uint16_t port, bool tls) {
    vaultrig::ReadinessConfig config;
    config.mode    = vaultrig::ReadinessMode::Probe;
    config.port    = port;
    config.tls     = tls;
    config.timeout = 5000ms;
    return config;
}

} // namespace

TEST(ReadinessProbe, PlainProbeSeesListeningServer) {
    TempDir tmp("plain");
    const auto port = vaultrig_tests::unused_port();
    ForegroundServer fake(tmp, {"--port", std::to_string(port)});

    vaultrig::ReadinessProbe probe(probe_config(port, false));
    EXPECT_NO_THROW(probe.wait(fake.server(), {}));
    std::string error;
    EXPECT_TRUE(probe.try_connect({}, &error)) << error;
}

TEST(ReadinessProbe, TlsProbeTrustsTheIssuedCertificate) {
    TempDir tmp("tls");
    vaultrig_tests::write_file(tmp / "certif.cnf", vaultrig_tests::kSubjectConfig);
    std::filesystem::create_directories(tmp / "sandbox");
    vaultrig::CertificateIssuer issuer(vaultrig::CertificateConfig{});
    const auto identity = issuer.issue(vaultrig::SandboxDirectory{tmp / "sandbox"}, tmp / "certif.cnf");

    const auto port = vaultrig_tests::unused_port();
    ForegroundServer fake(tmp, {"--port", std::to_string(port), "--tls", identity.cert_path.string(),
                                identity.key_path.string()});

    vaultrig::ReadinessProbe probe(probe_config(port, true));
    EXPECT_NO_THROW(probe.wait(fake.server(), identity.cert_path));
}

TEST(ReadinessProbe, TlsProbeRejectsUntrustedCertificate) {
    TempDir tmp("untrusted");
    vaultrig_tests::write_file(tmp / "certif.cnf", vaultrig_tests::kSubjectConfig);
    std::filesystem::create_directories(tmp / "one");
    std::filesystem::create_directories(tmp / "two");
    vaultrig::CertificateIssuer issuer(vaultrig::CertificateConfig{});
    const auto served  = issuer.issue(vaultrig::SandboxDirectory{tmp / "one"}, tmp / "certif.cnf");
    const auto trusted = issuer.issue(vaultrig::SandboxDirectory{tmp / "two"}, tmp / "certif.cnf");

    const auto port = vaultrig_tests::unused_port();
    ForegroundServer fake(tmp, {"--port", std::to_string(port), "--tls", served.cert_path.string(),
                                served.key_path.string()});

    auto config    = probe_config(port, true);
    config.timeout = 500ms;
    vaultrig::ReadinessProbe probe(config);
    try {
        probe.wait(fake.server(), trusted.cert_path);
        FAIL() << "expected ServerNotReadyError";
    } catch (const vaultrig::ServerNotReadyError &e) {
        EXPECT_NE(std::string(e.what()).find("TLS handshake failed"), std::string::npos) << e.what();
    }
}

TEST(ReadinessProbe, ClosedPortTimesOut) {
    TempDir tmp("closed");
    ForegroundServer fake(tmp, {});

    auto config    = probe_config(vaultrig_tests::unused_port(), false);
    config.timeout = 300ms;
    vaultrig::ReadinessProbe probe(config);
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(probe.wait(fake.server(), {}), vaultrig::ServerNotReadyError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST(ReadinessProbe, ServerThatExitsIsAStartError) {
    TempDir tmp("dies");
    std::filesystem::create_directories(tmp / "sandbox");
    vaultrig::ServerLaunch launch;
    launch.sandbox.path = tmp / "sandbox";
    launch.pid_file     = launch.sandbox.file("test-server.pid");

    vaultrig::ServerConfig config;
    config.command = fake_server_command("exit", {"0"});
    config.daemon  = false;
    vaultrig::CoverageConfig coverage;
    coverage.enabled = false;
    vaultrig::ServerSupervisor supervisor(config, vaultrig::CoverageSession(coverage));
    auto server = supervisor.start(launch);

    auto ready    = probe_config(vaultrig_tests::unused_port(), false);
    ready.timeout = 3000ms;
    vaultrig::ReadinessProbe probe(ready);
    EXPECT_THROW(probe.wait(server, {}), vaultrig::ServerStartError);
}

TEST(ReadinessProbe, DelayModeWaitsThenChecksLiveness) {
    TempDir tmp("delay");
    ForegroundServer fake(tmp, {});

    vaultrig::ReadinessConfig config;
    config.mode         = vaultrig::ReadinessMode::Delay;
    config.settle_delay = 150ms;
    vaultrig::ReadinessProbe probe(config);
    const auto started = std::chrono::steady_clock::now();
    EXPECT_NO_THROW(probe.wait(fake.server(), {}));
    EXPECT_GE(std::chrono::steady_clock::now() - started, 150ms);
}

TEST(ReadinessProbe, InterruptCutsTheWaitShort) {
    TempDir tmp("interrupt");
    ForegroundServer fake(tmp, {});

    std::atomic<bool> interrupted{true};
    vaultrig::ReadinessConfig config;
    config.mode         = vaultrig::ReadinessMode::Delay;
    config.settle_delay = 30000ms;
    vaultrig::ReadinessProbe probe(config, &interrupted);
    const auto started = std::chrono::steady_clock::now();
    EXPECT_NO_THROW(probe.wait(fake.server(), {}));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
}
