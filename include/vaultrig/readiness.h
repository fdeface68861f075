#pragma once

#include "vaultrig/config.h"
#include "vaultrig/supervisor.h"

#include <atomic>
#include <filesystem>
#include <string>

namespace vaultrig {

class ReadinessProbe {
public:
    explicit ReadinessProbe(ReadinessConfig config, const std::atomic<bool> *interrupted = nullptr);

    // Returns once the server accepts connections (or the settle delay has
    // passed), or early when interrupted. Throws ServerNotReadyError on
    // timeout and ServerStartError when the server dies meanwhile.
    void wait(const ServerProcess &server, const std::filesystem::path &trusted_cert) const;

    // One connection attempt, with a TLS handshake when configured.
    bool try_connect(const std::filesystem::path &trusted_cert, std::string *error) const;

private:
    bool interrupted() const { return interrupted_ != nullptr && interrupted_->load(); }
    void require_alive(const ServerProcess &server) const;

    ReadinessConfig          config_;
    const std::atomic<bool> *interrupted_;
};

} // namespace vaultrig
