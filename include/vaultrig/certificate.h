#pragma once

#include "vaultrig/config.h"
#include "vaultrig/sandbox.h"

#include <chrono>
#include <filesystem>
#include <string>

namespace vaultrig {

struct TLSIdentity {
    std::filesystem::path                 key_path;
    std::filesystem::path                 cert_path;
    std::filesystem::path                 bundle_path; // certificate followed by key
    std::chrono::system_clock::time_point not_before;
    std::chrono::system_clock::time_point not_after;
};

struct CertificateInfo {
    std::string                           subject;
    std::chrono::system_clock::time_point not_before;
    std::chrono::system_clock::time_point not_after;
    int                                   validity_days    = 0;
    int                                   validity_seconds = 0; // remainder past whole days
};

class CertificateIssuer {
public:
    explicit CertificateIssuer(CertificateConfig config);

    // Key, self-signed certificate and bundle, in that order. Key and bundle
    // end up owner-read-only. Throws CertificateError.
    TLSIdentity issue(const SandboxDirectory &sandbox, const std::filesystem::path &subject_config) const;

private:
    CertificateConfig config_;
};

// Throws CertificateError.
CertificateInfo inspect_certificate(const std::filesystem::path &path);

} // namespace vaultrig
