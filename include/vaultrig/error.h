#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace vaultrig {

enum class ErrorKind {
    Provision,
    Certificate,
    ServerStart,
    ServerNotReady,
    ShutdownTimeout,
    ProcessNotFound,
    TestExecution,
    Config,
    Internal, // anything not thrown by the harness itself
};

std::string_view to_string(ErrorKind kind);

// Base of every harness failure. The kind decides whether the run aborts
// (setup errors) or only gets reported (cleanup-phase errors).
class error : public std::runtime_error {
public:
    error(ErrorKind kind, std::string message) : std::runtime_error(std::move(message)), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ProvisionError : public error {
public:
    explicit ProvisionError(std::string message) : error(ErrorKind::Provision, std::move(message)) {}
};

class CertificateError : public error {
public:
    explicit CertificateError(std::string message) : error(ErrorKind::Certificate, std::move(message)) {}
};

class ServerStartError : public error {
public:
    explicit ServerStartError(std::string message) : error(ErrorKind::ServerStart, std::move(message)) {}
};

class ServerNotReadyError : public error {
public:
    explicit ServerNotReadyError(std::string message) : error(ErrorKind::ServerNotReady, std::move(message)) {}
};

class ShutdownTimeoutError : public error {
public:
    explicit ShutdownTimeoutError(std::string message) : error(ErrorKind::ShutdownTimeout, std::move(message)) {}
};

class ProcessNotFoundError : public error {
public:
    explicit ProcessNotFoundError(std::string message) : error(ErrorKind::ProcessNotFound, std::move(message)) {}
};

class ConfigError : public error {
public:
    explicit ConfigError(std::string message) : error(ErrorKind::Config, std::move(message)) {}
};

} // namespace vaultrig
