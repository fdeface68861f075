#include "vaultrig/error.h"

namespace vaultrig {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Provision: return "ProvisionError";
    case ErrorKind::Certificate: return "CertificateError";
    case ErrorKind::ServerStart: return "ServerStartError";
    case ErrorKind::ServerNotReady: return "ServerNotReadyError";
    case ErrorKind::ShutdownTimeout: return "ShutdownTimeoutError";
    case ErrorKind::ProcessNotFound: return "ProcessNotFoundError";
    case ErrorKind::TestExecution: return "TestExecutionError";
    case ErrorKind::Config: return "ConfigError";
    case ErrorKind::Internal: return "InternalError";
    }
    return "error";
}

} // namespace vaultrig
