#include "vaultrig/readiness.h"
#include "vaultrig/log.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <fmt/format.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace vaultrig {

namespace {

constexpr std::chrono::milliseconds kSleepSlice{50};
constexpr std::chrono::milliseconds kAttemptTimeout{1000};

using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)>;
using SslPtr    = std::unique_ptr<SSL, decltype(&SSL_free)>;

void tls_global_init() {
    static std::once_flag init_flag;
    std::call_once(init_flag, []() { OPENSSL_init_ssl(0, nullptr); });
}

std::string format_tls_error(const char *context, SSL *ssl, int rc) {
    const int err = SSL_get_error(ssl, rc);
    std::string msg = fmt::format("{} (ssl error {})", context, err);
    const unsigned long lib_err = ERR_get_error();
    if (lib_err != 0) {
        char buf[256];
        ERR_error_string_n(lib_err, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    } else if (err == SSL_ERROR_SYSCALL && errno != 0) {
        msg += ": ";
        msg += std::strerror(errno);
    }
    ERR_clear_error();
    return msg;
}

class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() {
        if (fd_ >= 0)
            ::close(fd_);
    }
    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;

    int get() const { return fd_; }

private:
    int fd_{-1};
};

void set_io_timeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool tls_handshake(int fd, const std::filesystem::path &trusted_cert, std::string *error) {
    tls_global_init();
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()), &SSL_CTX_free);
    if (!ctx) {
        *error = "SSL_CTX_new failed";
        return false;
    }
    if (SSL_CTX_load_verify_locations(ctx.get(), trusted_cert.c_str(), nullptr) != 1) {
        *error = fmt::format("cannot load trusted certificate '{}'", trusted_cert.string());
        ERR_clear_error();
        return false;
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);

    SslPtr ssl(SSL_new(ctx.get()), &SSL_free);
    if (!ssl || SSL_set_fd(ssl.get(), fd) != 1) {
        *error = "SSL setup failed";
        ERR_clear_error();
        return false;
    }
    const int rc = SSL_connect(ssl.get());
    if (rc != 1) {
        *error = format_tls_error("TLS handshake failed", ssl.get(), rc);
        return false;
    }
    SSL_shutdown(ssl.get());
    return true;
}

} // namespace

ReadinessProbe::ReadinessProbe(ReadinessConfig config, const std::atomic<bool> *interrupted)
    : config_(std::move(config)), interrupted_(interrupted) {}

void ReadinessProbe::require_alive(const ServerProcess &server) const {
    if (!server.running())
        throw ServerStartError(fmt::format("server pid {} exited before becoming ready", server.pid()));
}

bool ReadinessProbe::try_connect(const std::filesystem::path &trusted_cert, std::string *error) const {
    std::string local_error;
    if (error == nullptr)
        error = &local_error;

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res     = nullptr;
    const std::string port = std::to_string(config_.port);
    const int rc = ::getaddrinfo(config_.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0) {
        *error = fmt::format("cannot resolve {}: {}", config_.host, ::gai_strerror(rc));
        return false;
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addrs(res, &::freeaddrinfo);

    *error = fmt::format("nothing listening on {}:{}", config_.host, config_.port);
    for (addrinfo *it = addrs.get(); it != nullptr; it = it->ai_next) {
        Socket sock(::socket(it->ai_family, it->ai_socktype | SOCK_CLOEXEC, it->ai_protocol));
        if (sock.get() < 0)
            continue;
        set_io_timeout(sock.get(), kAttemptTimeout);
        if (::connect(sock.get(), it->ai_addr, it->ai_addrlen) != 0) {
            *error = fmt::format("connect to {}:{}: {}", config_.host, config_.port, std::strerror(errno));
            continue;
        }
        if (!config_.tls)
            return true;
        return tls_handshake(sock.get(), trusted_cert, error);
    }
    return false;
}

void ReadinessProbe::wait(const ServerProcess &server, const std::filesystem::path &trusted_cert) const {
    const auto start = std::chrono::steady_clock::now();

    if (config_.mode == ReadinessMode::Delay) {
        log::info("waiting {}ms for the server to settle", config_.settle_delay.count());
        const auto until = start + config_.settle_delay;
        while (std::chrono::steady_clock::now() < until) {
            if (interrupted())
                return;
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSleepSlice, until - std::chrono::steady_clock::now()));
        }
        require_alive(server);
        return;
    }

    log::info("probing {}:{}{}", config_.host, config_.port, config_.tls ? " (TLS)" : "");
    const auto deadline = start + config_.timeout;
    auto backoff = config_.initial_backoff;
    std::string last_error;
    int attempts = 0;
    while (true) {
        if (interrupted())
            return;
        require_alive(server);
        ++attempts;
        if (try_connect(trusted_cert, &last_error)) {
            const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            log::info("server ready after {}ms ({} attempts)", took.count(), attempts);
            return;
        }
        log::debug("not ready: {}", last_error);

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;
        const auto pause = std::min<std::chrono::steady_clock::duration>(backoff, deadline - now);
        const auto wake  = now + pause;
        while (std::chrono::steady_clock::now() < wake) {
            if (interrupted())
                return;
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSleepSlice, wake - std::chrono::steady_clock::now()));
        }
        backoff = std::min(backoff * 2, config_.max_backoff);
    }
    throw ServerNotReadyError(fmt::format("server not ready after {}ms and {} attempts: {}", config_.timeout.count(),
                                          attempts, last_error));
}

} // namespace vaultrig
