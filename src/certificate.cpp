#include "vaultrig/certificate.h"
#include "vaultrig/log.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <memory>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include <openssl/bn.h>
#include <openssl/conf.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace vaultrig {

namespace fs = std::filesystem;

namespace {

using ConfPtr    = std::unique_ptr<CONF, decltype(&NCONF_free)>;
using PkeyPtr    = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using X509Ptr    = std::unique_ptr<X509, decltype(&X509_free)>;
using NamePtr    = std::unique_ptr<X509_NAME, decltype(&X509_NAME_free)>;
using BignumPtr  = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using FilePtr    = std::unique_ptr<FILE, int (*)(FILE *)>;

constexpr mode_t kOwnerReadOnly = S_IRUSR;

[[noreturn]] void fail_openssl(std::string_view context) {
    std::string msg(context);
    unsigned long lib_err = ERR_get_error();
    if (lib_err != 0) {
        char buf[256];
        ERR_error_string_n(lib_err, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    }
    ERR_clear_error();
    throw CertificateError(std::move(msg));
}

std::string conf_string(const CONF *conf, const std::string &group, const std::string &name) {
    const char *value = NCONF_get_string(conf, group.c_str(), name.c_str());
    if (value == nullptr) {
        // A missing key only leaves noise on the error queue.
        ERR_clear_error();
        return std::string();
    }
    return value;
}

// "0.organizationName" and "+commonName" both name the plain field.
std::string field_type(std::string_view name) {
    if (!name.empty() && name.front() == '+')
        name.remove_prefix(1);
    const auto sep = name.find_first_of(":,.");
    if (sep != std::string_view::npos && sep + 1 < name.size())
        name.remove_prefix(sep + 1);
    return std::string(name);
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

ConfPtr load_request_config(const fs::path &path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        throw CertificateError(fmt::format("subject config '{}' does not exist", path.string()));
    ConfPtr conf(NCONF_new(nullptr), &NCONF_free);
    if (!conf)
        fail_openssl("NCONF_new failed");
    long error_line = -1;
    if (NCONF_load(conf.get(), path.c_str(), &error_line) <= 0) {
        fail_openssl(error_line > 0 ? fmt::format("cannot parse '{}' near line {}", path.string(), error_line)
                                    : fmt::format("cannot load '{}'", path.string()));
    }
    return conf;
}

NamePtr build_subject(const CONF *conf, const fs::path &path) {
    const std::string dn_section = conf_string(conf, "req", "distinguished_name");
    if (dn_section.empty())
        throw CertificateError(fmt::format("'{}' has no [req] distinguished_name", path.string()));
    STACK_OF(CONF_VALUE) *values = NCONF_get_section(conf, dn_section.c_str());
    if (values == nullptr) {
        ERR_clear_error();
        throw CertificateError(fmt::format("'{}' has no [{}] section", path.string(), dn_section));
    }

    // With prompting enabled the section holds prompt texts; the values the
    // non-interactive path takes are the *_default entries.
    const bool prompt = conf_string(conf, "req", "prompt") != "no";

    NamePtr name(X509_NAME_new(), &X509_NAME_free);
    if (!name)
        fail_openssl("X509_NAME_new failed");
    for (int idx = 0; idx < sk_CONF_VALUE_num(values); ++idx) {
        const CONF_VALUE *cv = sk_CONF_VALUE_value(values, idx);
        std::string_view key = cv->name;
        std::string value;
        if (prompt) {
            if (ends_with(key, "_default") || ends_with(key, "_min") || ends_with(key, "_max") || ends_with(key, "_value"))
                continue;
            value = conf_string(conf, dn_section, std::string(key) + "_default");
        } else {
            value = cv->value ? cv->value : "";
        }
        if (value.empty())
            continue;
        const std::string type = field_type(key);
        if (X509_NAME_add_entry_by_txt(name.get(), type.c_str(), MBSTRING_UTF8,
                                       reinterpret_cast<const unsigned char *>(value.c_str()), -1, -1, 0) != 1) {
            fail_openssl(fmt::format("invalid subject field '{}' in '{}'", type, path.string()));
        }
    }
    if (X509_NAME_get_index_by_NID(name.get(), NID_commonName, -1) < 0)
        throw CertificateError(fmt::format("'{}' does not set a commonName in [{}]", path.string(), dn_section));
    return name;
}

PkeyPtr generate_rsa_key(int bits) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), &EVP_PKEY_CTX_free);
    if (!ctx)
        fail_openssl("EVP_PKEY_CTX_new_id failed");
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0)
        fail_openssl("EVP_PKEY_keygen_init failed");
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0)
        fail_openssl(fmt::format("cannot use {} bit RSA keys", bits));
    EVP_PKEY *raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0)
        fail_openssl("RSA key generation failed");
    return PkeyPtr(raw, &EVP_PKEY_free);
}

// O_EXCL: an identity is created once per run and never overwritten.
FilePtr create_file(const fs::path &path, mode_t mode) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
    if (fd < 0)
        throw CertificateError(fmt::format("cannot create '{}': {}", path.string(), std::strerror(errno)));
    FILE *fp = ::fdopen(fd, "w");
    if (fp == nullptr) {
        const int err = errno;
        ::close(fd);
        throw CertificateError(fmt::format("cannot open '{}': {}", path.string(), std::strerror(err)));
    }
    return FilePtr(fp, &std::fclose);
}

void finish_file(FilePtr &fp, const fs::path &path) {
    if (std::fclose(fp.release()) != 0)
        throw CertificateError(fmt::format("cannot write '{}': {}", path.string(), std::strerror(errno)));
}

void restrict_to_owner_read(const fs::path &path) {
    if (::chmod(path.c_str(), kOwnerReadOnly) != 0)
        throw CertificateError(fmt::format("cannot chmod '{}': {}", path.string(), std::strerror(errno)));
}

void require_owner_read_only(const fs::path &path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0)
        throw CertificateError(fmt::format("cannot stat '{}': {}", path.string(), std::strerror(errno)));
    const mode_t perms = st.st_mode & 07777;
    if (perms != kOwnerReadOnly)
        throw CertificateError(fmt::format("'{}' has mode {:04o}, expected 0400", path.string(), perms));
}

std::string read_file(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw CertificateError(fmt::format("cannot read '{}'", path.string()));
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::chrono::system_clock::time_point to_time_point(const ASN1_TIME *time) {
    std::tm tm{};
    if (ASN1_TIME_to_tm(time, &tm) != 1)
        fail_openssl("invalid certificate time");
    return std::chrono::system_clock::from_time_t(::timegm(&tm));
}

} // namespace

CertificateIssuer::CertificateIssuer(CertificateConfig config) : config_(std::move(config)) {}

TLSIdentity CertificateIssuer::issue(const SandboxDirectory &sandbox, const fs::path &subject_config) const {
    ERR_clear_error();
    ConfPtr conf = load_request_config(subject_config);
    NamePtr subject = build_subject(conf.get(), subject_config);

    const EVP_MD *md = EVP_get_digestbyname(config_.digest.c_str());
    if (md == nullptr)
        throw CertificateError(fmt::format("unknown signing digest '{}'", config_.digest));

    TLSIdentity identity;
    identity.key_path    = sandbox.file(config_.key_name);
    identity.cert_path   = sandbox.file(config_.cert_name);
    identity.bundle_path = sandbox.file(config_.bundle_name);

    log::info("generating {} bit RSA key {}", config_.key_bits, identity.key_path.string());
    PkeyPtr key = generate_rsa_key(config_.key_bits);
    {
        FilePtr fp = create_file(identity.key_path, S_IRUSR | S_IWUSR);
        if (PEM_write_PrivateKey(fp.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
            fail_openssl(fmt::format("cannot write '{}'", identity.key_path.string()));
        finish_file(fp, identity.key_path);
    }
    restrict_to_owner_read(identity.key_path);

    X509Ptr cert(X509_new(), &X509_free);
    if (!cert)
        fail_openssl("X509_new failed");
    if (X509_set_version(cert.get(), 2) != 1)
        fail_openssl("X509_set_version failed");

    BignumPtr serial(BN_new(), &BN_free);
    if (!serial || BN_rand(serial.get(), 64, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1)
        fail_openssl("cannot generate a serial number");
    if (BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert.get())) == nullptr)
        fail_openssl("cannot set the serial number");

    // Both bounds from one instant so the window is exactly validity_days.
    std::time_t now = std::time(nullptr);
    if (X509_time_adj_ex(X509_getm_notBefore(cert.get()), 0, 0, &now) == nullptr
        || X509_time_adj_ex(X509_getm_notAfter(cert.get()), config_.validity_days, 0, &now) == nullptr)
        fail_openssl("cannot set the validity window");

    if (X509_set_subject_name(cert.get(), subject.get()) != 1 || X509_set_issuer_name(cert.get(), subject.get()) != 1)
        fail_openssl("cannot set the subject");
    if (X509_set_pubkey(cert.get(), key.get()) != 1)
        fail_openssl("cannot set the public key");

    const std::string ext_section = conf_string(conf.get(), "req", "x509_extensions");
    if (!ext_section.empty()) {
        X509V3_CTX ctx;
        X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);
        X509V3_set_nconf(&ctx, conf.get());
        if (X509V3_EXT_add_nconf(conf.get(), &ctx, ext_section.c_str(), cert.get()) != 1)
            fail_openssl(fmt::format("cannot apply extensions from [{}]", ext_section));
    }

    if (X509_sign(cert.get(), key.get(), md) <= 0)
        fail_openssl("signing the certificate failed");

    {
        FilePtr fp = create_file(identity.cert_path, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
        if (PEM_write_X509(fp.get(), cert.get()) != 1)
            fail_openssl(fmt::format("cannot write '{}'", identity.cert_path.string()));
        finish_file(fp, identity.cert_path);
    }

    {
        const std::string bundle = read_file(identity.cert_path) + read_file(identity.key_path);
        FilePtr fp = create_file(identity.bundle_path, S_IRUSR | S_IWUSR);
        if (std::fwrite(bundle.data(), 1, bundle.size(), fp.get()) != bundle.size())
            throw CertificateError(fmt::format("cannot write '{}'", identity.bundle_path.string()));
        finish_file(fp, identity.bundle_path);
    }
    restrict_to_owner_read(identity.bundle_path);

    require_owner_read_only(identity.key_path);
    require_owner_read_only(identity.bundle_path);

    identity.not_before = to_time_point(X509_get0_notBefore(cert.get()));
    identity.not_after  = to_time_point(X509_get0_notAfter(cert.get()));
    log::info("issued {} valid for {} days", identity.cert_path.string(), config_.validity_days);
    return identity;
}

CertificateInfo inspect_certificate(const fs::path &path) {
    FilePtr fp(std::fopen(path.c_str(), "r"), &std::fclose);
    if (!fp)
        throw CertificateError(fmt::format("cannot open '{}': {}", path.string(), std::strerror(errno)));
    X509Ptr cert(PEM_read_X509(fp.get(), nullptr, nullptr, nullptr), &X509_free);
    if (!cert)
        fail_openssl(fmt::format("'{}' is not a PEM certificate", path.string()));

    CertificateInfo info;
    std::unique_ptr<char, void (*)(void *)> subject(X509_NAME_oneline(X509_get_subject_name(cert.get()), nullptr, 0),
                                                    [](void *p) { OPENSSL_free(p); });
    if (subject)
        info.subject = subject.get();
    const ASN1_TIME *not_before = X509_get0_notBefore(cert.get());
    const ASN1_TIME *not_after  = X509_get0_notAfter(cert.get());
    info.not_before = to_time_point(not_before);
    info.not_after  = to_time_point(not_after);
    if (ASN1_TIME_diff(&info.validity_days, &info.validity_seconds, not_before, not_after) != 1)
        fail_openssl("cannot compute the validity window");
    return info;
}

} // namespace vaultrig
