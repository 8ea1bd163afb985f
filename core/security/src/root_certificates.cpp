/**
 * @file root_certificates.cpp
 * @brief Root certificate discovery and the process-wide trust set
 */

#include <netfetch/security/root_certificates.hpp>

#include <netfetch/common/debug.hpp>
#include <netfetch/common/platform.hpp>

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <system_error>

namespace netfetch::security {

using namespace common::debug;

namespace {

// Bundles shipped by common distributions, most widespread first
constexpr std::string_view kWellKnownBundles[] = {
    "/etc/ssl/certs/ca-certificates.crt",                  // Debian, Ubuntu, Arch, Gentoo
    "/etc/pki/tls/certs/ca-bundle.crt",                    // Fedora, RHEL
    "/etc/pki/ca-trust/extracted/pem/tls-ca-bundle.pem",   // CentOS, RHEL 7
    "/etc/ssl/ca-bundle.pem",                              // openSUSE
    "/etc/ssl/cert.pem",                                   // Alpine
    "/usr/local/share/certs/ca-root-nss.crt",              // FreeBSD
};

constexpr std::string_view kDefaultCertDir = "/etc/ssl/certs";

std::once_flag g_init_flag;
// Never destroyed, sessions may still be created during static teardown
const RootCertificateSet* g_instance = nullptr;

bool is_existing_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

bool has_cert_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    return ext == ".pem" || ext == ".crt";
}

}  // anonymous namespace

RootCertificateSet::RootCertificateSet(const std::vector<std::string>& files) {
    for (const auto& file : files) {
        auto loaded = Certificate::all_from_pem_file(file);
        if (!loaded) {
            NETFETCH_LOG_WARN(category::SECURITY,
                              "Skipping certificate file " << file << ": "
                                                           << loaded.error_message());
            continue;
        }
        auto certs = std::move(loaded).value();
        for (auto& cert : certs) {
            certificates_.push_back(std::move(cert));
        }
        loaded_files_.push_back(file);
    }

    NETFETCH_LOG_DEBUG(category::SECURITY, "Loaded " << certificates_.size()
                                                     << " root certificates from "
                                                     << loaded_files_.size() << " files");
}

const RootCertificateSet& RootCertificateSet::instance() {
    std::call_once(g_init_flag, [] {
        g_instance = new RootCertificateSet(discover_files());
    });
    return *g_instance;
}

bool RootCertificateSet::initialize(const std::vector<std::string>& files) {
    bool performed = false;
    std::call_once(g_init_flag, [&] {
        g_instance = new RootCertificateSet(files);
        performed  = true;
    });
    return performed;
}

std::vector<std::string> RootCertificateSet::discover_files() {
    return discover_files(
        [](std::string_view name) { return common::platform::get_env_opt(name); });
}

std::vector<std::string> RootCertificateSet::discover_files(const EnvLookup& env) {
    if (auto file = env("SSL_CERT_FILE"); file && !file->empty()) {
        if (is_existing_file(*file)) {
            return {*file};
        }
        NETFETCH_LOG_WARN(category::SECURITY,
                          "SSL_CERT_FILE=" << *file << " is not a readable file, ignoring");
    }

    for (auto bundle : kWellKnownBundles) {
        std::filesystem::path path(bundle);
        if (is_existing_file(path)) {
            return {path.string()};
        }
    }

    std::filesystem::path dir(kDefaultCertDir);
    if (auto cert_dir = env("SSL_CERT_DIR"); cert_dir && !cert_dir->empty()) {
        dir = *cert_dir;
    }

    std::vector<std::string> files;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto& path = it->path();
        if (has_cert_extension(path) && is_existing_file(path)) {
            files.push_back(path.string());
        }
    }
    if (ec) {
        NETFETCH_LOG_WARN(category::SECURITY,
                          "Cannot scan certificate directory " << dir.string() << ": "
                                                               << ec.message());
    }

    // Directory order is unspecified
    std::sort(files.begin(), files.end());
    return files;
}

Result<void> RootCertificateSet::apply_to(TLSContext& context) const {
    if (certificates_.empty()) {
        return Result<void>(SecurityError::VERIFICATION_FAILED,
                            "No trusted root certificates available");
    }

    size_t added = 0;
    for (const auto& cert : certificates_) {
        auto result = context.add_trusted_certificate(cert);
        if (!result) {
            NETFETCH_LOG_DEBUG(category::SECURITY, "Rejected trust anchor " << cert.subject()
                                                                            << ": "
                                                                            << result.error_message());
            continue;
        }
        ++added;
    }

    if (added == 0) {
        return Result<void>(SecurityError::CERTIFICATE_INVALID,
                            "None of the root certificates could be added");
    }
    return Result<void>();
}

}  // namespace netfetch::security
