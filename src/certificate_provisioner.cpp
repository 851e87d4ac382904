#include "certificate_provisioner.hpp"
#include "errors.hpp"
#include "network_identity.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace ds {

namespace {

// Where a lone cert or key waits while its pair is regenerated
constexpr const char* kOrphanSuffix = ".devserve-orig";

} // namespace

std::vector<SubjectAltName> build_subject_alt_names(const std::string& lan_address) {
    std::vector<SubjectAltName> sans = {
        {SubjectAltName::Kind::Dns, "localhost"},
        {SubjectAltName::Kind::Ip, kLoopbackAddress},
    };

    if (!lan_address.empty()) {
        SubjectAltName lan{
            is_ip_address(lan_address) ? SubjectAltName::Kind::Ip : SubjectAltName::Kind::Dns,
            lan_address};
        if (std::find(sans.begin(), sans.end(), lan) == sans.end()) {
            sans.push_back(lan);
        }
    }
    return sans;
}

CertificateProvisioner::CertificateProvisioner(CertificateGenerator& generator,
                                               int validity_days,
                                               int key_bits)
    : generator_(generator)
    , validity_days_(validity_days)
    , key_bits_(key_bits)
{
}

void CertificateProvisioner::ensure(const std::string& cert_path,
                                    const std::string& key_path,
                                    const std::string& address) {
    std::error_code ec;
    const bool have_cert = fs::exists(cert_path, ec);
    const bool have_key = fs::exists(key_path, ec);

    if (have_cert && have_key) {
        spdlog::debug("Using existing certificate {} and key {}", cert_path, key_path);
        return;
    }

    // One file without the other can't be loaded; start over, but keep the
    // lone file aside so a failed generation can put it back
    std::string orphan;
    if (have_cert != have_key) {
        orphan = have_cert ? cert_path : key_path;
        spdlog::warn("Found {} without {}; regenerating both",
                     orphan, have_cert ? key_path : cert_path);
    }

    if (!generator_.available()) {
        throw ProvisioningError(
            "cert.pem/key.pem not found and no certificate generator is available (" +
            generator_.name() + ").\n"
            " - Install OpenSSL (or use mkcert), or\n"
            " - Drop valid cert.pem/key.pem into the project root.");
    }

    std::string backup;
    if (!orphan.empty()) {
        backup = orphan + kOrphanSuffix;
        fs::rename(orphan, backup, ec);
        if (ec) {
            throw ProvisioningError("Cannot move " + orphan + " aside before regenerating: " +
                                    ec.message());
        }
    }

    auto roll_back = [&]() {
        remove_partial(cert_path, key_path);
        if (!backup.empty()) {
            restore_orphan(backup, orphan);
        }
    };

    CertificateRequest request;
    request.cert_path = cert_path;
    request.key_path = key_path;
    request.subject_alt_names = build_subject_alt_names(address);
    request.validity_days = validity_days_;
    request.key_bits = key_bits_;

    spdlog::info("Generating self-signed certificate with {} (SAN: {})",
                 generator_.name(), join_subject_alt_names(request.subject_alt_names));

    try {
        generator_.generate(request);
    } catch (const ProvisioningError&) {
        roll_back();
        throw;
    } catch (const std::exception& e) {
        roll_back();
        throw ProvisioningError(std::string("Certificate generation failed: ") + e.what());
    }

    if (!fs::exists(cert_path, ec) || !fs::exists(key_path, ec)) {
        roll_back();
        throw ProvisioningError(generator_.name() + " reported success but did not write " +
                                cert_path + " and " + key_path);
    }

    if (!backup.empty() && !fs::remove(backup, ec) && ec) {
        spdlog::warn("Failed to remove {}: {}", backup, ec.message());
    }

    fs::permissions(key_path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions on {}: {}", key_path, ec.message());
    }

    spdlog::info("Generated self-signed certificate (SAN: {})",
                 join_subject_alt_names(request.subject_alt_names));
}

void CertificateProvisioner::restore_orphan(const std::string& backup, const std::string& orphan) {
    std::error_code ec;
    fs::rename(backup, orphan, ec);
    if (ec) {
        spdlog::error("Failed to restore {} from {}: {}", orphan, backup, ec.message());
    } else {
        spdlog::debug("Restored {}", orphan);
    }
}

void CertificateProvisioner::remove_partial(const std::string& cert_path, const std::string& key_path) {
    for (const auto& path : {cert_path, key_path}) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            spdlog::debug("Removed partial output {}", path);
        } else if (ec) {
            spdlog::warn("Failed to remove partial output {}: {}", path, ec.message());
        }
    }
}

} // namespace ds
