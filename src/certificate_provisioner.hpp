#pragma once

#include "certificate_generator.hpp"
#include <string>
#include <vector>

namespace ds {

// localhost, 127.0.0.1 and the LAN address, without duplicates
std::vector<SubjectAltName> build_subject_alt_names(const std::string& lan_address);

class CertificateProvisioner {
public:
    explicit CertificateProvisioner(CertificateGenerator& generator,
                                    int validity_days = 365,
                                    int key_bits = 2048);

    // Non-copyable
    CertificateProvisioner(const CertificateProvisioner&) = delete;
    CertificateProvisioner& operator=(const CertificateProvisioner&) = delete;

    // Make sure cert_path and key_path exist, generating a self-signed pair
    // for `address` when they don't. Existing pairs are left untouched; a lone
    // cert or key is replaced on success and kept when generation fails.
    // Throws ProvisioningError.
    void ensure(const std::string& cert_path,
                const std::string& key_path,
                const std::string& address);

private:
    static void restore_orphan(const std::string& backup, const std::string& orphan);
    static void remove_partial(const std::string& cert_path, const std::string& key_path);

    CertificateGenerator& generator_;
    int validity_days_;
    int key_bits_;
};

} // namespace ds
