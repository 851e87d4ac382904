#pragma once

#include <ctime>
#include <string>
#include <vector>

namespace ds {

struct CertificateInfo {
    std::string subject;
    std::vector<std::string> subject_alt_names;  // "DNS:localhost", "IP:127.0.0.1", ...
    std::time_t not_after = 0;
    int days_remaining = 0;                      // negative once expired

    bool covers(const std::string& san) const;
};

// Parse a PEM certificate; throws TlsConfigError
CertificateInfo read_certificate_info(const std::string& cert_path);

} // namespace ds
