#pragma once

#include <string>
#include <vector>

namespace ds {

struct SubjectAltName {
    enum class Kind { Dns, Ip };

    Kind kind = Kind::Dns;
    std::string value;

    // "DNS:localhost" / "IP:127.0.0.1"
    std::string to_string() const {
        return (kind == Kind::Ip ? "IP:" : "DNS:") + value;
    }

    bool operator==(const SubjectAltName& other) const {
        return kind == other.kind && value == other.value;
    }
};

// Joins entries the way openssl's subjectAltName directive expects
inline std::string join_subject_alt_names(const std::vector<SubjectAltName>& sans) {
    std::string out;
    for (const auto& san : sans) {
        if (!out.empty()) out += ",";
        out += san.to_string();
    }
    return out;
}

struct CertificateRequest {
    std::string cert_path;
    std::string key_path;
    std::string common_name = "localhost";
    std::vector<SubjectAltName> subject_alt_names;
    int validity_days = 365;
    int key_bits = 2048;
};

// Produces a self-signed certificate and unencrypted private key on disk
class CertificateGenerator {
public:
    virtual ~CertificateGenerator() = default;

    // Whether generate() can run at all on this machine
    virtual bool available() const = 0;

    // Human-readable name for log lines
    virtual std::string name() const = 0;

    // Writes request.cert_path and request.key_path; throws ProvisioningError
    virtual void generate(const CertificateRequest& request) = 0;
};

} // namespace ds
