#include "certificate_info.hpp"
#include "errors.hpp"
#include "tls_raii.hpp"
#include <openssl/pem.h>
#include <arpa/inet.h>
#include <algorithm>

namespace ds {

namespace {

std::string general_name_to_string(const GENERAL_NAME* gen) {
    if (gen->type == GEN_DNS) {
        const auto* data = ASN1_STRING_get0_data(gen->d.dNSName);
        int len = ASN1_STRING_length(gen->d.dNSName);
        return "DNS:" + std::string(reinterpret_cast<const char*>(data), static_cast<size_t>(len));
    }
    if (gen->type == GEN_IPADD) {
        const auto* data = ASN1_STRING_get0_data(gen->d.iPAddress);
        int len = ASN1_STRING_length(gen->d.iPAddress);
        char buf[INET6_ADDRSTRLEN] = {};
        int family = len == 4 ? AF_INET : (len == 16 ? AF_INET6 : -1);
        if (family < 0 || !inet_ntop(family, data, buf, sizeof(buf))) {
            return "IP:<invalid>";
        }
        return std::string("IP:") + buf;
    }
    return "";
}

} // namespace

bool CertificateInfo::covers(const std::string& san) const {
    return std::find(subject_alt_names.begin(), subject_alt_names.end(), san) != subject_alt_names.end();
}

CertificateInfo read_certificate_info(const std::string& cert_path) {
    BioPtr in(BIO_new_file(cert_path.c_str(), "rb"), &BIO_free);
    if (!in) {
        throw TlsConfigError("Cannot open certificate " + cert_path + ": " + openssl_error_string());
    }

    X509Ptr x509(PEM_read_bio_X509(in.get(), nullptr, nullptr, nullptr), &X509_free);
    if (!x509) {
        throw TlsConfigError("Cannot parse certificate " + cert_path + ": " + openssl_error_string());
    }

    CertificateInfo info;

    char subject[256] = {};
    X509_NAME_oneline(X509_get_subject_name(x509.get()), subject, sizeof(subject));
    info.subject = subject;

    GeneralNamesPtr names(
        static_cast<GENERAL_NAMES*>(X509_get_ext_d2i(x509.get(), NID_subject_alt_name, nullptr, nullptr)),
        &GENERAL_NAMES_free);
    if (names) {
        for (int i = 0; i < sk_GENERAL_NAME_num(names.get()); ++i) {
            auto entry = general_name_to_string(sk_GENERAL_NAME_value(names.get(), i));
            if (!entry.empty()) {
                info.subject_alt_names.push_back(std::move(entry));
            }
        }
    }

    const ASN1_TIME* not_after = X509_get0_notAfter(x509.get());
    std::tm tm{};
    if (ASN1_TIME_to_tm(not_after, &tm) == 1) {
        info.not_after = timegm(&tm);
    }
    int days = 0;
    int seconds = 0;
    if (ASN1_TIME_diff(&days, &seconds, nullptr, not_after) == 1) {
        info.days_remaining = (days == 0 && seconds < 0) ? -1 : days;
    }

    return info;
}

} // namespace ds
