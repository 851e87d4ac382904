#include "builtin_generator.hpp"
#include "errors.hpp"
#include "tls_raii.hpp"
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <spdlog/spdlog.h>
#include <cstdint>

namespace ds {

namespace {

[[noreturn]] void fail(const std::string& what) {
    throw ProvisioningError(what + ": " + openssl_error_string());
}

PKeyPtr generate_rsa_key(int bits) {
    PKeyCtxPtr kctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr), &EVP_PKEY_CTX_free);
    if (!kctx) fail("Failed to create RSA key context");

    if (EVP_PKEY_keygen_init(kctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), bits) != 1) {
        fail("Failed to initialize RSA key generation");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(kctx.get(), &raw) != 1) {
        fail("Failed to generate RSA key");
    }
    return PKeyPtr(raw, &EVP_PKEY_free);
}

void add_extension(X509* x509, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, x509, x509, nullptr, nullptr, 0);

    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
    if (!ext) fail("Invalid certificate extension '" + value + "'");

    int ok = X509_add_ext(x509, ext, -1);
    X509_EXTENSION_free(ext);
    if (ok != 1) fail("Failed to add certificate extension");
}

void set_random_serial(X509* x509) {
    uint64_t serial = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&serial), sizeof(serial)) != 1) {
        fail("Failed to draw certificate serial");
    }
    serial &= 0x7fffffffffffffffULL;  // positive
    if (serial == 0) serial = 1;
    if (ASN1_INTEGER_set_uint64(X509_get_serialNumber(x509), serial) != 1) {
        fail("Failed to set certificate serial");
    }
}

} // namespace

void BuiltinGenerator::generate(const CertificateRequest& request) {
    auto pkey = generate_rsa_key(request.key_bits);

    X509Ptr x509(X509_new(), &X509_free);
    if (!x509) fail("Failed to create X509 certificate");

    X509_set_version(x509.get(), 2);  // v3
    set_random_serial(x509.get());

    X509_gmtime_adj(X509_getm_notBefore(x509.get()), 0);
    X509_time_adj_ex(X509_getm_notAfter(x509.get()), request.validity_days, 0, nullptr);

    X509_NAME* name = X509_get_subject_name(x509.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(request.common_name.c_str()),
                               -1, -1, 0);
    X509_set_issuer_name(x509.get(), name);  // self-signed

    if (X509_set_pubkey(x509.get(), pkey.get()) != 1) {
        fail("Failed to set certificate public key");
    }

    add_extension(x509.get(), NID_basic_constraints, "CA:FALSE");
    if (!request.subject_alt_names.empty()) {
        add_extension(x509.get(), NID_subject_alt_name,
                      join_subject_alt_names(request.subject_alt_names));
    }

    if (X509_sign(x509.get(), pkey.get(), EVP_sha256()) <= 0) {
        fail("Failed to sign X509 certificate");
    }

    {
        BioPtr out(BIO_new_file(request.key_path.c_str(), "wb"), &BIO_free);
        if (!out) fail("Failed to open " + request.key_path + " for writing");
        if (PEM_write_bio_PrivateKey(out.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
            fail("Failed to write private key to " + request.key_path);
        }
    }

    {
        BioPtr out(BIO_new_file(request.cert_path.c_str(), "wb"), &BIO_free);
        if (!out) fail("Failed to open " + request.cert_path + " for writing");
        if (PEM_write_bio_X509(out.get(), x509.get()) != 1) {
            fail("Failed to write certificate to " + request.cert_path);
        }
    }

    spdlog::debug("Wrote {} ({}-bit RSA, {} days)", request.cert_path,
                  request.key_bits, request.validity_days);
}

} // namespace ds
