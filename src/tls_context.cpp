#include "tls_context.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace ds {

SslCtxPtr create_server_context(const std::string& cert_file, const std::string& key_file) {
    OPENSSL_init_ssl(0, nullptr);
    ERR_clear_error();

    SslCtxPtr ctx(SSL_CTX_new(TLS_server_method()), &SSL_CTX_free);
    if (!ctx) {
        throw TlsConfigError("Failed to create SSL context: " + openssl_error_string());
    }

    if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION) != 1) {
        throw TlsConfigError("Failed to require TLS 1.2: " + openssl_error_string());
    }
    SSL_CTX_set_options(ctx.get(), SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);

    if (SSL_CTX_use_certificate_chain_file(ctx.get(), cert_file.c_str()) != 1) {
        throw TlsConfigError("Failed to load certificate " + cert_file + ": " + openssl_error_string());
    }

    if (SSL_CTX_use_PrivateKey_file(ctx.get(), key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
        throw TlsConfigError("Failed to load private key " + key_file + ": " + openssl_error_string());
    }

    if (SSL_CTX_check_private_key(ctx.get()) != 1) {
        throw TlsConfigError("Certificate " + cert_file + " and private key " + key_file +
                             " do not match");
    }

    spdlog::debug("TLS context ready ({} / {})", cert_file, key_file);
    return ctx;
}

} // namespace ds
