#pragma once

#include "tls_raii.hpp"
#include <string>

namespace ds {

// Server-side TLS 1.2+ context loaded from PEM files.
// Throws TlsConfigError if either file is unreadable or they don't match.
SslCtxPtr create_server_context(const std::string& cert_file, const std::string& key_file);

} // namespace ds
