#pragma once

#include <string>
#include <cstdint>

namespace ds {

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    std::string root = ".";
    bool open_browser = true;
    int poll_interval_ms = 200;
    int drain_timeout_ms = 5000;
    int socket_timeout_ms = 30000;
};

struct TlsConfig {
    std::string cert_file = "cert.pem";   // relative paths resolve against server.root
    std::string key_file = "key.pem";
    std::string generator = "openssl";    // openssl or builtin
    int validity_days = 365;
    int key_bits = 2048;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    TlsConfig tls;
    LoggingConfig logging;
};

// Load configuration from YAML file, with environment variable overrides.
// A missing file is an error only when `required` is set.
AppConfig load_config(const std::string& path, bool required = false);

// Check ranges and enumerations; throws std::runtime_error
void validate_config(const AppConfig& cfg);

// Absolute paths of the certificate and key, resolved against the serving root
std::string resolved_cert_path(const AppConfig& cfg);
std::string resolved_key_path(const AppConfig& cfg);

} // namespace ds
