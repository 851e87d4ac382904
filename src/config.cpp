#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ds {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : fallback;
}

static int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val || !*val) return fallback;
    try {
        size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (used != std::strlen(val)) throw std::invalid_argument(val);
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid integer in $") + name + ": " + val);
    }
}

// Value of an optional key. A present key that doesn't convert throws
// YAML::TypedBadConversion instead of quietly yielding the fallback.
template <typename T>
static T value_or(const YAML::Node& section, const char* key, const T& fallback) {
    const YAML::Node node = section[key];
    if (!node.IsDefined() || node.IsNull()) return fallback;
    return node.as<T>();
}

static uint16_t port_value(const YAML::Node& section, const char* key, uint16_t fallback) {
    int port = value_or<int>(section, key, fallback);
    if (port < 0 || port > 65535) {
        throw std::runtime_error(std::string("server.") + key + " out of range: " + std::to_string(port));
    }
    return static_cast<uint16_t>(port);
}

static std::string resolve_against_root(const AppConfig& cfg, const std::string& file) {
    fs::path p(file);
    if (p.is_relative()) {
        p = fs::path(cfg.server.root) / p;
    }
    return fs::absolute(p).lexically_normal().string();
}

AppConfig load_config(const std::string& path, bool required) {
    AppConfig cfg;
    YAML::Node root;

    if (!path.empty() && fs::exists(path)) {
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to load config: " + std::string(e.what()));
        }
    } else if (required) {
        throw std::runtime_error("Config file not found: " + path);
    }

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.host = value_or<std::string>(s, "host", cfg.server.host);
            cfg.server.port = port_value(s, "port", cfg.server.port);
            cfg.server.root = value_or<std::string>(s, "root", cfg.server.root);
            cfg.server.open_browser = value_or<bool>(s, "open_browser", cfg.server.open_browser);
            cfg.server.poll_interval_ms = value_or<int>(s, "poll_interval_ms", cfg.server.poll_interval_ms);
            cfg.server.drain_timeout_ms = value_or<int>(s, "drain_timeout_ms", cfg.server.drain_timeout_ms);
            cfg.server.socket_timeout_ms = value_or<int>(s, "socket_timeout_ms", cfg.server.socket_timeout_ms);
        }

        // TLS
        if (auto t = root["tls"]) {
            cfg.tls.cert_file = value_or<std::string>(t, "cert_file", cfg.tls.cert_file);
            cfg.tls.key_file = value_or<std::string>(t, "key_file", cfg.tls.key_file);
            cfg.tls.generator = value_or<std::string>(t, "generator", cfg.tls.generator);
            cfg.tls.validity_days = value_or<int>(t, "validity_days", cfg.tls.validity_days);
            cfg.tls.key_bits = value_or<int>(t, "key_bits", cfg.tls.key_bits);
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = value_or<std::string>(l, "level", cfg.logging.level);
            cfg.logging.file = value_or<std::string>(l, "file", "");
            cfg.logging.max_file_size_mb = value_or<int>(l, "max_file_size_mb", cfg.logging.max_file_size_mb);
            cfg.logging.max_files = value_or<int>(l, "max_files", cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config " + path + ": " + std::string(e.what()));
    }

    // Environment variable overrides
    int port = env_int_or("PORT", cfg.server.port);
    if (port < 0 || port > 65535) {
        throw std::runtime_error("Invalid $PORT: " + std::to_string(port));
    }
    cfg.server.port = static_cast<uint16_t>(port);
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);

    return cfg;
}

void validate_config(const AppConfig& cfg) {
    if (cfg.server.host.empty()) {
        throw std::runtime_error("server.host must not be empty");
    }
    if (cfg.server.poll_interval_ms <= 0) {
        throw std::runtime_error("server.poll_interval_ms must be positive");
    }
    if (cfg.server.drain_timeout_ms < 0 || cfg.server.socket_timeout_ms < 0) {
        throw std::runtime_error("server timeouts must not be negative");
    }
    if (!fs::is_directory(cfg.server.root)) {
        throw std::runtime_error("server.root is not a directory: " + cfg.server.root);
    }
    if (cfg.tls.generator != "openssl" && cfg.tls.generator != "builtin") {
        throw std::runtime_error("tls.generator must be 'openssl' or 'builtin', got '" +
                                 cfg.tls.generator + "'");
    }
    if (cfg.tls.validity_days <= 0) {
        throw std::runtime_error("tls.validity_days must be positive");
    }
    if (cfg.tls.key_bits < 2048) {
        throw std::runtime_error("tls.key_bits must be at least 2048");
    }
    if (cfg.tls.cert_file.empty() || cfg.tls.key_file.empty()) {
        throw std::runtime_error("tls.cert_file and tls.key_file must be set");
    }
}

std::string resolved_cert_path(const AppConfig& cfg) {
    return resolve_against_root(cfg, cfg.tls.cert_file);
}

std::string resolved_key_path(const AppConfig& cfg) {
    return resolve_against_root(cfg, cfg.tls.key_file);
}

} // namespace ds
