#include "browser.hpp"
#include "builtin_generator.hpp"
#include "certificate_info.hpp"
#include "certificate_provisioner.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "network_identity.hpp"
#include "openssl_cli_generator.hpp"
#include "shutdown_coordinator.hpp"
#include "tls_context.hpp"

#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>

namespace {

std::unique_ptr<ds::CertificateGenerator> make_generator(const ds::TlsConfig& tls) {
    if (tls.generator == "builtin") {
        return std::make_unique<ds::BuiltinGenerator>();
    }
    return std::make_unique<ds::OpensslCliGenerator>();
}

// Report what the certificate on disk covers; it is never regenerated here
void check_certificate(const std::string& cert_path, const std::string& lan_ip) {
    auto info = ds::read_certificate_info(cert_path);

    std::string sans;
    for (const auto& san : info.subject_alt_names) {
        if (!sans.empty()) sans += ", ";
        sans += san;
    }
    spdlog::info("Certificate {} (SAN: {}; {} days left)", cert_path,
                 sans.empty() ? "none" : sans, info.days_remaining);

    std::string lan_san = (ds::is_ip_address(lan_ip) ? "IP:" : "DNS:") + lan_ip;
    if (!info.covers(lan_san)) {
        spdlog::warn("Certificate does not cover {}; devices on the network will see a name mismatch. "
                     "Delete cert.pem/key.pem to regenerate.", lan_ip);
    }
    if (info.days_remaining < 0) {
        spdlog::warn("Certificate has expired. Delete cert.pem/key.pem to regenerate.");
    }
}

void print_banner(const std::string& local_url, const std::string& network_url) {
    std::cout << "\n"
              << "Starting HTTPS dev server (devserve " DEVSERVE_VERSION ")...\n"
              << "  Local:   " << local_url << "\n"
              << "  Network: " << network_url << "\n"
              << "\n"
              << "  IMPORTANT: Use HTTPS (not HTTP) and accept the certificate warning\n"
              << "  Press Ctrl+C to stop\n"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    ds::CliOptions cli;
    if (auto rc = ds::parse_args(argc, argv, cli, std::cout, std::cerr)) {
        return *rc;
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    ds::AppConfig config;
    try {
        config = ds::load_config(cli.config_path, cli.config_explicit);
        ds::apply_overrides(cli, config);
        ds::validate_config(config);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    ds::init_logger(config.logging);

    // ─── Certificates ─────────────────────────────────────────────────────────
    const std::string lan_ip = ds::resolve_lan_address();
    const std::string cert_path = ds::resolved_cert_path(config);
    const std::string key_path = ds::resolved_key_path(config);

    ds::SslCtxPtr tls_ctx(nullptr, &SSL_CTX_free);
    try {
        auto generator = make_generator(config.tls);
        ds::CertificateProvisioner provisioner(*generator, config.tls.validity_days, config.tls.key_bits);
        provisioner.ensure(cert_path, key_path, lan_ip);

        check_certificate(cert_path, lan_ip);
        tls_ctx = ds::create_server_context(cert_path, key_path);
    } catch (const ds::ProvisioningError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    } catch (const ds::TlsConfigError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    // ─── Start listening ──────────────────────────────────────────────────────
    ds::HttpServer server(config.server, std::move(tls_ctx), {cert_path, key_path});
    try {
        server.listen();
    } catch (const ds::ServerError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    // ─── Signal handling ──────────────────────────────────────────────────────
    // Installed before the banner so Ctrl+C works as soon as it is shown
    ds::ShutdownCoordinator coordinator([&server]() { server.stop(); });
    try {
        coordinator.install();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to install signal handlers: {}", e.what());
        return 1;
    }

    // ─── Announce ─────────────────────────────────────────────────────────────
    const std::string port = std::to_string(server.port());
    const std::string local_url = "https://localhost:" + port;
    const std::string network_url = "https://" +
        (lan_ip.find(':') != std::string::npos ? "[" + lan_ip + "]" : lan_ip) + ":" + port;
    print_banner(local_url, network_url);

    if (config.server.open_browser) {
        ds::open_browser(local_url);
    }

    // ─── Serve until stopped ──────────────────────────────────────────────────
    try {
        server.serve();
    } catch (const ds::ServerError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    coordinator.uninstall();
    if (coordinator.state() != ds::ShutdownCoordinator::State::Running) {
        coordinator.wait_until_stopped();
    }
    spdlog::info("Shutdown complete. Goodbye!");

    return 0;
}
