#include "cli.hpp"
#include <stdexcept>

namespace ds {

void print_usage(std::ostream& out) {
    out << "Usage: devserve [options]\n"
        << "Serve a directory over HTTPS with an auto-generated self-signed certificate.\n"
        << "\nOptions:\n"
        << "  --port <n>             Port to listen on (default: $PORT or 3000)\n"
        << "  --host <addr>          Address to bind (default: 0.0.0.0)\n"
        << "  --root <dir>           Directory to serve (default: .)\n"
        << "  --no-open              Don't open a browser tab\n"
        << "  -c, --config <path>    Config file (default: devserve.yaml)\n"
        << "  --log-level <level>    trace/debug/info/warn/error/critical\n"
        << "  -h, --help             Show this help\n"
        << "\nEnvironment variables:\n"
        << "  PORT                   Default port\n"
        << "  LOG_LEVEL              Log level\n";
}

std::optional<int> parse_args(int argc, const char* const argv[], CliOptions& opts,
                              std::ostream& out, std::ostream& err) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        std::string value;
        bool has_inline_value = false;

        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            has_inline_value = true;
        }

        auto take_value = [&](std::string& dest) {
            if (has_inline_value) {
                dest = value;
                return true;
            }
            if (i + 1 < argc) {
                dest = argv[++i];
                return true;
            }
            err << "ERROR: " << arg << " requires a value\n";
            return false;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(out);
            return 0;
        } else if (arg == "--no-open") {
            opts.no_open = true;
        } else if (arg == "--config" || arg == "-c") {
            if (!take_value(opts.config_path)) return 2;
            opts.config_explicit = true;
        } else if (arg == "--host") {
            std::string host;
            if (!take_value(host)) return 2;
            opts.host = host;
        } else if (arg == "--root") {
            std::string root;
            if (!take_value(root)) return 2;
            opts.root = root;
        } else if (arg == "--log-level") {
            std::string level;
            if (!take_value(level)) return 2;
            opts.log_level = level;
        } else if (arg == "--port") {
            std::string port;
            if (!take_value(port)) return 2;
            try {
                size_t used = 0;
                int p = std::stoi(port, &used);
                if (used != port.size() || p < 0 || p > 65535) throw std::out_of_range(port);
                opts.port = p;
            } catch (const std::exception&) {
                err << "ERROR: invalid port '" << port << "'\n";
                return 2;
            }
        } else {
            err << "ERROR: unknown option " << arg << "\n\n";
            print_usage(err);
            return 2;
        }
    }
    return std::nullopt;
}

void apply_overrides(const CliOptions& opts, AppConfig& config) {
    if (opts.port) config.server.port = static_cast<uint16_t>(*opts.port);
    if (opts.host) config.server.host = *opts.host;
    if (opts.root) config.server.root = *opts.root;
    if (opts.log_level) config.logging.level = *opts.log_level;
    if (opts.no_open) config.server.open_browser = false;
}

} // namespace ds
