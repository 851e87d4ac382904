#pragma once

#include "config.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace ds {

// Command-line values that override the config file and environment
struct CliOptions {
    std::string config_path = "devserve.yaml";
    bool config_explicit = false;
    std::optional<int> port;
    std::optional<std::string> host;
    std::optional<std::string> root;
    std::optional<std::string> log_level;
    bool no_open = false;
};

void print_usage(std::ostream& out);

// Accepts "--flag value" and "--flag=value". Returns an exit code when the
// process should end right away: 0 after --help, 2 on a usage error.
std::optional<int> parse_args(int argc, const char* const argv[], CliOptions& opts,
                              std::ostream& out, std::ostream& err);

void apply_overrides(const CliOptions& opts, AppConfig& config);

} // namespace ds
