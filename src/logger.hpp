#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"

namespace ds {

// Name of the logger that carries one line per HTTP request
inline constexpr const char* kAccessLoggerName = "http";

inline spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

inline void init_logger(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always)
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
    sinks.push_back(console_sink);

    // File sink (optional)
    if (!cfg.file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file,
            static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(cfg.max_files)
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto level = parse_level(cfg.level);

    auto logger = std::make_shared<spdlog::logger>("devserve", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    // Access log shares the sinks; replaced on re-init
    spdlog::drop(kAccessLoggerName);
    auto access = std::make_shared<spdlog::logger>(kAccessLoggerName, sinks.begin(), sinks.end());
    access->set_level(level);
    access->flush_on(spdlog::level::warn);
    spdlog::register_logger(access);

    // A failing sink must never take a request or the shutdown path down
    spdlog::set_error_handler([](const std::string& msg) {
        std::cerr << "[devserve] logging error: " << msg << std::endl;
    });
}

// Access logger, falling back to the default logger before init_logger() ran
inline std::shared_ptr<spdlog::logger> access_logger() {
    auto logger = spdlog::get(kAccessLoggerName);
    return logger ? logger : spdlog::default_logger();
}

} // namespace ds
