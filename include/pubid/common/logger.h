/**
 * @file logger.h
 * @brief spdlog configuration for libpubid consumers
 *
 * The library logs through the spdlog default logger. Applications and the
 * test runner call Logger::initialize() once to install a named, colored
 * console logger at the configured level.
 *
 * @date 2026-10-18
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <string>

namespace pubid {
namespace common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Initialize the default logger
     * @param name Logger name shown in every line (e.g., "pubid")
     * @param logLevel Log level (trace, debug, info, warn, error, critical, off)
     */
    static void initialize(const std::string& name, const std::string& logLevel = "info") {
        try {
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

            auto logger = std::make_shared<spdlog::logger>(name, consoleSink);
            logger->set_level(toLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::debug("Logger initialized: name={}, level={}", name, logLevel);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(toLevel(level));
        spdlog::debug("Log level changed to: {}", level);
    }

    /**
     * @brief Map a level name to spdlog's level; unknown names fall back to info
     */
    static spdlog::level::level_enum toLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace common
} // namespace pubid
