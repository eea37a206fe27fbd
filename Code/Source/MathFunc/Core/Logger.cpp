/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file Logger.cpp
 * @brief Logger level parsing and environment-driven initialization
 */

#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace svmf {

std::optional<LogLevel> parse_log_level(std::string_view text)
{
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL" || upper == "CRIT") return LogLevel::CRITICAL;
    if (upper == "OFF") return LogLevel::OFF;
    return std::nullopt;
}

// ============================================================================
// Logger Initialization
// ============================================================================

namespace {

bool envFlagEnabled(const char* value)
{
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower != "false" && lower != "0" && lower != "off";
}

/**
 * @brief Initialize logger from environment variables
 *
 * SVMF_LOG_LEVEL, SVMF_LOG_FILE, SVMF_LOG_CONSOLE, SVMF_LOG_SHOW_TIME and
 * SVMF_LOG_SHOW_THREAD are read once at static initialization.
 */
class LoggerInitializer {
public:
    LoggerInitializer() {
        auto& logger = Logger::instance();

        if (const char* env_level = std::getenv("SVMF_LOG_LEVEL")) {
            if (auto level = parse_log_level(env_level)) {
                logger.set_level(*level);
            } else {
                std::cerr << "Ignoring unknown SVMF_LOG_LEVEL '" << env_level << "'" << std::endl;
            }
        }

        if (const char* env_file = std::getenv("SVMF_LOG_FILE")) {
            logger.set_file_output(env_file);
        }

        if (const char* env_console = std::getenv("SVMF_LOG_CONSOLE")) {
            logger.set_console_output(envFlagEnabled(env_console));
        }

        if (const char* env_time = std::getenv("SVMF_LOG_SHOW_TIME")) {
            logger.set_show_timestamp(envFlagEnabled(env_time));
        }

        if (const char* env_thread = std::getenv("SVMF_LOG_SHOW_THREAD")) {
            logger.set_show_thread(envFlagEnabled(env_thread));
        }
    }
};

static LoggerInitializer logger_init;

} // anonymous namespace

} // namespace svmf
