/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef SVMF_CORE_LOGGER_H
#define SVMF_CORE_LOGGER_H

/**
 * @file Logger.h
 * @brief Logging infrastructure for svMathFunc
 *
 * Provides thread-safe logging with multiple severity levels and
 * pluggable handlers. Output goes to the console and,
 * optionally, to a file.
 */

#include "Types.h"
#include "FuncConfig.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <mutex>
#include <memory>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <vector>
#include <functional>
#include <thread>

namespace svmf {

// ============================================================================
// Log Levels
// ============================================================================

/**
 * @brief Logging severity levels
 */
enum class LogLevel : int {
    DEBUG    = 0,  // Detailed debug information
    INFO     = 1,  // Informational messages
    WARNING  = 2,  // Warning messages
    ERROR    = 3,  // Error messages
    CRITICAL = 4,  // Critical errors
    OFF      = 5   // Logging disabled
};

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default:                 return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name (case-insensitive, accepts WARN/CRIT aliases)
 */
std::optional<LogLevel> parse_log_level(std::string_view text);

// ============================================================================
// Timer Class for Performance Logging
// ============================================================================

/**
 * @brief Simple timer for performance measurements
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::duration<double>;

    void start() {
        start_time_ = Clock::now();
        is_running_ = true;
    }

    void stop() {
        if (is_running_) {
            end_time_ = Clock::now();
            is_running_ = false;
        }
    }

    /**
     * @brief Elapsed time in seconds
     */
    double elapsed() const {
        TimePoint end = is_running_ ? Clock::now() : end_time_;
        Duration diff = end - start_time_;
        return diff.count();
    }

    void reset() {
        start_time_ = Clock::now();
        end_time_ = start_time_;
        is_running_ = false;
    }

private:
    TimePoint start_time_{};
    TimePoint end_time_{};
    bool is_running_ = false;
};

// ============================================================================
// Log Message Structure
// ============================================================================

struct LogMessage {
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;
};

// ============================================================================
// Logger Class
// ============================================================================

/**
 * @brief Thread-safe logger for svMathFunc
 *
 * Features:
 * - Console and file destinations
 * - Runtime level filtering (DEBUG is compiled out of release builds)
 * - Optional timestamp and thread-id prefixes
 * - Custom handlers receiving the structured LogMessage
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_output_ = enabled;
    }

    /**
     * @brief Append log output to a file (empty name closes the file)
     */
    void set_file_output(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (file_stream_.is_open()) {
            file_stream_.close();
        }

        if (!filename.empty()) {
            file_stream_.open(filename, std::ios::app);
            if (!file_stream_.is_open()) {
                std::cerr << "Failed to open log file: " << filename << std::endl;
            }
        }
    }

    void set_show_thread(bool show) {
        std::lock_guard<std::mutex> lock(mutex_);
        show_thread_ = show;
    }

    void set_show_timestamp(bool show) {
        std::lock_guard<std::mutex> lock(mutex_);
        show_timestamp_ = show;
    }

    void log(LogLevel level,
             const std::string& message,
             const char* file = "",
             int line = 0,
             const char* function = "") {

        #if !SVMF_DEBUG_MODE
        if (level == LogLevel::DEBUG) return;
        #endif

        if (level == LogLevel::OFF) return;

        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) return;

        LogMessage msg;
        msg.level = level;
        msg.message = message;
        msg.file = file;
        msg.line = line;
        msg.function = function;
        msg.timestamp = std::chrono::system_clock::now();
        msg.thread_id = std::this_thread::get_id();

        const std::string formatted = format_message(msg);

        if (console_output_) {
            if (level >= LogLevel::WARNING) {
                std::cerr << formatted << std::flush;
            } else {
                std::cout << formatted << std::flush;
            }
        }

        if (file_stream_.is_open()) {
            file_stream_ << formatted << std::flush;
        }

        for (const auto& handler : handlers_) {
            handler(msg);
        }
    }

    using LogHandler = std::function<void(const LogMessage&)>;
    void add_handler(LogHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.push_back(std::move(handler));
    }

    void clear_handlers() {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.clear();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
        if (file_stream_.is_open()) {
            file_stream_.flush();
        }
    }

private:
    Logger() : min_level_(LogLevel::INFO),
               console_output_(true),
               show_thread_(false),
               show_timestamp_(true) {}

    ~Logger() {
        if (file_stream_.is_open()) {
            file_stream_.close();
        }
    }

    std::string format_message(const LogMessage& msg) const {
        std::ostringstream oss;

        if (show_timestamp_) {
            const auto time_t = std::chrono::system_clock::to_time_t(msg.timestamp);
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                msg.timestamp.time_since_epoch()) % 1000;
            std::tm local{};
            localtime_r(&time_t, &local);

            oss << "[" << std::put_time(&local, "%H:%M:%S")
                << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
        }

        if (show_thread_) {
            oss << "[T" << msg.thread_id << "] ";
        }

        oss << "[" << log_level_to_string(msg.level) << "] ";
        oss << msg.message;

        #if SVMF_DEBUG_MODE
        if (msg.level >= LogLevel::WARNING && !msg.file.empty()) {
            oss << " (" << msg.file << ":" << msg.line;
            if (!msg.function.empty()) {
                oss << " in " << msg.function << "()";
            }
            oss << ")";
        }
        #endif

        oss << "\n";
        return oss.str();
    }

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool console_output_;
    bool show_thread_;
    bool show_timestamp_;
    std::ofstream file_stream_;
    std::vector<LogHandler> handlers_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define SVMF_LOG(level, message) \
    svmf::Logger::instance().log(level, message, __FILE__, __LINE__, __FUNCTION__)

/**
 * @brief Debug logging (compiled out in release mode)
 */
#if SVMF_DEBUG_MODE
    #define SVMF_LOG_DEBUG(message) SVMF_LOG(svmf::LogLevel::DEBUG, message)
#else
    #define SVMF_LOG_DEBUG(message) ((void)0)
#endif

#define SVMF_LOG_INFO(message) SVMF_LOG(svmf::LogLevel::INFO, message)

#define SVMF_LOG_WARNING(message) SVMF_LOG(svmf::LogLevel::WARNING, message)

#define SVMF_LOG_ERROR(message) SVMF_LOG(svmf::LogLevel::ERROR, message)

#define SVMF_LOG_CRITICAL(message) SVMF_LOG(svmf::LogLevel::CRITICAL, message)

} // namespace svmf

#endif // SVMF_CORE_LOGGER_H
