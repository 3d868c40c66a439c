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

#ifndef VGRID_LOGGER_H
#define VGRID_LOGGER_H

/**
 * @file Logger.h
 * @brief Logging infrastructure for the vgrid library
 *
 * A process-wide logger with severity levels, console and file sinks, and
 * custom handlers. Start-up settings are read from VGRID_LOG_* environment
 * variables (see Logger.cpp).
 */

#include "GridConfig.h"

#include <chrono>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace vgrid {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
    DEBUG    = 0,
    INFO     = 1,
    WARNING  = 2,
    ERROR    = 3,
    CRITICAL = 4,
    OFF      = 5
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
 * @brief Parse a level name (case-insensitive); returns false if unknown
 */
bool parse_log_level(const std::string& text, LogLevel& level);

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
};

// ============================================================================
// Logger Class
// ============================================================================

/**
 * @brief Process-wide logger for the vgrid library
 *
 * Features:
 * - Console output (warnings and above go to stderr)
 * - Optional append-mode file output
 * - Custom handlers receiving every emitted LogMessage
 * - Runtime level filtering; DEBUG is compiled out of release builds
 */
class Logger {
public:
    using LogHandler = std::function<void(const LogMessage&)>;

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
     * @brief Append log output to a file; an empty name closes the file sink
     */
    void set_file_output(const std::string& filename);

    void set_show_timestamp(bool show) {
        std::lock_guard<std::mutex> lock(mutex_);
        show_timestamp_ = show;
    }

    /**
     * @brief Log a message
     */
    void log(LogLevel level,
             const std::string& message,
             const char* file = "",
             int line = 0,
             const char* function = "");

    /**
     * @brief Add custom log handler
     * @return Handle usable with remove_handler()
     */
    size_t add_handler(LogHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.push_back(std::move(handler));
        return handlers_.size() - 1;
    }

    /**
     * @brief Disable the handler registered under @p handle
     */
    void remove_handler(size_t handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handle < handlers_.size()) {
            handlers_[handle] = nullptr;
        }
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
               show_timestamp_(true) {}

    ~Logger() {
        if (file_stream_.is_open()) {
            file_stream_.close();
        }
    }

    std::string format_message(const LogMessage& msg) const;

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool console_output_;
    bool show_timestamp_;
    std::ofstream file_stream_;
    std::vector<LogHandler> handlers_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define VGRID_LOG(level, message) \
    vgrid::Logger::instance().log(level, message, __FILE__, __LINE__, __FUNCTION__)

#if VGRID_DEBUG_MODE
    #define VGRID_LOG_DEBUG(message) VGRID_LOG(vgrid::LogLevel::DEBUG, message)
#else
    #define VGRID_LOG_DEBUG(message) ((void)0)
#endif

#define VGRID_LOG_INFO(message) VGRID_LOG(vgrid::LogLevel::INFO, message)

#define VGRID_LOG_WARNING(message) VGRID_LOG(vgrid::LogLevel::WARNING, message)

#define VGRID_LOG_ERROR(message) VGRID_LOG(vgrid::LogLevel::ERROR, message)

#define VGRID_LOG_CRITICAL(message) VGRID_LOG(vgrid::LogLevel::CRITICAL, message)

} // namespace vgrid

#endif // VGRID_LOGGER_H
