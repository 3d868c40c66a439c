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

#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>

namespace vgrid {

// ============================================================================
// Level parsing
// ============================================================================

bool parse_log_level(const std::string& text, LogLevel& level) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        level = LogLevel::WARNING;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR;
    } else if (upper == "CRITICAL" || upper == "CRIT") {
        level = LogLevel::CRITICAL;
    } else if (upper == "OFF") {
        level = LogLevel::OFF;
    } else {
        return false;
    }
    return true;
}

// ============================================================================
// Logger Initialization
// ============================================================================

namespace {

bool env_flag_enabled(const char* value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower != "false" && lower != "0" && lower != "off";
}

/**
 * @brief Initialize logger from environment variables
 */
class LoggerInitializer {
public:
    LoggerInitializer() {
        auto& logger = Logger::instance();

        if (const char* env_level = std::getenv("VGRID_LOG_LEVEL")) {
            LogLevel level = LogLevel::INFO;
            if (parse_log_level(env_level, level)) {
                logger.set_level(level);
            } else {
                std::cerr << "Ignoring unknown VGRID_LOG_LEVEL: " << env_level << std::endl;
            }
        }

        if (const char* env_file = std::getenv("VGRID_LOG_FILE")) {
            logger.set_file_output(env_file);
        }

        if (const char* env_console = std::getenv("VGRID_LOG_CONSOLE")) {
            logger.set_console_output(env_flag_enabled(env_console));
        }

        if (const char* env_time = std::getenv("VGRID_LOG_SHOW_TIME")) {
            logger.set_show_timestamp(env_flag_enabled(env_time));
        }
    }
};

static LoggerInitializer logger_init;

} // anonymous namespace

// ============================================================================
// Logger
// ============================================================================

void Logger::set_file_output(const std::string& filename) {
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

void Logger::log(LogLevel level,
                 const std::string& message,
                 const char* file,
                 int line,
                 const char* function) {
    #if !VGRID_DEBUG_MODE
    if (level == LogLevel::DEBUG) return;
    #endif

    LogMessage msg;
    msg.level = level;
    msg.message = message;
    msg.file = file ? file : "";
    msg.line = line;
    msg.function = function ? function : "";
    msg.timestamp = std::chrono::system_clock::now();

    std::vector<LogHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level == LogLevel::OFF || level < min_level_) return;

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

        handlers = handlers_;
    }

    // Handlers run outside the lock so they may log themselves.
    for (const auto& handler : handlers) {
        if (handler) {
            handler(msg);
        }
    }
}

std::string Logger::format_message(const LogMessage& msg) const {
    std::ostringstream oss;

    if (show_timestamp_) {
        auto time_t = std::chrono::system_clock::to_time_t(msg.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            msg.timestamp.time_since_epoch()) % 1000;

        oss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    oss << "[" << log_level_to_string(msg.level) << "] ";
    oss << msg.message;

    #if VGRID_DEBUG_MODE
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

} // namespace vgrid
