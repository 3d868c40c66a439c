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

#ifndef VGRID_GRID_EXCEPTION_H
#define VGRID_GRID_EXCEPTION_H

/**
 * @file GridException.h
 * @brief Exception hierarchy for error handling in the vgrid library
 *
 * Every error raised by the library derives from GridException and carries a
 * GridStatus code plus the source location of the throw site. The throw
 * macros at the bottom of this file fill the location in automatically.
 */

#include "GridConfig.h"
#include "GridTypes.h"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

// Platform-specific includes for stack traces
#if defined(__GNUC__) && !defined(_WIN32)
#include <execinfo.h>
#include <cxxabi.h>
#endif

namespace vgrid {

// ============================================================================
// Status Codes
// ============================================================================

enum class GridStatus : std::uint8_t {
    Success                = 0,
    InvalidArgument        = 1,
    ConstructionIncomplete = 2,
    IndexOutOfRange        = 3,
    ShapeMismatch          = 4,
    LocationNotFound       = 5,
    InternalConsistency    = 6,
    Unknown                = 255
};

inline const char* status_to_string(GridStatus status) noexcept {
    switch (status) {
        case GridStatus::Success:                return "Success";
        case GridStatus::InvalidArgument:        return "Invalid argument";
        case GridStatus::ConstructionIncomplete: return "Construction incomplete";
        case GridStatus::IndexOutOfRange:        return "Index out of range";
        case GridStatus::ShapeMismatch:          return "Shape mismatch";
        case GridStatus::LocationNotFound:       return "Location not found";
        case GridStatus::InternalConsistency:    return "Internal consistency error";
        default:                                 return "Unknown error";
    }
}

// ============================================================================
// Base Exception Class
// ============================================================================

/**
 * @brief Base exception class for all vgrid exceptions
 *
 * Provides:
 * - Detailed error messages
 * - Source file and line information
 * - Stack traces in debug builds
 */
class GridException : public std::exception {
public:
    GridException(const std::string& message,
                  GridStatus status = GridStatus::Unknown)
        : message_(message),
          status_(status),
          line_(0) {
        capture_context();
        build_what();
    }

    GridException(const std::string& message,
                  const char* file,
                  int line,
                  const char* function = "",
                  GridStatus status = GridStatus::Unknown)
        : message_(message),
          status_(status),
          file_(file),
          line_(line),
          function_(function) {
        capture_context();
        build_what();
    }

    GridException(const GridException&) = default;

    virtual ~GridException() noexcept = default;

    const char* what() const noexcept override {
        return what_.c_str();
    }

    GridStatus status() const noexcept { return status_; }

    /**
     * @brief Message without the location decoration added by what()
     */
    const std::string& message() const noexcept { return message_; }

    const std::string& file() const noexcept { return file_; }

    int line() const noexcept { return line_; }

    const std::string& function() const noexcept { return function_; }

    const std::vector<std::string>& stack_trace() const noexcept { return stack_trace_; }

    /**
     * @brief Prefix the message with the context of an outer operation
     */
    void add_context(const std::string& context) {
        message_ = context + "\n  -> " + message_;
        build_what();
    }

protected:
    std::string message_;
    GridStatus status_;
    std::string file_;
    int line_;
    std::string function_;
    std::vector<std::string> stack_trace_;
    std::string what_;

    void capture_context() {
        #if VGRID_DEBUG_MODE
        capture_stack_trace();
        #endif
    }

    void capture_stack_trace() {
        #if defined(__GNUC__) && !defined(_WIN32)
        constexpr int MAX_FRAMES = 32;
        void* frames[MAX_FRAMES];
        int n_frames = backtrace(frames, MAX_FRAMES);

        char** symbols = backtrace_symbols(frames, n_frames);
        if (symbols) {
            for (int i = 1; i < n_frames; ++i) {  // Skip this function
                std::string symbol(symbols[i]);

                size_t start = symbol.find('(');
                size_t end = symbol.find('+', start);
                if (start != std::string::npos && end != std::string::npos) {
                    std::string mangled = symbol.substr(start + 1, end - start - 1);
                    int status;
                    char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
                    if (status == 0 && demangled) {
                        symbol.replace(start + 1, end - start - 1, demangled);
                        free(demangled);
                    }
                }

                stack_trace_.push_back(symbol);
            }
            free(symbols);
        }
        #endif
    }

    void build_what() {
        std::ostringstream oss;
        oss << "[vgrid] " << status_to_string(status_) << "\n";

        if (!file_.empty()) {
            oss << "  Location: " << file_ << ":" << line_;
            if (!function_.empty()) {
                oss << " in " << function_ << "()";
            }
            oss << "\n";
        }

        oss << "  Message: " << message_ << "\n";

        #if VGRID_DEBUG_MODE
        if (!stack_trace_.empty()) {
            oss << "  Stack trace:\n";
            for (size_t i = 0; i < stack_trace_.size() && i < 10; ++i) {
                oss << "    #" << i << " " << stack_trace_[i] << "\n";
            }
        }
        #endif

        what_ = oss.str();
    }
};

// ============================================================================
// Specific Exception Types
// ============================================================================

/**
 * @brief Invalid caller input (duplicate ids, bad scale factor, ...)
 */
class InvalidArgumentException : public GridException {
public:
    InvalidArgumentException(const std::string& message,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : GridException(message, file, line, function, GridStatus::InvalidArgument) {}
};

/**
 * @brief The grid lacks the data an operation needs
 *
 * Raised when vertices/topology are missing for geometry operations, or
 * elevations are missing for layered queries and conversion.
 */
class ConstructionIncompleteException : public GridException {
public:
    ConstructionIncompleteException(const std::string& message,
                                    const char* file = "",
                                    int line = 0,
                                    const char* function = "")
        : GridException(message, file, line, function, GridStatus::ConstructionIncomplete) {}
};

/**
 * @brief A cell, node, layer or vertex index is outside its valid range
 */
class IndexOutOfRangeException : public GridException {
public:
    IndexOutOfRangeException(const std::string& message,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : GridException(message, file, line, function, GridStatus::IndexOutOfRange) {}

    IndexOutOfRangeException(const std::string& message,
                             std::int64_t index,
                             std::int64_t size,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : GridException(build_message(message, index, size), file, line, function,
                        GridStatus::IndexOutOfRange),
          index_(index),
          size_(size) {}

    std::int64_t index() const noexcept { return index_; }
    std::int64_t size() const noexcept { return size_; }

private:
    std::int64_t index_ = -1;
    std::int64_t size_ = -1;

    static std::string build_message(const std::string& msg, std::int64_t index, std::int64_t size) {
        return msg + " (index " + std::to_string(index) + ", size " + std::to_string(size) + ")";
    }
};

/**
 * @brief A client array does not match any recognised per-layer layout
 */
class ShapeMismatchException : public GridException {
public:
    ShapeMismatchException(const std::string& message,
                           const std::vector<std::size_t>& shape,
                           const char* file = "",
                           int line = 0,
                           const char* function = "")
        : GridException(build_message(message, shape), file, line, function,
                        GridStatus::ShapeMismatch),
          shape_(shape) {}

    const std::vector<std::size_t>& shape() const noexcept { return shape_; }

private:
    std::vector<std::size_t> shape_;

    static std::string build_message(const std::string& msg, const std::vector<std::size_t>& shape) {
        std::ostringstream oss;
        oss << msg << " (shape: (";
        for (size_t i = 0; i < shape.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << shape[i];
        }
        oss << "))";
        return oss.str();
    }
};

/**
 * @brief No cell contains the queried point
 */
class LocationNotFoundException : public GridException {
public:
    LocationNotFoundException(const std::string& message,
                              real_t x,
                              real_t y,
                              const char* file = "",
                              int line = 0,
                              const char* function = "")
        : GridException(build_message(message, x, y), file, line, function,
                        GridStatus::LocationNotFound),
          x_(x),
          y_(y) {}

    real_t x() const noexcept { return x_; }
    real_t y() const noexcept { return y_; }

private:
    real_t x_;
    real_t y_;

    static std::string build_message(const std::string& msg, real_t x, real_t y) {
        std::ostringstream oss;
        oss << msg << " (point: " << x << ", " << y << ")";
        return oss.str();
    }
};

/**
 * @brief A post-condition that the library guarantees did not hold
 */
class InternalConsistencyException : public GridException {
public:
    InternalConsistencyException(const std::string& message,
                                 const char* file = "",
                                 int line = 0,
                                 const char* function = "")
        : GridException(message, file, line, function, GridStatus::InternalConsistency) {}
};

// ============================================================================
// Exception Throwing Macros
// ============================================================================

/**
 * @brief Throw exception with automatic source location
 */
#define VGRID_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__, __FUNCTION__)

#define VGRID_THROW_IF_3(condition, ExceptionType, message) \
    do { \
        if (VGRID_UNLIKELY(condition)) { \
            VGRID_THROW(ExceptionType, message); \
        } \
    } while(0)

#define VGRID_THROW_IF_2(condition, message) \
    do { \
        if (VGRID_UNLIKELY(condition)) { \
            VGRID_THROW(vgrid::GridException, message); \
        } \
    } while(0)

#define VGRID_THROW_IF_SELECT(_1, _2, _3, NAME, ...) NAME

/**
 * @brief Conditional throw with source location
 *
 * Can be called with 2 arguments (condition, message) using GridException,
 * or 3 arguments (condition, ExceptionType, message) for specific exception types.
 */
#define VGRID_THROW_IF(...) \
    VGRID_THROW_IF_SELECT(__VA_ARGS__, VGRID_THROW_IF_3, VGRID_THROW_IF_2)(__VA_ARGS__)

/**
 * @brief Check and throw InvalidArgumentException
 */
#define VGRID_CHECK_ARG(condition, message) \
    VGRID_THROW_IF(!(condition), vgrid::InvalidArgumentException, message)

/**
 * @brief Check index bounds, throwing IndexOutOfRangeException
 */
#define VGRID_CHECK_INDEX(index, size, what) \
    do { \
        if (VGRID_UNLIKELY((index) < 0 || (index) >= (size))) { \
            throw vgrid::IndexOutOfRangeException(std::string(what) + " out of range", \
                                                  static_cast<std::int64_t>(index), \
                                                  static_cast<std::int64_t>(size), \
                                                  __FILE__, __LINE__, __FUNCTION__); \
        } \
    } while(0)

} // namespace vgrid

#endif // VGRID_GRID_EXCEPTION_H
