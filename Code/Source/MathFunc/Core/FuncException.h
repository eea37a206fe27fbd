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

#ifndef SVMF_CORE_FUNC_EXCEPTION_H
#define SVMF_CORE_FUNC_EXCEPTION_H

/**
 * @file FuncException.h
 * @brief Exception hierarchy for error handling in svMathFunc
 *
 * Every error raised by the function engine derives from FuncException and
 * carries a FuncStatus code, the throwing source location and, in debug
 * builds, a demangled stack trace.
 */

#include "Types.h"
#include "FuncConfig.h"
#include <cstdlib>
#include <exception>
#include <string>
#include <sstream>
#include <vector>

// Platform-specific includes for stack traces
#if defined(__GNUC__) && !defined(_WIN32)
#include <execinfo.h>
#include <cxxabi.h>
#endif

namespace svmf {

// ============================================================================
// Base Exception Class
// ============================================================================

/**
 * @brief Base exception class for all svMathFunc exceptions
 */
class FuncException : public std::exception {
public:
    FuncException(const std::string& message,
                  FuncStatus status = FuncStatus::Unknown)
        : message_(message),
          status_(status),
          file_(""),
          line_(0),
          function_("") {
        capture_context();
        build_what();
    }

    FuncException(const std::string& message,
                  const char* file,
                  int line,
                  const char* function = "",
                  FuncStatus status = FuncStatus::Unknown)
        : message_(message),
          status_(status),
          file_(file),
          line_(line),
          function_(function) {
        capture_context();
        build_what();
    }

    FuncException(const FuncException&) = default;

    virtual ~FuncException() noexcept = default;

    virtual const char* what() const noexcept override {
        return what_.c_str();
    }

    FuncStatus status() const noexcept {
        return status_;
    }

    /**
     * @brief Message without the location/status decoration of what()
     */
    const std::string& message() const noexcept {
        return message_;
    }

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    const std::string& function() const noexcept {
        return function_;
    }

    /**
     * @brief Stack trace captured at construction (debug builds only)
     */
    const std::vector<std::string>& stack_trace() const noexcept {
        return stack_trace_;
    }

    /**
     * @brief Prefix the message with caller context while unwinding
     */
    void add_context(const std::string& context) {
        message_ = context + "\n  -> " + message_;
        build_what();
    }

protected:
    std::string message_;
    FuncStatus status_;
    std::string file_;
    int line_;
    std::string function_;
    std::vector<std::string> stack_trace_;
    std::string what_;

    void capture_context() {
        #if SVMF_DEBUG_MODE
        capture_stack_trace();
        #endif
    }

    /**
     * @brief Capture stack trace (platform-specific)
     */
    void capture_stack_trace() {
        #if defined(__GNUC__) && !defined(_WIN32)
        constexpr int MAX_FRAMES = 32;
        void* frames[MAX_FRAMES];
        int n_frames = backtrace(frames, MAX_FRAMES);

        char** symbols = backtrace_symbols(frames, n_frames);
        if (symbols) {
            if (n_frames > 0) {
                stack_trace_.reserve(static_cast<std::size_t>(n_frames));
            }
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
                        std::free(demangled);
                    }
                }

                stack_trace_.push_back(symbol);
            }
            std::free(symbols);
        }
        #endif
    }

    void build_what() {
        std::ostringstream oss;

        oss << "[svMathFunc Exception] " << status_to_string(status_) << "\n";

        if (!file_.empty()) {
            oss << "  Location: " << file_ << ":" << line_;
            if (!function_.empty()) {
                oss << " in " << function_ << "()";
            }
            oss << "\n";
        }

        oss << "  Message: " << message_ << "\n";

        #if SVMF_DEBUG_MODE
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
 * @brief Exception for invalid arguments
 */
class InvalidArgumentException : public FuncException {
public:
    InvalidArgumentException(const std::string& message,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : FuncException(message, file, line, function, FuncStatus::InvalidArgument) {}
};

/**
 * @brief A function was evaluated without a binding for one of its variables
 */
class UnboundVariableException : public FuncException {
public:
    UnboundVariableException(const std::string& variable,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : FuncException("Unbound variable '" + variable + "'", file, line, function,
                        FuncStatus::UnboundVariable),
          variable_(variable) {}

    const std::string& variable() const noexcept { return variable_; }

private:
    std::string variable_;
};

/**
 * @brief A function or compiled evaluator was built from inconsistent parts
 *
 * Raised eagerly at construction/compile time, never during evaluation.
 */
class MalformedConstructionException : public FuncException {
public:
    MalformedConstructionException(const std::string& message,
                                   const char* file = "",
                                   int line = 0,
                                   const char* function = "")
        : FuncException(message, file, line, function, FuncStatus::MalformedConstruction) {}
};

/**
 * @brief Attempt to rename or re-scope a shared leaf node
 */
class UnsupportedMutationException : public FuncException {
public:
    UnsupportedMutationException(const std::string& message,
                                 const char* file = "",
                                 int line = 0,
                                 const char* function = "")
        : FuncException(message, file, line, function, FuncStatus::UnsupportedMutation) {}
};

/**
 * @brief Exception for code-generation back end failures
 */
class BackendException : public FuncException {
public:
    BackendException(const std::string& message,
                     const char* file = "",
                     int line = 0,
                     const char* function = "")
        : FuncException(message, file, line, function, FuncStatus::BackendError) {}
};

// ============================================================================
// Exception Throwing Macros
// ============================================================================

/**
 * @brief Throw exception with automatic source location
 */
#define SVMF_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__, __FUNCTION__)

/**
 * @brief Conditional throw with source location (3 args: condition, ExceptionType, message)
 */
#define SVMF_THROW_IF_3(condition, ExceptionType, message) \
    do { \
        if (SVMF_UNLIKELY(condition)) { \
            SVMF_THROW(ExceptionType, message); \
        } \
    } while(0)

/**
 * @brief Conditional throw with FuncException (2 args: condition, message)
 */
#define SVMF_THROW_IF_2(condition, message) \
    do { \
        if (SVMF_UNLIKELY(condition)) { \
            SVMF_THROW(svmf::FuncException, message); \
        } \
    } while(0)

#define SVMF_THROW_IF_SELECT(_1, _2, _3, NAME, ...) NAME

/**
 * @brief Conditional throw with source location
 *
 * Can be called with 2 arguments (condition, message) using FuncException,
 * or 3 arguments (condition, ExceptionType, message) for specific exception types.
 */
#define SVMF_THROW_IF(...) \
    SVMF_THROW_IF_SELECT(__VA_ARGS__, SVMF_THROW_IF_3, SVMF_THROW_IF_2)(__VA_ARGS__)

/**
 * @brief Check and throw InvalidArgumentException
 */
#define SVMF_CHECK_ARG(condition, message) \
    SVMF_THROW_IF(!(condition), svmf::InvalidArgumentException, message)

/**
 * @brief Check for null pointers
 */
#define SVMF_CHECK_NOT_NULL(ptr, name) \
    SVMF_THROW_IF((ptr) == nullptr, svmf::InvalidArgumentException, \
                  std::string(name) + " is null")

} // namespace svmf

#endif // SVMF_CORE_FUNC_EXCEPTION_H
