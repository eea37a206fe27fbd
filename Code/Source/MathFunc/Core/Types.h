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

#ifndef SVMF_CORE_TYPES_H
#define SVMF_CORE_TYPES_H

/**
 * @file Types.h
 * @brief Fundamental type definitions for the svMathFunc library
 *
 * Scalar and index aliases plus the status codes carried by every
 * exception thrown from the function engine.
 */

#include <cstdint>
#include <limits>

namespace svmf {

// ============================================================================
// Scalar and Index Types
// ============================================================================

/**
 * @brief Floating point type used for every evaluation
 *
 * All evaluation paths (tree walking, tape, JIT) are IEEE double precision.
 */
using Real = double;

/**
 * @brief Slot of a variable inside a flat argument array
 */
using ArgIndex = std::uint32_t;

constexpr ArgIndex INVALID_ARG_INDEX = std::numeric_limits<ArgIndex>::max();

// ============================================================================
// Operator Precedence
// ============================================================================

/**
 * @brief Grouping levels used when printing expressions
 *
 * Lower binds tighter. Only the printer consults these values.
 */
enum class Precedence : int {
    Atom     = 0,  // Leaves and parenthesized groups
    Power    = 1,  // Exponentiation and unary functions
    Product  = 2,  // Multiply and divide
    Sum      = 3   // Add and subtract
};

[[nodiscard]] constexpr int precedenceLevel(Precedence p) noexcept {
    return static_cast<int>(p);
}

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Status codes attached to library exceptions
 */
enum class FuncStatus : std::uint8_t {
    Success               = 0,
    InvalidArgument       = 1,
    UnboundVariable       = 2,
    MalformedConstruction = 3,
    UnsupportedMutation   = 4,
    BackendError          = 5,
    Unknown               = 255
};

inline const char* status_to_string(FuncStatus status) noexcept {
    switch (status) {
        case FuncStatus::Success:               return "Success";
        case FuncStatus::InvalidArgument:       return "Invalid argument";
        case FuncStatus::UnboundVariable:       return "Unbound variable";
        case FuncStatus::MalformedConstruction: return "Malformed construction";
        case FuncStatus::UnsupportedMutation:   return "Unsupported mutation";
        case FuncStatus::BackendError:          return "Backend error";
        default:                                return "Unknown error";
    }
}

} // namespace svmf

#endif // SVMF_CORE_TYPES_H
