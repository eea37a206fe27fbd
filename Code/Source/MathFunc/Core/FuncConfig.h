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

#ifndef SVMF_CORE_FUNC_CONFIG_H
#define SVMF_CORE_FUNC_CONFIG_H

/**
 * @file FuncConfig.h
 * @brief Compile-time configuration and feature settings for svMathFunc
 *
 * Centralizes build-mode detection, optional third-party features and the
 * sizing constants used by the evaluators. Settings can be overridden via
 * CMake or compiler flags.
 */

#include "Types.h"
#include <cstddef>
#include <cstdio>

// ============================================================================
// Build Configuration Detection
// ============================================================================

// Debug/Release mode detection
#if !defined(NDEBUG) || defined(DEBUG) || defined(_DEBUG)
    #define SVMF_DEBUG_MODE 1
#else
    #define SVMF_DEBUG_MODE 0
#endif

#if SVMF_DEBUG_MODE
#include <cassert>
#endif

// OpenMP support detection
#ifdef _OPENMP
    #define SVMF_HAS_OPENMP 1
    #include <omp.h>
#else
    #define SVMF_HAS_OPENMP 0
#endif

// LLVM ORC JIT back end (set by CMake when LLVM was found)
#ifndef SVMF_ENABLE_LLVM_JIT
    #define SVMF_ENABLE_LLVM_JIT 0
#endif

namespace svmf {
namespace config {

// ============================================================================
// Evaluation Configuration
// ============================================================================

/**
 * @brief Register count a compiled tape may use from stack storage
 *
 * Tapes with more registers than this evaluate into a per-thread
 * workspace that is grown once and then reused.
 * Can be overridden at compile time with -DSVMF_TAPE_STACK_REGISTERS=N
 */
#ifndef SVMF_TAPE_STACK_REGISTERS
    constexpr std::size_t TAPE_STACK_REGISTERS = 256;
#else
    constexpr std::size_t TAPE_STACK_REGISTERS = SVMF_TAPE_STACK_REGISTERS;
#endif

/**
 * @brief Minimum batch size before applyBatch splits work across threads
 */
#ifndef SVMF_BATCH_PARALLEL_THRESHOLD
    constexpr std::size_t BATCH_PARALLEL_THRESHOLD = 512;
#else
    constexpr std::size_t BATCH_PARALLEL_THRESHOLD = SVMF_BATCH_PARALLEL_THRESHOLD;
#endif

/**
 * @brief Maximum number of compiled evaluators retained per compiler
 *
 * Zero means unbounded.
 */
#ifndef SVMF_COMPILE_CACHE_CAPACITY
    constexpr std::size_t COMPILE_CACHE_CAPACITY = 4096;
#else
    constexpr std::size_t COMPILE_CACHE_CAPACITY = SVMF_COMPILE_CACHE_CAPACITY;
#endif

// ============================================================================
// Debug/Diagnostic Configuration
// ============================================================================

#if SVMF_DEBUG_MODE
    constexpr bool ENABLE_ASSERTIONS = true;
#else
    constexpr bool ENABLE_ASSERTIONS = false;
#endif

// ============================================================================
// Compiler Hints and Attributes
// ============================================================================

// Likely/unlikely branch hints
#if defined(__GNUC__) || defined(__clang__)
    #define SVMF_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define SVMF_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define SVMF_LIKELY(x)   (x)
    #define SVMF_UNLIKELY(x) (x)
#endif

// Force inline
#if defined(_MSC_VER)
    #define SVMF_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
    #define SVMF_ALWAYS_INLINE __attribute__((always_inline)) inline
#else
    #define SVMF_ALWAYS_INLINE inline
#endif

// Restrict pointer aliasing
#if defined(__GNUC__) || defined(__clang__)
    #define SVMF_RESTRICT __restrict__
#elif defined(_MSC_VER)
    #define SVMF_RESTRICT __restrict
#else
    #define SVMF_RESTRICT
#endif

// ============================================================================
// Assertion Macros
// ============================================================================

#if SVMF_DEBUG_MODE
    #define SVMF_ASSERT(cond) assert(cond)
    #define SVMF_ASSERT_MSG(cond, msg) assert((cond) && (msg))
#else
    #define SVMF_ASSERT(cond) ((void)0)
    #define SVMF_ASSERT_MSG(cond, msg) ((void)0)
#endif

// ============================================================================
// Configuration Summary
// ============================================================================

/**
 * @brief Print configuration summary
 */
inline void print_config() {
    #define PRINT_BOOL(x) ((x) ? "ON" : "OFF")

    std::printf("svMathFunc Configuration:\n");
    std::printf("  Debug Mode: %s\n", PRINT_BOOL(SVMF_DEBUG_MODE));
    std::printf("  OpenMP Support: %s\n", PRINT_BOOL(SVMF_HAS_OPENMP));
    std::printf("  LLVM JIT: %s\n", PRINT_BOOL(SVMF_ENABLE_LLVM_JIT));
    std::printf("  Tape Stack Registers: %zu\n", TAPE_STACK_REGISTERS);
    std::printf("  Batch Parallel Threshold: %zu\n", BATCH_PARALLEL_THRESHOLD);
    std::printf("  Compile Cache Capacity: %zu\n", COMPILE_CACHE_CAPACITY);

    #undef PRINT_BOOL
}

} // namespace config
} // namespace svmf

#endif // SVMF_CORE_FUNC_CONFIG_H
