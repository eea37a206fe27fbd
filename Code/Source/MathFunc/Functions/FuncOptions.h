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

#ifndef SVMF_FUNC_FUNC_OPTIONS_H
#define SVMF_FUNC_FUNC_OPTIONS_H

/**
 * @file FuncOptions.h
 * @brief Run-time options for composition, batch evaluation and compilation
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace svmf {
namespace func {

/**
 * @brief How compose()/substitute() treat names reintroduced by substituted trees
 */
enum class CompositionPolicy : std::uint8_t {
    Merge,              ///< Equal names denote the same variable (default)
    RejectCollisions    ///< Throw if a substituted tree reuses a name left free in the outer function
};

struct BatchOptions {
    bool use_cache{true};       ///< One EvaluationCache per batch element
    bool parallel{true};        ///< Split elements across OpenMP threads when available
    int num_threads{0};         ///< 0: OpenMP default
};

struct JITOptions {
    bool enable{false};
    int optimization_level{2};
    bool cache_kernels{true};             ///< Reuse native code across functions with identical IR
    bool vectorize{true};
    std::string cache_directory;          ///< Object files kept across engines and processes; empty disables
    bool dump_llvm_ir{false};
    std::string dump_directory{"svmf_jit_dumps"};
};

enum class CompileBackend : std::uint8_t {
    Tape,   ///< Register-tape interpreter (always available)
    LLVM,   ///< Native code through the LLVM ORC JIT
    Auto    ///< LLVM when built in, otherwise Tape
};

[[nodiscard]] const char* compileBackendName(CompileBackend backend) noexcept;
[[nodiscard]] std::optional<CompileBackend> parseCompileBackend(std::string_view text);

struct CompileOptions {
    CompileBackend backend{CompileBackend::Tape};
    bool cse{true};
    bool fold_constants{true};
    bool cache_compiled{true};
    JITOptions jit{};
};

/**
 * @brief CompileOptions with environment overrides applied
 *
 * SVMF_COMPILE_BACKEND (tape|llvm|auto) selects the back end and
 * SVMF_JIT_OPT_LEVEL (0-3) the LLVM optimization level. Read on every call.
 */
[[nodiscard]] CompileOptions defaultCompileOptions();

} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_FUNC_OPTIONS_H
