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

#ifndef SVMF_FUNC_JIT_FUNC_COMPILER_H
#define SVMF_FUNC_JIT_FUNC_COMPILER_H

/**
 * @file FuncCompiler.h
 * @brief Compile FuncNode trees to CompiledEvaluators, once per (node, variable order)
 */

#include "Functions/FuncNode.h"
#include "Functions/FuncOptions.h"
#include "Functions/JIT/CompiledEvaluator.h"
#include "Functions/JIT/JITEngine.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace svmf {
namespace func {
namespace jit {

struct FuncCompileCacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
    std::uint64_t entries{0};
    std::uint64_t native_compiles{0};   ///< Functions that went through code generation
    std::uint64_t kernel_reuses{0};     ///< Misses served by native code of an identical IR
    std::uint64_t tape_fallbacks{0};
    JITObjectCacheStats object{};
};

/**
 * @brief Compiler with a result cache
 *
 * Cache entries are keyed by node identity and variable order and hold a weak
 * reference to the node, so an address reused by a later allocation never
 * returns a stale evaluator. On a miss, the native back end reuses the code of
 * any earlier function whose lowered IR is identical (JITOptions::cache_kernels).
 * Each compiler has one back end; instances are shared per option set through
 * getOrCreate(). All members are thread safe.
 */
class FuncCompiler final {
public:
    [[nodiscard]] static std::shared_ptr<FuncCompiler> getOrCreate(const CompileOptions& options);

    /**
     * @brief Compiled evaluator for `node` over `variable_order`
     *
     * @throws InvalidArgumentException if node is null
     * @throws MalformedConstructionException if variable_order misses a free variable
     */
    [[nodiscard]] std::shared_ptr<const CompiledEvaluator>
    compile(const FuncNodePtr& node, const std::vector<std::string>& variable_order);

    [[nodiscard]] const CompileOptions& options() const noexcept;

    /// True when compile() produces native code (LLVM back end created successfully).
    [[nodiscard]] bool nativeAvailable() const;

    [[nodiscard]] FuncCompileCacheStats cacheStats() const;

    /// Drop cached evaluators and reset hit/miss/eviction counters; native code stays defined
    void clear();

    FuncCompiler(const FuncCompiler&) = delete;
    FuncCompiler& operator=(const FuncCompiler&) = delete;
    ~FuncCompiler();

private:
    explicit FuncCompiler(CompileOptions options);

    struct Impl;
    std::unique_ptr<Impl> impl_{};
};

} // namespace jit
} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_JIT_FUNC_COMPILER_H
