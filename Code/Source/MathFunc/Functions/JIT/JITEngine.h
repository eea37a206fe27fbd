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

#ifndef SVMF_FUNC_JIT_JIT_ENGINE_H
#define SVMF_FUNC_JIT_JIT_ENGINE_H

/**
 * @file JITEngine.h
 * @brief Thin wrapper around the LLVM OrcJIT (LLJIT) runtime
 *
 * This header does not include LLVM headers, so LLVM stays confined to the
 * Functions/JIT implementation files.
 */

#include "Functions/FuncOptions.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace llvm {
namespace orc {
class ThreadSafeModule;
} // namespace orc
} // namespace llvm

namespace svmf {
namespace func {
namespace jit {

/**
 * @brief Counters of the on-disk object cache (all zero without a cache directory)
 */
struct JITObjectCacheStats {
    std::uint64_t stored{0};    ///< Object files written
    std::uint64_t loaded{0};    ///< Modules whose code generation was skipped
    std::uint64_t misses{0};
};

class JITEngine final {
public:
    using SymbolAddress = std::uintptr_t;

    /**
     * @brief Create an engine when LLVM support is available
     *
     * Returns nullptr when svMathFunc was built without the LLVM back end or
     * when the engine cannot be created at run time.
     */
    [[nodiscard]] static std::unique_ptr<JITEngine> create(const JITOptions& options);

    ~JITEngine();

    JITEngine(const JITEngine&) = delete;
    JITEngine& operator=(const JITEngine&) = delete;

    [[nodiscard]] bool available() const noexcept;

    /**
     * @brief Hand a module to the JIT; its symbols are materialized on lookup
     *
     * With a cache directory, the module identifier names the object file, so
     * callers must derive it from the module contents.
     *
     * @throws BackendException if the module defines an existing symbol
     */
    void addModule(llvm::orc::ThreadSafeModule&& module);

    /// @throws BackendException if `name` is not defined
    [[nodiscard]] SymbolAddress lookup(std::string_view name);

    /// Empty when the engine is not available
    [[nodiscard]] std::string targetTriple() const;
    [[nodiscard]] std::string dataLayoutString() const;

    [[nodiscard]] JITObjectCacheStats objectCacheStats() const;

private:
    JITEngine() = default;

    struct Impl;
    std::unique_ptr<Impl> impl_{};
    mutable std::mutex mutex_{};
};

} // namespace jit
} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_JIT_JIT_ENGINE_H
