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

#ifndef SVMF_FUNC_JIT_LLVM_GEN_H
#define SVMF_FUNC_JIT_LLVM_GEN_H

/**
 * @file LLVMGen.h
 * @brief Lower FuncIR to LLVM IR and hand the module to a JITEngine
 *
 * The generated symbol has the C signature `double fn(const double* args)`,
 * where args[i] is the value of argument slot i.
 */

#include "Functions/FuncOptions.h"
#include "Functions/JIT/FuncIR.h"
#include "Functions/JIT/JITEngine.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace svmf {
namespace func {
namespace jit {

struct LLVMGenResult {
    bool ok{false};
    std::string message{};
};

class LLVMGen final {
public:
    explicit LLVMGen(JITOptions options);

    LLVMGen(const LLVMGen&) = delete;
    LLVMGen& operator=(const LLVMGen&) = delete;

    /**
     * @brief Emit, verify and load `ir` as `symbol`
     *
     * On success `out_address` holds the entry point. Failures are reported
     * through the result and leave `out_address` at zero.
     */
    [[nodiscard]] LLVMGenResult compileFunction(JITEngine& engine,
                                                const FuncIR& ir,
                                                std::string_view symbol,
                                                std::uintptr_t& out_address) const;

private:
    JITOptions options_{};
};

} // namespace jit
} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_JIT_LLVM_GEN_H
