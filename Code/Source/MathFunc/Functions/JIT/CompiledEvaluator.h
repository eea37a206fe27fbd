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

#ifndef SVMF_FUNC_JIT_COMPILED_EVALUATOR_H
#define SVMF_FUNC_JIT_COMPILED_EVALUATOR_H

/**
 * @file CompiledEvaluator.h
 * @brief Allocation-free evaluation of a compiled function over a flat argument array
 *
 * A CompiledEvaluator is immutable once built and may be shared and called
 * from any number of threads.
 */

#include "Core/Types.h"
#include "Functions/FuncOptions.h"
#include "Functions/JIT/FuncIR.h"

#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace svmf {
namespace func {
namespace jit {

class JITEngine;

/**
 * @brief One register-machine instruction: reg[i] = op(reg[a], reg[b])
 *
 * The destination register is the instruction index.
 */
struct TapeInstruction {
    FuncIROpType opcode{FuncIROpType::Constant};
    std::uint32_t a{0};     ///< Argument slot for Argument, else first operand register
    std::uint32_t b{0};     ///< Second operand register
    Real imm{0.0};          ///< Constant value or PowConst exponent
};

class CompiledEvaluator final {
public:
    using NativeFunction = double (*)(const double*);

    /**
     * @brief Tape interpreter over `ir`
     */
    [[nodiscard]] static std::shared_ptr<const CompiledEvaluator>
    fromTape(const FuncIR& ir, std::vector<std::string> variable_order);

    /**
     * @brief Native code produced by the LLVM back end
     *
     * `engine` keeps the code mapped for the evaluator's lifetime.
     */
    [[nodiscard]] static std::shared_ptr<const CompiledEvaluator>
    fromNative(NativeFunction function,
               std::shared_ptr<JITEngine> engine,
               std::uint64_t ir_hash,
               std::vector<std::string> variable_order);

    /**
     * @brief Value at `args`, where args[i] binds variableOrder()[i]
     *
     * @throws InvalidArgumentException if args is shorter than variableOrder()
     */
    [[nodiscard]] Real evaluate(std::span<const Real> args) const;

    /**
     * @brief Tape evaluation into a caller-owned register workspace
     *
     * `workspace` must hold at least registerCount() values. Native evaluators
     * ignore it.
     */
    [[nodiscard]] Real evaluateWith(std::span<const Real> args, std::span<Real> workspace) const;

    /**
     * @brief Row-major batch: point i occupies points[i*n, (i+1)*n) with n = argumentCount()
     */
    void evaluateBatch(std::span<const Real> points, std::span<Real> out) const;

    [[nodiscard]] CompileBackend backend() const noexcept { return backend_; }
    [[nodiscard]] const std::vector<std::string>& variableOrder() const noexcept { return variable_order_; }
    [[nodiscard]] const std::map<std::string, ArgIndex>& argumentIndex() const noexcept { return argument_index_; }
    [[nodiscard]] std::size_t argumentCount() const noexcept { return variable_order_.size(); }

    [[nodiscard]] std::size_t registerCount() const noexcept { return tape_.size(); }
    [[nodiscard]] const std::vector<TapeInstruction>& tape() const noexcept { return tape_; }
    [[nodiscard]] std::uint64_t irHash() const noexcept { return ir_hash_; }

private:
    CompiledEvaluator() = default;

    void setVariableOrder(std::vector<std::string> order);
    [[nodiscard]] Real runTape(const Real* args, Real* regs) const noexcept;

    CompileBackend backend_{CompileBackend::Tape};
    std::vector<std::string> variable_order_{};
    std::map<std::string, ArgIndex> argument_index_{};
    std::vector<TapeInstruction> tape_{};
    std::uint32_t root_{0};
    std::uint64_t ir_hash_{0};

    NativeFunction native_{nullptr};
    std::shared_ptr<JITEngine> engine_{};
};

} // namespace jit
} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_JIT_COMPILED_EVALUATOR_H
