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

#ifndef SVMF_FUNC_JIT_FUNC_IR_H
#define SVMF_FUNC_JIT_FUNC_IR_H

/**
 * @file FuncIR.h
 * @brief Flat, post-ordered IR for a scalar function of an ordered argument array
 *
 * Variables are resolved to argument slots during lowering, Composite nodes
 * are inlined and LinearCombination nodes are expanded to Multiply/Add. Every
 * child index is smaller than its parent index, so ops can be executed in
 * order. Both compile back ends consume this IR.
 */

#include "Functions/FuncNode.h"

#include <cstdint>
#include <string>
#include <vector>

namespace svmf {
namespace func {
namespace jit {

enum class FuncIROpType : std::uint8_t {
    Constant,   ///< imm0: bit-cast double
    Argument,   ///< imm0: slot in the argument array
    Add,
    Subtract,
    Multiply,
    Divide,
    Power,      ///< f^g
    Negate,
    Sqrt,
    PowConst,   ///< imm0: bit-cast double exponent
    Abs,
    Sign,
    Exp,
    Log,
    Sin,
    Cos
};

[[nodiscard]] const char* funcIROpName(FuncIROpType type) noexcept;

struct FuncIROp {
    FuncIROpType type{FuncIROpType::Constant};
    std::uint32_t first_child{0};
    std::uint32_t child_count{0};

    std::uint64_t imm0{0};
    std::uint64_t imm1{0};
};

struct FuncIR {
    std::vector<FuncIROp> ops{};
    std::vector<std::uint32_t> children{};
    std::uint32_t root{0};
    std::uint32_t argument_count{0};    ///< Length of the variable order lowered against

    [[nodiscard]] bool empty() const noexcept { return ops.empty(); }
    [[nodiscard]] std::size_t opCount() const noexcept { return ops.size(); }

    [[nodiscard]] std::uint32_t child(const FuncIROp& op, std::uint32_t i) const
    {
        return children[static_cast<std::size_t>(op.first_child) + i];
    }

    /**
     * @brief Deterministic 64-bit structural hash (independent of node addresses)
     */
    [[nodiscard]] std::uint64_t stableHash64() const;
    [[nodiscard]] std::string dump() const;
};

struct FuncIRBuildOptions {
    bool cse{true};
    bool fold_constants{true};
    bool canonicalize_commutative{true};
};

/**
 * @brief Lower a tree against a fixed variable order
 *
 * @throws MalformedConstructionException if a free variable of `root` is
 *         missing from `variable_order`. Names listed twice use the first slot.
 */
[[nodiscard]] FuncIR lowerToFuncIR(const FuncNode& root,
                                   const std::vector<std::string>& variable_order,
                                   const FuncIRBuildOptions& options = {});

} // namespace jit
} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_JIT_FUNC_IR_H
