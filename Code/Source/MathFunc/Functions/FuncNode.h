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

#ifndef SVMF_FUNC_FUNC_NODE_H
#define SVMF_FUNC_FUNC_NODE_H

/**
 * @file FuncNode.h
 * @brief Immutable expression-tree nodes for scalar functions of named variables
 *
 * A FuncNode is a closed tagged variant over the supported operations. Nodes
 * are only ever handled through `std::shared_ptr<const FuncNode>`; trees may
 * share sub-nodes (DAG) but never form cycles, since a node can only be built
 * from children that already exist.
 */

#include "Core/Types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace svmf {
namespace func {

class FuncNode;
using FuncNodePtr = std::shared_ptr<const FuncNode>;

/**
 * @brief Ordered (name, replacement) pairs carried by a Composite node
 */
using NodeSubstitutions = std::vector<std::pair<std::string, FuncNodePtr>>;

enum class FuncNodeType : std::uint8_t {
    Constant,
    Variable,
    Binary,
    Unary,
    LinearCombination,
    Composite
};

enum class BinaryKind : std::uint8_t {
    Add,
    Subtract,
    Multiply,
    Divide,
    Power       ///< f^g with a function exponent
};

enum class UnaryKind : std::uint8_t {
    Negate,
    Sqrt,
    Power,      ///< f^p with a constant exponent
    Abs,
    Sign,
    Exp,
    Log,
    Sin,
    Cos
};

[[nodiscard]] const char* binaryKindName(BinaryKind kind) noexcept;
[[nodiscard]] const char* unaryKindName(UnaryKind kind) noexcept;

// ---- Payloads ----

struct ConstantTerm {
    Real value{0.0};
};

struct VariableTerm {
    std::string name{};
};

struct BinaryTerm {
    BinaryKind kind{BinaryKind::Add};
    FuncNodePtr left{};
    FuncNodePtr right{};
};

struct UnaryTerm {
    UnaryKind kind{UnaryKind::Negate};
    FuncNodePtr arg{};
    Real exponent{0.0};  // UnaryKind::Power only
};

struct LinearCombinationTerm {
    std::vector<Real> coeffs{};
    std::vector<FuncNodePtr> terms{};
};

struct CompositeTerm {
    FuncNodePtr outer{};
    NodeSubstitutions substitutions{};

    /// Replacement for `name`, or nullptr if the name stays free in `outer`.
    [[nodiscard]] const FuncNodePtr* find(std::string_view name) const noexcept;
};

using FuncPayload = std::variant<ConstantTerm,
                                 VariableTerm,
                                 BinaryTerm,
                                 UnaryTerm,
                                 LinearCombinationTerm,
                                 CompositeTerm>;

/**
 * @brief One operation or leaf of an expression tree
 *
 * The free-variable list and the printing precedence are computed once, from
 * the children, when the node is built.
 */
class FuncNode {
public:
    // ---- Factories (no folding, no interning) ----
    [[nodiscard]] static FuncNodePtr makeConstant(Real value);
    [[nodiscard]] static FuncNodePtr makeVariable(std::string name);
    [[nodiscard]] static FuncNodePtr makeBinary(BinaryKind kind, FuncNodePtr left, FuncNodePtr right);
    [[nodiscard]] static FuncNodePtr makeUnary(UnaryKind kind, FuncNodePtr arg, Real exponent = 0.0);

    /**
     * @brief Weighted sum c_0*t_0 + ... + c_{n-1}*t_{n-1}
     *
     * @throws MalformedConstructionException if the counts differ or are zero
     */
    [[nodiscard]] static FuncNodePtr makeLinearCombination(std::vector<Real> coeffs,
                                                           std::vector<FuncNodePtr> terms);

    /**
     * @brief `outer` with each listed free variable replaced by its tree
     *
     * Keys must be free variables of `outer` and unique. compose() in
     * Composition.h filters and orders substitutions before calling this.
     */
    [[nodiscard]] static FuncNodePtr makeComposite(FuncNodePtr outer, NodeSubstitutions substitutions);

    // ---- Accessors ----
    [[nodiscard]] FuncNodeType type() const noexcept { return static_cast<FuncNodeType>(payload_.index()); }
    [[nodiscard]] const FuncPayload& payload() const noexcept { return payload_; }

    template<typename T>
    [[nodiscard]] const T* as() const noexcept { return std::get_if<T>(&payload_); }

    [[nodiscard]] const std::vector<std::string>& freeVariables() const noexcept { return free_variables_; }
    [[nodiscard]] bool dependsOn(std::string_view name) const noexcept;

    [[nodiscard]] Precedence precedence() const noexcept { return precedence_; }

    [[nodiscard]] bool isConstant() const noexcept { return type() == FuncNodeType::Constant; }
    [[nodiscard]] bool isVariable() const noexcept { return type() == FuncNodeType::Variable; }
    [[nodiscard]] bool isLeaf() const noexcept { return isConstant() || isVariable(); }

    /// Direct children in evaluation order (substitutions before outer for Composite).
    [[nodiscard]] std::vector<FuncNodePtr> children() const;

private:
    FuncNode(FuncPayload payload, std::vector<std::string> free_variables, Precedence precedence);

    FuncPayload payload_;
    std::vector<std::string> free_variables_;
    Precedence precedence_;
};

/**
 * @brief Append the names in `src` that are not already in `dst`
 */
void appendUnique(std::vector<std::string>& dst, const std::vector<std::string>& src);

} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_FUNC_NODE_H
