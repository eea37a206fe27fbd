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

#ifndef SVMF_FUNC_MATH_FUNC_H
#define SVMF_FUNC_MATH_FUNC_H

/**
 * @file MathFunc.h
 * @brief Value-semantic handle for a symbolic scalar function
 *
 * A MathFunc wraps an immutable FuncNode tree together with the constant
 * interner used to build new trees from it. Copies share the tree. Every
 * operation returns a new handle; no operation changes an existing tree.
 */

#include "Core/Types.h"
#include "Functions/ConstantInterner.h"
#include "Functions/Evaluator.h"
#include "Functions/FuncNode.h"
#include "Functions/FuncOptions.h"
#include "Functions/JIT/CompiledEvaluator.h"
#include "Functions/VariableContext.h"

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace svmf {
namespace func {

class MathFunc;

using MathFuncMap = std::map<std::string, MathFunc, std::less<>>;
using ArgumentIndex = std::map<std::string, ArgIndex, std::less<>>;

class MathFunc {
public:
    /// Invalid (empty) handle
    MathFunc() = default;

    explicit MathFunc(FuncNodePtr node,
                      std::shared_ptr<ConstantInterner> interner = ConstantInterner::shared());

    // ---- Terminals ----
    [[nodiscard]] static MathFunc constant(Real value,
                                           std::shared_ptr<ConstantInterner> interner = ConstantInterner::shared());
    [[nodiscard]] static MathFunc variable(std::string name,
                                           std::shared_ptr<ConstantInterner> interner = ConstantInterner::shared());

    // ---- Constructors ----

    /**
     * @brief sum_i coeffs[i] * terms[i]
     *
     * @throws MalformedConstructionException if the lengths differ or are zero
     */
    [[nodiscard]] static MathFunc linearCombination(std::vector<Real> coeffs, const std::vector<MathFunc>& terms);
    [[nodiscard]] static MathFunc linearCombination(Real c1, const MathFunc& f1, Real c2, const MathFunc& f2);

    /// @throws MalformedConstructionException on empty input
    [[nodiscard]] static MathFunc sum(const std::vector<MathFunc>& terms);

    // ---- Algebra ----
    [[nodiscard]] MathFunc add(const MathFunc& rhs) const;
    [[nodiscard]] MathFunc add(Real rhs) const;
    [[nodiscard]] MathFunc subtract(const MathFunc& rhs) const;
    [[nodiscard]] MathFunc subtract(Real rhs) const;
    [[nodiscard]] MathFunc multiply(const MathFunc& rhs) const;
    [[nodiscard]] MathFunc multiply(Real rhs) const;
    [[nodiscard]] MathFunc divide(const MathFunc& rhs) const;
    [[nodiscard]] MathFunc divide(Real rhs) const;
    [[nodiscard]] MathFunc negate() const;

    [[nodiscard]] MathFunc operator-() const { return negate(); }
    [[nodiscard]] MathFunc operator+(const MathFunc& rhs) const { return add(rhs); }
    [[nodiscard]] MathFunc operator-(const MathFunc& rhs) const { return subtract(rhs); }
    [[nodiscard]] MathFunc operator*(const MathFunc& rhs) const { return multiply(rhs); }
    [[nodiscard]] MathFunc operator/(const MathFunc& rhs) const { return divide(rhs); }
    [[nodiscard]] MathFunc operator+(Real rhs) const { return add(rhs); }
    [[nodiscard]] MathFunc operator-(Real rhs) const { return subtract(rhs); }
    [[nodiscard]] MathFunc operator*(Real rhs) const { return multiply(rhs); }
    [[nodiscard]] MathFunc operator/(Real rhs) const { return divide(rhs); }

    [[nodiscard]] MathFunc pow(Real exponent) const;
    [[nodiscard]] MathFunc pow(const MathFunc& exponent) const;
    [[nodiscard]] MathFunc sqrt() const;
    [[nodiscard]] MathFunc abs() const;
    [[nodiscard]] MathFunc sign() const;
    [[nodiscard]] MathFunc exp() const;
    [[nodiscard]] MathFunc log() const;
    [[nodiscard]] MathFunc sin() const;
    [[nodiscard]] MathFunc cos() const;

    // ---- Query ----
    [[nodiscard]] bool isValid() const noexcept { return node_ != nullptr; }
    [[nodiscard]] const FuncNode* node() const noexcept { return node_.get(); }
    [[nodiscard]] const FuncNodePtr& nodeShared() const noexcept { return node_; }
    [[nodiscard]] const std::shared_ptr<ConstantInterner>& interner() const noexcept { return interner_; }

    [[nodiscard]] const std::vector<std::string>& freeVariableNames() const;
    [[nodiscard]] bool dependsOn(std::string_view name) const;

    [[nodiscard]] bool isConstant() const noexcept;
    [[nodiscard]] bool isZero() const noexcept;
    [[nodiscard]] bool isInteger() const noexcept;
    [[nodiscard]] bool isReal() const noexcept;

    /// @throws InvalidArgumentException if the function is not a Constant
    [[nodiscard]] Real constantValue() const;

    // ---- Names and argument slots ----
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /**
     * @brief Copy carrying a display name for toString()
     *
     * @throws UnsupportedMutationException on Constant and Variable leaves
     */
    [[nodiscard]] MathFunc setName(std::string name) const;

    /**
     * @brief Rename the free variables positionally
     *
     * The i-th free variable becomes names[i].
     *
     * @throws UnsupportedMutationException on Constant and Variable leaves
     * @throws MalformedConstructionException if names.size() != freeVariableNames().size()
     */
    [[nodiscard]] MathFunc setVariableNames(const std::vector<std::string>& names) const;

    /**
     * @brief Copy with an explicit name -> slot map for positional evaluation
     *
     * @throws MalformedConstructionException if a free variable has no slot or
     *         two names share a slot
     */
    [[nodiscard]] MathFunc setArgumentIndex(ArgumentIndex index) const;
    [[nodiscard]] const std::optional<ArgumentIndex>& argumentIndex() const noexcept { return argument_index_; }

    /// Names by slot: argumentIndex() order when set, otherwise freeVariableNames()
    [[nodiscard]] std::vector<std::string> argumentOrder() const;

    // ---- Evaluation ----

    /// @throws UnboundVariableException if a free variable is missing from `context`
    [[nodiscard]] Real apply(const VariableContext& context) const;
    [[nodiscard]] Real apply(const VariableContext& context, EvaluationCache& cache) const;

    /**
     * @brief Positional evaluation, args[i] binding argumentOrder()[i]
     *
     * @throws InvalidArgumentException if args is too short
     */
    [[nodiscard]] Real apply(std::span<const Real> args) const;

    [[nodiscard]] std::vector<Real> applyBatch(const std::vector<VariableContext>& contexts,
                                               const BatchOptions& options = {}) const;
    [[nodiscard]] std::vector<Real> applyBatch(const VariableBatch& batch) const;

    // ---- Calculus ----
    [[nodiscard]] MathFunc diff(std::string_view variable) const;
    [[nodiscard]] std::vector<MathFunc> grad() const;
    [[nodiscard]] std::vector<MathFunc> grad(const std::vector<std::string>& variables) const;

    // ---- Composition ----

    /// Composite node; derivatives go through the chain rule
    [[nodiscard]] MathFunc compose(const MathFuncMap& substitutions,
                                   CompositionPolicy policy = CompositionPolicy::Merge) const;

    /// Eager structural replacement of Variable leaves
    [[nodiscard]] MathFunc substitute(const MathFuncMap& substitutions,
                                      CompositionPolicy policy = CompositionPolicy::Merge) const;

    // ---- Compilation ----

    /**
     * @brief Compiled evaluator over `variable_order`
     *
     * Results are cached per (tree, order) by the shared FuncCompiler for
     * `options`.
     *
     * @throws MalformedConstructionException if variable_order misses a free variable
     */
    [[nodiscard]] std::shared_ptr<const jit::CompiledEvaluator>
    compile(const std::vector<std::string>& variable_order,
            const CompileOptions& options = defaultCompileOptions()) const;

    /// compile(argumentOrder())
    [[nodiscard]] std::shared_ptr<const jit::CompiledEvaluator> compile() const;

    // ---- Printing ----
    [[nodiscard]] std::string toExpressionString() const;

    /// "name(x, y) = expression"
    [[nodiscard]] std::string toString() const;

private:
    [[nodiscard]] MathFunc wrap(FuncNodePtr node) const;
    [[nodiscard]] const FuncNode& checkedNode(const char* where) const;

    FuncNodePtr node_{};
    std::shared_ptr<ConstantInterner> interner_{};
    std::string name_{"f"};
    std::optional<ArgumentIndex> argument_index_{};
};

// Convenience free functions
inline MathFunc operator+(Real lhs, const MathFunc& rhs) { return MathFunc::constant(lhs, rhs.interner()).add(rhs); }
inline MathFunc operator-(Real lhs, const MathFunc& rhs) { return MathFunc::constant(lhs, rhs.interner()).subtract(rhs); }
inline MathFunc operator*(Real lhs, const MathFunc& rhs) { return MathFunc::constant(lhs, rhs.interner()).multiply(rhs); }
inline MathFunc operator/(Real lhs, const MathFunc& rhs) { return MathFunc::constant(lhs, rhs.interner()).divide(rhs); }

inline MathFunc sqrt(const MathFunc& f) { return f.sqrt(); }
inline MathFunc pow(const MathFunc& f, Real p) { return f.pow(p); }
inline MathFunc pow(const MathFunc& f, const MathFunc& g) { return f.pow(g); }
inline MathFunc abs(const MathFunc& f) { return f.abs(); }
inline MathFunc sign(const MathFunc& f) { return f.sign(); }
inline MathFunc exp(const MathFunc& f) { return f.exp(); }
inline MathFunc log(const MathFunc& f) { return f.log(); }
inline MathFunc sin(const MathFunc& f) { return f.sin(); }
inline MathFunc cos(const MathFunc& f) { return f.cos(); }

} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_MATH_FUNC_H
