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

#ifndef SVMF_FUNC_FUNC_ALGEBRA_H
#define SVMF_FUNC_FUNC_ALGEBRA_H

/**
 * @file FuncAlgebra.h
 * @brief Scalar kernels for each operator and a node builder that folds constants
 *
 * applyBinary()/applyUnary() are the single definition of each operator's
 * numeric meaning; the tree evaluator, the tape interpreter and the constant
 * folder all call them so every path rounds identically.
 */

#include "Functions/ConstantInterner.h"
#include "Functions/FuncNode.h"

#include <cmath>
#include <string>
#include <vector>

namespace svmf {
namespace func {

[[nodiscard]] inline Real signOf(Real x) noexcept
{
    if (x > 0.0) return 1.0;
    if (x < 0.0) return -1.0;
    return x;  // keeps +-0 and NaN
}

[[nodiscard]] inline Real applyBinary(BinaryKind kind, Real a, Real b) noexcept
{
    switch (kind) {
        case BinaryKind::Add: return a + b;
        case BinaryKind::Subtract: return a - b;
        case BinaryKind::Multiply: return a * b;
        case BinaryKind::Divide: return a / b;
        case BinaryKind::Power: return std::pow(a, b);
    }
    return 0.0;
}

[[nodiscard]] inline Real applyUnary(UnaryKind kind, Real a, Real exponent) noexcept
{
    switch (kind) {
        case UnaryKind::Negate: return -a;
        case UnaryKind::Sqrt: return std::sqrt(a);
        case UnaryKind::Power: return std::pow(a, exponent);
        case UnaryKind::Abs: return std::fabs(a);
        case UnaryKind::Sign: return signOf(a);
        case UnaryKind::Exp: return std::exp(a);
        case UnaryKind::Log: return std::log(a);
        case UnaryKind::Sin: return std::sin(a);
        case UnaryKind::Cos: return std::cos(a);
    }
    return 0.0;
}

/**
 * @brief Builds nodes, folding operators whose operands are all constants
 *
 * Folding is the only rewrite performed: x*1, x+0 and 0/0 are kept as
 * written. Folded results go through the interner.
 */
class NodeBuilder {
public:
    explicit NodeBuilder(ConstantInterner& interner) : interner_(&interner) {}

    [[nodiscard]] ConstantInterner& interner() const noexcept { return *interner_; }

    [[nodiscard]] FuncNodePtr constant(Real value) const { return interner_->intern(value); }
    [[nodiscard]] FuncNodePtr zero() const { return constant(0.0); }
    [[nodiscard]] FuncNodePtr one() const { return constant(1.0); }

    [[nodiscard]] FuncNodePtr binary(BinaryKind kind, const FuncNodePtr& a, const FuncNodePtr& b) const;
    [[nodiscard]] FuncNodePtr unary(UnaryKind kind, const FuncNodePtr& a, Real exponent = 0.0) const;
    [[nodiscard]] FuncNodePtr linearCombination(std::vector<Real> coeffs, std::vector<FuncNodePtr> terms) const;

    [[nodiscard]] FuncNodePtr add(const FuncNodePtr& a, const FuncNodePtr& b) const { return binary(BinaryKind::Add, a, b); }
    [[nodiscard]] FuncNodePtr subtract(const FuncNodePtr& a, const FuncNodePtr& b) const { return binary(BinaryKind::Subtract, a, b); }
    [[nodiscard]] FuncNodePtr multiply(const FuncNodePtr& a, const FuncNodePtr& b) const { return binary(BinaryKind::Multiply, a, b); }
    [[nodiscard]] FuncNodePtr divide(const FuncNodePtr& a, const FuncNodePtr& b) const { return binary(BinaryKind::Divide, a, b); }
    [[nodiscard]] FuncNodePtr power(const FuncNodePtr& a, const FuncNodePtr& b) const { return binary(BinaryKind::Power, a, b); }

    [[nodiscard]] FuncNodePtr negate(const FuncNodePtr& a) const { return unary(UnaryKind::Negate, a); }
    [[nodiscard]] FuncNodePtr sqrt(const FuncNodePtr& a) const { return unary(UnaryKind::Sqrt, a); }
    [[nodiscard]] FuncNodePtr pow(const FuncNodePtr& a, Real p) const { return unary(UnaryKind::Power, a, p); }
    [[nodiscard]] FuncNodePtr abs(const FuncNodePtr& a) const { return unary(UnaryKind::Abs, a); }
    [[nodiscard]] FuncNodePtr sign(const FuncNodePtr& a) const { return unary(UnaryKind::Sign, a); }
    [[nodiscard]] FuncNodePtr exp(const FuncNodePtr& a) const { return unary(UnaryKind::Exp, a); }
    [[nodiscard]] FuncNodePtr log(const FuncNodePtr& a) const { return unary(UnaryKind::Log, a); }
    [[nodiscard]] FuncNodePtr sin(const FuncNodePtr& a) const { return unary(UnaryKind::Sin, a); }
    [[nodiscard]] FuncNodePtr cos(const FuncNodePtr& a) const { return unary(UnaryKind::Cos, a); }

private:
    ConstantInterner* interner_;
};

} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_FUNC_ALGEBRA_H
