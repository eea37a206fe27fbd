/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/FuncAlgebra.h"

#include <utility>

namespace svmf {
namespace func {

FuncNodePtr NodeBuilder::binary(BinaryKind kind, const FuncNodePtr& a, const FuncNodePtr& b) const
{
    const auto* ca = a ? a->as<ConstantTerm>() : nullptr;
    const auto* cb = b ? b->as<ConstantTerm>() : nullptr;
    if (ca && cb) {
        return constant(applyBinary(kind, ca->value, cb->value));
    }
    return FuncNode::makeBinary(kind, a, b);
}

FuncNodePtr NodeBuilder::unary(UnaryKind kind, const FuncNodePtr& a, Real exponent) const
{
    if (const auto* ca = a ? a->as<ConstantTerm>() : nullptr) {
        return constant(applyUnary(kind, ca->value, exponent));
    }
    return FuncNode::makeUnary(kind, a, exponent);
}

FuncNodePtr NodeBuilder::linearCombination(std::vector<Real> coeffs, std::vector<FuncNodePtr> terms) const
{
    auto node = FuncNode::makeLinearCombination(std::move(coeffs), std::move(terms));

    const auto& lc = *node->as<LinearCombinationTerm>();
    Real acc = 0.0;
    for (std::size_t i = 0; i < lc.terms.size(); ++i) {
        const auto* c = lc.terms[i]->as<ConstantTerm>();
        if (!c) {
            return node;
        }
        acc = (i == 0u) ? lc.coeffs[i] * c->value : acc + lc.coeffs[i] * c->value;
    }
    return constant(acc);
}

} // namespace func
} // namespace svmf
