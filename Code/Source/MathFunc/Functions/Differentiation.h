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

#ifndef SVMF_FUNC_DIFFERENTIATION_H
#define SVMF_FUNC_DIFFERENTIATION_H

/**
 * @file Differentiation.h
 * @brief Symbolic partial derivatives of expression trees
 */

#include "Functions/FuncAlgebra.h"
#include "Functions/FuncNode.h"

#include <string>
#include <string_view>
#include <vector>

namespace svmf {
namespace func {

/**
 * @brief Partial derivative of `node` with respect to `variable`
 *
 * Structural recursion with one rule per node kind (sum, product, quotient
 * and chain rules). Subtrees that do not depend on `variable` differentiate
 * to the interned Constant(0) without being visited. Shared sub-expressions
 * are differentiated once per call.
 *
 * A Composite differentiates by the multivariable chain rule:
 *   d/dv outer(s) = sum_k compose(d outer/d k, s) * d s_k/dv
 *                   + compose(d outer/d v, s)   (v free in outer, not replaced)
 *
 * The result is not simplified beyond constant folding.
 */
[[nodiscard]] FuncNodePtr differentiate(const FuncNodePtr& node,
                                        std::string_view variable,
                                        const NodeBuilder& builder);

/**
 * @brief One partial derivative per name in `variables`
 */
[[nodiscard]] std::vector<FuncNodePtr> gradient(const FuncNodePtr& node,
                                                const std::vector<std::string>& variables,
                                                const NodeBuilder& builder);

} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_DIFFERENTIATION_H
