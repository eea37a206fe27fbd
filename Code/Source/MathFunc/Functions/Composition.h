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

#ifndef SVMF_FUNC_COMPOSITION_H
#define SVMF_FUNC_COMPOSITION_H

/**
 * @file Composition.h
 * @brief Replacing free variables of a tree by other trees
 *
 * Two forms with identical values:
 *  - compose() wraps the outer tree in a Composite node. The outer tree is
 *    kept intact, so differentiation can apply the multivariable chain rule.
 *  - substitute() rebuilds the tree with each replaced Variable leaf swapped
 *    for its tree (constant operands fold on the way).
 *
 * Under CompositionPolicy::Merge a name that a substituted tree shares with an
 * unsubstituted free variable of the outer tree denotes the same variable
 * afterwards. Keeping names apart is the caller's job unless
 * RejectCollisions is requested.
 */

#include "Functions/FuncAlgebra.h"
#include "Functions/FuncNode.h"
#include "Functions/FuncOptions.h"

namespace svmf {
namespace func {

/**
 * @brief Substitutions that apply to `outer`, in the order of its free variables
 *
 * Entries whose key is not free in `outer` are dropped. Under
 * RejectCollisions, throws MalformedConstructionException when a kept tree
 * reintroduces a free variable of `outer` that is not itself replaced.
 */
[[nodiscard]] NodeSubstitutions activeSubstitutions(const FuncNode& outer,
                                                    const NodeSubstitutions& substitutions,
                                                    CompositionPolicy policy);

/**
 * @brief Composite node for `outer` with the given replacements
 *
 * Returns `outer` itself when no replacement applies.
 */
[[nodiscard]] FuncNodePtr compose(const FuncNodePtr& outer,
                                  const NodeSubstitutions& substitutions,
                                  CompositionPolicy policy = CompositionPolicy::Merge);

/**
 * @brief Structural substitution; Composite nodes on the path are expanded
 */
[[nodiscard]] FuncNodePtr substitute(const FuncNodePtr& node,
                                     const NodeSubstitutions& substitutions,
                                     const NodeBuilder& builder,
                                     CompositionPolicy policy = CompositionPolicy::Merge);

} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_COMPOSITION_H
