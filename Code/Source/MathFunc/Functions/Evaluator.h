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

#ifndef SVMF_FUNC_EVALUATOR_H
#define SVMF_FUNC_EVALUATOR_H

/**
 * @file Evaluator.h
 * @brief Tree-walking evaluation of expression trees
 *
 * Evaluation follows IEEE double semantics: division by zero, sqrt of a
 * negative and similar cases produce Inf/NaN rather than errors. The only
 * evaluation error is an unbound variable.
 */

#include "Functions/FuncNode.h"
#include "Functions/FuncOptions.h"
#include "Functions/VariableContext.h"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace svmf {
namespace func {

/**
 * @brief Per-evaluation memo of compound node values, keyed by node identity
 *
 * Guarantees a shared sub-expression is computed once per context however
 * many parents reference it. Leaves are not cached. A cache must not be
 * shared between threads; evaluate() clears it on entry, so its statistics
 * describe the most recent call.
 */
class EvaluationCache {
public:
    [[nodiscard]] std::optional<Real> lookup(const FuncNode* node);
    void store(const FuncNode* node, Real value);

    [[nodiscard]] std::size_t hits() const noexcept { return hits_; }
    [[nodiscard]] std::size_t misses() const noexcept { return misses_; }
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    void clear() noexcept;

private:
    std::unordered_map<const FuncNode*, Real> values_{};
    std::size_t hits_{0};
    std::size_t misses_{0};
};

/**
 * @brief Evaluate without memoization
 *
 * @throws UnboundVariableException if a free variable is missing from `context`
 */
[[nodiscard]] Real evaluate(const FuncNode& node, const VariableContext& context);

/**
 * @brief Evaluate, memoizing compound nodes in `cache`
 */
[[nodiscard]] Real evaluate(const FuncNode& node, const VariableContext& context, EvaluationCache& cache);

/**
 * @brief Evaluate once per context
 *
 * Element i equals evaluate(node, contexts[i]). With OpenMP and at least
 * config::BATCH_PARALLEL_THRESHOLD contexts the loop runs in parallel; the
 * first exception raised by any element is rethrown on the caller's thread.
 */
[[nodiscard]] std::vector<Real> evaluateBatch(const FuncNode& node,
                                              const std::vector<VariableContext>& contexts,
                                              const BatchOptions& options = {});

/**
 * @brief Column-wise evaluation: each node is visited once for the whole batch
 */
[[nodiscard]] std::vector<Real> evaluateBatch(const FuncNode& node, const VariableBatch& batch);

} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_EVALUATOR_H
