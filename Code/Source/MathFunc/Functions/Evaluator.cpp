/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/Evaluator.h"

#include "Core/FuncConfig.h"
#include "Core/FuncException.h"
#include "Functions/FuncAlgebra.h"

#include <cstddef>
#include <exception>
#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>

namespace svmf {
namespace func {

std::optional<Real> EvaluationCache::lookup(const FuncNode* node)
{
    auto it = values_.find(node);
    if (it == values_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second;
}

void EvaluationCache::store(const FuncNode* node, Real value)
{
    values_[node] = value;
}

void EvaluationCache::clear() noexcept
{
    values_.clear();
    hits_ = 0;
    misses_ = 0;
}

namespace {

struct TreeEvaluator {
    const VariableContext& context;
    EvaluationCache* cache{nullptr};

    [[nodiscard]] Real eval(const FuncNode& node)
    {
        if (const auto* c = node.as<ConstantTerm>()) {
            return c->value;
        }
        if (const auto* v = node.as<VariableTerm>()) {
            return context.at(v->name);
        }

        if (cache != nullptr) {
            if (auto hit = cache->lookup(&node)) {
                return *hit;
            }
        }
        const Real value = evalCompound(node);
        if (cache != nullptr) {
            cache->store(&node, value);
        }
        return value;
    }

    [[nodiscard]] Real evalCompound(const FuncNode& node)
    {
        switch (node.type()) {
            case FuncNodeType::Binary: {
                const auto& b = *node.as<BinaryTerm>();
                const Real lhs = eval(*b.left);
                const Real rhs = eval(*b.right);
                return applyBinary(b.kind, lhs, rhs);
            }
            case FuncNodeType::Unary: {
                const auto& u = *node.as<UnaryTerm>();
                return applyUnary(u.kind, eval(*u.arg), u.exponent);
            }
            case FuncNodeType::LinearCombination: {
                const auto& lc = *node.as<LinearCombinationTerm>();
                Real acc = lc.coeffs[0] * eval(*lc.terms[0]);
                for (std::size_t i = 1; i < lc.terms.size(); ++i) {
                    acc += lc.coeffs[i] * eval(*lc.terms[i]);
                }
                return acc;
            }
            case FuncNodeType::Composite: {
                const auto& comp = *node.as<CompositeTerm>();

                // Outer runs in its own variable space: unsubstituted names keep
                // their caller binding, substituted names take the inner values.
                VariableContext inner = context;
                for (const auto& [name, value] : comp.substitutions) {
                    inner.set(name, eval(*value));
                }

                if (cache == nullptr) {
                    return TreeEvaluator{inner, nullptr}.eval(*comp.outer);
                }
                EvaluationCache nested;
                return TreeEvaluator{inner, &nested}.eval(*comp.outer);
            }
            case FuncNodeType::Constant:
            case FuncNodeType::Variable:
                break;
        }
        SVMF_THROW(FuncException, "evaluate: unexpected node type");
    }
};

using Column = std::vector<Real>;

struct ColumnEvaluator {
    const VariableBatch& batch;
    std::unordered_map<const FuncNode*, Column> memo{};

    [[nodiscard]] const Column& eval(const FuncNode& node)
    {
        if (const auto* v = node.as<VariableTerm>()) {
            return batch.column(v->name);
        }
        if (auto it = memo.find(&node); it != memo.end()) {
            return it->second;
        }
        Column out = evalColumn(node);
        return memo.emplace(&node, std::move(out)).first->second;
    }

    [[nodiscard]] Column evalColumn(const FuncNode& node)
    {
        const std::size_t n = batch.size();

        switch (node.type()) {
            case FuncNodeType::Constant:
                return Column(n, node.as<ConstantTerm>()->value);

            case FuncNodeType::Binary: {
                const auto& b = *node.as<BinaryTerm>();
                const Column& lhs = eval(*b.left);
                const Column& rhs = eval(*b.right);
                Column out(n);
                for (std::size_t i = 0; i < n; ++i) {
                    out[i] = applyBinary(b.kind, lhs[i], rhs[i]);
                }
                return out;
            }
            case FuncNodeType::Unary: {
                const auto& u = *node.as<UnaryTerm>();
                const Column& arg = eval(*u.arg);
                Column out(n);
                for (std::size_t i = 0; i < n; ++i) {
                    out[i] = applyUnary(u.kind, arg[i], u.exponent);
                }
                return out;
            }
            case FuncNodeType::LinearCombination: {
                const auto& lc = *node.as<LinearCombinationTerm>();
                Column out = eval(*lc.terms[0]);
                for (auto& v : out) v *= lc.coeffs[0];
                for (std::size_t t = 1; t < lc.terms.size(); ++t) {
                    const Column& col = eval(*lc.terms[t]);
                    for (std::size_t i = 0; i < n; ++i) {
                        out[i] += lc.coeffs[t] * col[i];
                    }
                }
                return out;
            }
            case FuncNodeType::Composite: {
                const auto& comp = *node.as<CompositeTerm>();
                VariableBatch inner = batch;
                for (const auto& [name, value] : comp.substitutions) {
                    inner.setColumn(name, eval(*value));
                }
                ColumnEvaluator nested{inner};
                return nested.eval(*comp.outer);
            }
            case FuncNodeType::Variable:
                break;
        }
        SVMF_THROW(FuncException, "evaluateBatch: unexpected node type");
    }
};

} // namespace

Real evaluate(const FuncNode& node, const VariableContext& context)
{
    return TreeEvaluator{context, nullptr}.eval(node);
}

Real evaluate(const FuncNode& node, const VariableContext& context, EvaluationCache& cache)
{
    cache.clear();
    return TreeEvaluator{context, &cache}.eval(node);
}

std::vector<Real> evaluateBatch(const FuncNode& node,
                                const std::vector<VariableContext>& contexts,
                                const BatchOptions& options)
{
    const std::size_t n = contexts.size();
    std::vector<Real> out(n, 0.0);

    const auto evalOne = [&](std::size_t i) {
        if (options.use_cache) {
            EvaluationCache cache;
            out[i] = evaluate(node, contexts[i], cache);
        } else {
            out[i] = evaluate(node, contexts[i]);
        }
    };

#if SVMF_HAS_OPENMP
    if (options.parallel && n >= config::BATCH_PARALLEL_THRESHOLD) {
        std::exception_ptr first_error;
        std::mutex error_mutex;
        const int num_threads = options.num_threads > 0 ? options.num_threads : omp_get_max_threads();
        const auto count = static_cast<std::ptrdiff_t>(n);

        #pragma omp parallel for num_threads(num_threads) schedule(static)
        for (std::ptrdiff_t i = 0; i < count; ++i) {
            try {
                evalOne(static_cast<std::size_t>(i));
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }
        return out;
    }
#endif

    for (std::size_t i = 0; i < n; ++i) {
        evalOne(i);
    }
    return out;
}

std::vector<Real> evaluateBatch(const FuncNode& node, const VariableBatch& batch)
{
    ColumnEvaluator evaluator{batch};
    return evaluator.eval(node);
}

} // namespace func
} // namespace svmf
