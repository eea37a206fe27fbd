/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/Differentiation.h"

#include "Core/FuncException.h"
#include "Functions/Composition.h"

#include <string>
#include <unordered_map>
#include <utility>

namespace svmf {
namespace func {

namespace {

class Differentiator {
public:
    Differentiator(const NodeBuilder& builder, std::string_view variable)
        : b_(builder), variable_(variable)
    {
    }

    [[nodiscard]] FuncNodePtr diff(const FuncNodePtr& node)
    {
        if (!node->dependsOn(variable_)) {
            return b_.zero();
        }
        if (auto it = memo_.find(node.get()); it != memo_.end()) {
            return it->second;
        }
        FuncNodePtr d = diffDependent(node);
        memo_.emplace(node.get(), d);
        return d;
    }

private:
    [[nodiscard]] FuncNodePtr diffDependent(const FuncNodePtr& node)
    {
        switch (node->type()) {
            case FuncNodeType::Variable:
                // dependsOn() already established the name matches.
                return b_.one();
            case FuncNodeType::Binary:
                return diffBinary(*node->as<BinaryTerm>(), node);
            case FuncNodeType::Unary:
                return diffUnary(*node->as<UnaryTerm>(), node);
            case FuncNodeType::LinearCombination: {
                const auto& lc = *node->as<LinearCombinationTerm>();
                std::vector<FuncNodePtr> terms;
                terms.reserve(lc.terms.size());
                for (const auto& t : lc.terms) {
                    terms.push_back(diff(t));
                }
                return b_.linearCombination(lc.coeffs, std::move(terms));
            }
            case FuncNodeType::Composite:
                return diffComposite(*node->as<CompositeTerm>());
            case FuncNodeType::Constant:
                break;
        }
        return b_.zero();
    }

    [[nodiscard]] FuncNodePtr diffBinary(const BinaryTerm& t, const FuncNodePtr& self)
    {
        const auto& f = t.left;
        const auto& g = t.right;
        switch (t.kind) {
            case BinaryKind::Add:
                return b_.add(diff(f), diff(g));
            case BinaryKind::Subtract:
                return b_.subtract(diff(f), diff(g));
            case BinaryKind::Multiply:
                return b_.add(b_.multiply(diff(f), g), b_.multiply(f, diff(g)));
            case BinaryKind::Divide:
                return b_.divide(b_.subtract(b_.multiply(diff(f), g), b_.multiply(f, diff(g))),
                                 b_.multiply(g, g));
            case BinaryKind::Power: {
                // d(f^g) = f^g * (g' log f + g f'/f)
                auto inner = b_.add(b_.multiply(diff(g), b_.log(f)),
                                    b_.divide(b_.multiply(g, diff(f)), f));
                return b_.multiply(self, inner);
            }
        }
        return b_.zero();
    }

    [[nodiscard]] FuncNodePtr diffUnary(const UnaryTerm& t, const FuncNodePtr& self)
    {
        const auto& f = t.arg;
        switch (t.kind) {
            case UnaryKind::Negate:
                return b_.negate(diff(f));
            case UnaryKind::Sqrt:
                return b_.multiply(b_.multiply(b_.constant(0.5), b_.pow(f, -0.5)), diff(f));
            case UnaryKind::Power:
                if (t.exponent == 0.0) {
                    return b_.zero();
                }
                return b_.multiply(b_.multiply(b_.constant(t.exponent), b_.pow(f, t.exponent - 1.0)), diff(f));
            case UnaryKind::Abs:
                return b_.multiply(b_.sign(f), diff(f));
            case UnaryKind::Sign:
                return b_.zero();
            case UnaryKind::Exp:
                return b_.multiply(self, diff(f));
            case UnaryKind::Log:
                return b_.divide(diff(f), f);
            case UnaryKind::Sin:
                return b_.multiply(b_.cos(f), diff(f));
            case UnaryKind::Cos:
                return b_.multiply(b_.negate(b_.sin(f)), diff(f));
        }
        return b_.zero();
    }

    [[nodiscard]] FuncNodePtr diffComposite(const CompositeTerm& c)
    {
        FuncNodePtr total{};
        const auto accumulate = [&](FuncNodePtr term) {
            total = total ? b_.add(total, term) : std::move(term);
        };

        for (const auto& [name, inner] : c.substitutions) {
            if (!inner->dependsOn(variable_)) continue;
            auto d_outer = Differentiator(b_, name).diff(c.outer);
            accumulate(b_.multiply(compose(d_outer, c.substitutions), diff(inner)));
        }

        if (c.find(variable_) == nullptr && c.outer->dependsOn(variable_)) {
            auto d_outer = Differentiator(b_, variable_).diff(c.outer);
            accumulate(compose(d_outer, c.substitutions));
        }

        return total ? total : b_.zero();
    }

    const NodeBuilder& b_;
    std::string variable_;
    std::unordered_map<const FuncNode*, FuncNodePtr> memo_{};
};

} // namespace

FuncNodePtr differentiate(const FuncNodePtr& node, std::string_view variable, const NodeBuilder& builder)
{
    SVMF_CHECK_NOT_NULL(node, "differentiate: function");
    SVMF_CHECK_ARG(!variable.empty(), "differentiate: empty variable name");
    return Differentiator(builder, variable).diff(node);
}

std::vector<FuncNodePtr> gradient(const FuncNodePtr& node,
                                  const std::vector<std::string>& variables,
                                  const NodeBuilder& builder)
{
    std::vector<FuncNodePtr> out;
    out.reserve(variables.size());
    for (const auto& v : variables) {
        out.push_back(differentiate(node, v, builder));
    }
    return out;
}

} // namespace func
} // namespace svmf
