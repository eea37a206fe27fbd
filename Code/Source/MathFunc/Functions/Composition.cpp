/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/Composition.h"

#include "Core/FuncException.h"

#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace svmf {
namespace func {

namespace {

using SubstitutionMap = std::map<std::string, FuncNodePtr, std::less<>>;

class Substituter {
public:
    Substituter(const NodeBuilder& builder, SubstitutionMap map)
        : builder_(builder), map_(std::move(map))
    {
    }

    [[nodiscard]] FuncNodePtr rebuild(const FuncNodePtr& node)
    {
        if (!touches(*node)) {
            return node;
        }
        if (auto it = memo_.find(node.get()); it != memo_.end()) {
            return it->second;
        }
        FuncNodePtr out = rebuildCompound(node);
        memo_.emplace(node.get(), out);
        return out;
    }

private:
    [[nodiscard]] bool touches(const FuncNode& node) const
    {
        for (const auto& name : node.freeVariables()) {
            if (map_.find(name) != map_.end()) return true;
        }
        return false;
    }

    [[nodiscard]] FuncNodePtr rebuildCompound(const FuncNodePtr& node)
    {
        switch (node->type()) {
            case FuncNodeType::Variable:
                return map_.find(node->as<VariableTerm>()->name)->second;

            case FuncNodeType::Binary: {
                const auto& b = *node->as<BinaryTerm>();
                auto lhs = rebuild(b.left);
                auto rhs = rebuild(b.right);
                return builder_.binary(b.kind, lhs, rhs);
            }
            case FuncNodeType::Unary: {
                const auto& u = *node->as<UnaryTerm>();
                return builder_.unary(u.kind, rebuild(u.arg), u.exponent);
            }
            case FuncNodeType::LinearCombination: {
                const auto& lc = *node->as<LinearCombinationTerm>();
                std::vector<FuncNodePtr> terms;
                terms.reserve(lc.terms.size());
                for (const auto& t : lc.terms) {
                    terms.push_back(rebuild(t));
                }
                return builder_.linearCombination(lc.coeffs, std::move(terms));
            }
            case FuncNodeType::Composite: {
                // Expand: outer variables map to the rebuilt inner trees, and
                // outer variables left free pick up this substitution directly.
                const auto& comp = *node->as<CompositeTerm>();
                SubstitutionMap expanded;
                for (const auto& [name, value] : comp.substitutions) {
                    expanded.emplace(name, rebuild(value));
                }
                for (const auto& name : comp.outer->freeVariables()) {
                    if (expanded.find(name) != expanded.end()) continue;
                    if (auto it = map_.find(name); it != map_.end()) {
                        expanded.emplace(name, it->second);
                    }
                }
                return Substituter(builder_, std::move(expanded)).rebuild(comp.outer);
            }
            case FuncNodeType::Constant:
                break;
        }
        return node;
    }

    const NodeBuilder& builder_;
    SubstitutionMap map_;
    std::unordered_map<const FuncNode*, FuncNodePtr> memo_{};
};

} // namespace

NodeSubstitutions activeSubstitutions(const FuncNode& outer,
                                      const NodeSubstitutions& substitutions,
                                      CompositionPolicy policy)
{
    NodeSubstitutions active;
    for (const auto& name : outer.freeVariables()) {
        for (const auto& [key, value] : substitutions) {
            if (key != name) continue;
            SVMF_CHECK_NOT_NULL(value, "compose: substitution for '" + key + "'");
            active.emplace_back(key, value);
            break;
        }
    }

    if (policy == CompositionPolicy::RejectCollisions) {
        const auto isReplaced = [&](const std::string& name) {
            for (const auto& s : active) {
                if (s.first == name) return true;
            }
            return false;
        };
        for (const auto& [key, value] : active) {
            for (const auto& name : value->freeVariables()) {
                SVMF_THROW_IF(outer.dependsOn(name) && !isReplaced(name), MalformedConstructionException,
                              "compose: substitution for '" + key + "' reintroduces free variable '"
                              + name + "' of the outer function");
            }
        }
    }
    return active;
}

FuncNodePtr compose(const FuncNodePtr& outer,
                    const NodeSubstitutions& substitutions,
                    CompositionPolicy policy)
{
    SVMF_CHECK_NOT_NULL(outer, "compose: outer function");
    auto active = activeSubstitutions(*outer, substitutions, policy);
    if (active.empty()) {
        return outer;
    }
    return FuncNode::makeComposite(outer, std::move(active));
}

FuncNodePtr substitute(const FuncNodePtr& node,
                       const NodeSubstitutions& substitutions,
                       const NodeBuilder& builder,
                       CompositionPolicy policy)
{
    SVMF_CHECK_NOT_NULL(node, "substitute: function");
    auto active = activeSubstitutions(*node, substitutions, policy);
    if (active.empty()) {
        return node;
    }

    SubstitutionMap map;
    for (auto& [name, value] : active) {
        map.emplace(name, std::move(value));
    }
    return Substituter(builder, std::move(map)).rebuild(node);
}

} // namespace func
} // namespace svmf
