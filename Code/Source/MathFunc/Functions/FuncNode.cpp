/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/FuncNode.h"

#include "Core/FuncException.h"

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>

namespace svmf {
namespace func {

namespace {

[[nodiscard]] Precedence binaryPrecedence(BinaryKind kind) noexcept
{
    switch (kind) {
        case BinaryKind::Add:
        case BinaryKind::Subtract:
            return Precedence::Sum;
        case BinaryKind::Multiply:
        case BinaryKind::Divide:
            return Precedence::Product;
        case BinaryKind::Power:
            return Precedence::Power;
    }
    return Precedence::Atom;
}

} // namespace

const char* binaryKindName(BinaryKind kind) noexcept
{
    switch (kind) {
        case BinaryKind::Add: return "Add";
        case BinaryKind::Subtract: return "Subtract";
        case BinaryKind::Multiply: return "Multiply";
        case BinaryKind::Divide: return "Divide";
        case BinaryKind::Power: return "Power";
    }
    return "Unknown";
}

const char* unaryKindName(UnaryKind kind) noexcept
{
    switch (kind) {
        case UnaryKind::Negate: return "Negate";
        case UnaryKind::Sqrt: return "Sqrt";
        case UnaryKind::Power: return "Power";
        case UnaryKind::Abs: return "Abs";
        case UnaryKind::Sign: return "Sign";
        case UnaryKind::Exp: return "Exp";
        case UnaryKind::Log: return "Log";
        case UnaryKind::Sin: return "Sin";
        case UnaryKind::Cos: return "Cos";
    }
    return "Unknown";
}

void appendUnique(std::vector<std::string>& dst, const std::vector<std::string>& src)
{
    for (const auto& name : src) {
        if (std::find(dst.begin(), dst.end(), name) == dst.end()) {
            dst.push_back(name);
        }
    }
}

const FuncNodePtr* CompositeTerm::find(std::string_view name) const noexcept
{
    for (const auto& [key, value] : substitutions) {
        if (key == name) return &value;
    }
    return nullptr;
}

FuncNode::FuncNode(FuncPayload payload, std::vector<std::string> free_variables, Precedence precedence)
    : payload_(std::move(payload)),
      free_variables_(std::move(free_variables)),
      precedence_(precedence)
{
}

FuncNodePtr FuncNode::makeConstant(Real value)
{
    return FuncNodePtr(new FuncNode(ConstantTerm{value}, {}, Precedence::Atom));
}

FuncNodePtr FuncNode::makeVariable(std::string name)
{
    SVMF_THROW_IF(name.empty(), InvalidArgumentException, "FuncNode::makeVariable: empty variable name");
    std::vector<std::string> vars{name};
    return FuncNodePtr(new FuncNode(VariableTerm{std::move(name)}, std::move(vars), Precedence::Atom));
}

FuncNodePtr FuncNode::makeBinary(BinaryKind kind, FuncNodePtr left, FuncNodePtr right)
{
    SVMF_CHECK_NOT_NULL(left, "FuncNode::makeBinary: left operand");
    SVMF_CHECK_NOT_NULL(right, "FuncNode::makeBinary: right operand");

    std::vector<std::string> vars = left->freeVariables();
    appendUnique(vars, right->freeVariables());
    return FuncNodePtr(new FuncNode(BinaryTerm{kind, std::move(left), std::move(right)},
                                    std::move(vars), binaryPrecedence(kind)));
}

FuncNodePtr FuncNode::makeUnary(UnaryKind kind, FuncNodePtr arg, Real exponent)
{
    SVMF_CHECK_NOT_NULL(arg, "FuncNode::makeUnary: argument");

    std::vector<std::string> vars = arg->freeVariables();
    const Real stored = (kind == UnaryKind::Power) ? exponent : 0.0;
    return FuncNodePtr(new FuncNode(UnaryTerm{kind, std::move(arg), stored},
                                    std::move(vars), Precedence::Power));
}

FuncNodePtr FuncNode::makeLinearCombination(std::vector<Real> coeffs, std::vector<FuncNodePtr> terms)
{
    SVMF_THROW_IF(coeffs.size() != terms.size(), MalformedConstructionException,
                  "LinearCombination: " + std::to_string(coeffs.size()) + " coefficients for "
                  + std::to_string(terms.size()) + " terms");
    SVMF_THROW_IF(terms.empty(), MalformedConstructionException,
                  "LinearCombination: at least one term is required");

    std::vector<std::string> vars;
    for (const auto& t : terms) {
        SVMF_CHECK_NOT_NULL(t, "LinearCombination: term");
        appendUnique(vars, t->freeVariables());
    }
    return FuncNodePtr(new FuncNode(LinearCombinationTerm{std::move(coeffs), std::move(terms)},
                                    std::move(vars), Precedence::Sum));
}

FuncNodePtr FuncNode::makeComposite(FuncNodePtr outer, NodeSubstitutions substitutions)
{
    SVMF_CHECK_NOT_NULL(outer, "FuncNode::makeComposite: outer function");
    SVMF_THROW_IF(substitutions.empty(), MalformedConstructionException,
                  "Composite: at least one substitution is required");

    CompositeTerm term{std::move(outer), std::move(substitutions)};
    for (std::size_t i = 0; i < term.substitutions.size(); ++i) {
        const auto& [name, value] = term.substitutions[i];
        SVMF_CHECK_NOT_NULL(value, "Composite: substitution for '" + name + "'");
        SVMF_THROW_IF(!term.outer->dependsOn(name), MalformedConstructionException,
                      "Composite: '" + name + "' is not a free variable of the outer function");
        for (std::size_t j = 0; j < i; ++j) {
            SVMF_THROW_IF(term.substitutions[j].first == name, MalformedConstructionException,
                          "Composite: duplicate substitution for '" + name + "'");
        }
    }

    // Substituted names are spliced in at the position of the name they replace.
    std::vector<std::string> vars;
    for (const auto& name : term.outer->freeVariables()) {
        if (const auto* replacement = term.find(name)) {
            appendUnique(vars, (*replacement)->freeVariables());
        } else if (std::find(vars.begin(), vars.end(), name) == vars.end()) {
            vars.push_back(name);
        }
    }

    Precedence prec = term.outer->precedence();
    if (const auto* v = term.outer->as<VariableTerm>()) {
        prec = (*term.find(v->name))->precedence();
    }

    return FuncNodePtr(new FuncNode(std::move(term), std::move(vars), prec));
}

bool FuncNode::dependsOn(std::string_view name) const noexcept
{
    return std::find(free_variables_.begin(), free_variables_.end(), name) != free_variables_.end();
}

std::vector<FuncNodePtr> FuncNode::children() const
{
    return std::visit([](const auto& p) -> std::vector<FuncNodePtr> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, BinaryTerm>) {
            return {p.left, p.right};
        } else if constexpr (std::is_same_v<T, UnaryTerm>) {
            return {p.arg};
        } else if constexpr (std::is_same_v<T, LinearCombinationTerm>) {
            return p.terms;
        } else if constexpr (std::is_same_v<T, CompositeTerm>) {
            std::vector<FuncNodePtr> out;
            out.reserve(p.substitutions.size() + 1u);
            for (const auto& s : p.substitutions) out.push_back(s.second);
            out.push_back(p.outer);
            return out;
        } else {
            return {};
        }
    }, payload_);
}

} // namespace func
} // namespace svmf
