/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/MathFunc.h"

#include "Core/FuncException.h"
#include "Functions/Composition.h"
#include "Functions/Differentiation.h"
#include "Functions/ExpressionPrinter.h"
#include "Functions/FuncAlgebra.h"
#include "Functions/JIT/FuncCompiler.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace svmf {
namespace func {

namespace {

[[nodiscard]] NodeSubstitutions toNodeSubstitutions(const MathFuncMap& substitutions)
{
    NodeSubstitutions out;
    out.reserve(substitutions.size());
    for (const auto& [name, f] : substitutions) {
        SVMF_THROW_IF(!f.isValid(), InvalidArgumentException,
                      "MathFunc: substitution for '" + name + "' is an invalid function");
        out.emplace_back(name, f.nodeShared());
    }
    return out;
}

} // namespace

MathFunc::MathFunc(FuncNodePtr node, std::shared_ptr<ConstantInterner> interner)
    : node_(std::move(node)),
      interner_(interner ? std::move(interner) : ConstantInterner::shared())
{
}

MathFunc MathFunc::constant(Real value, std::shared_ptr<ConstantInterner> interner)
{
    if (!interner) {
        interner = ConstantInterner::shared();
    }
    auto node = interner->intern(value);
    return MathFunc(std::move(node), std::move(interner));
}

MathFunc MathFunc::variable(std::string name, std::shared_ptr<ConstantInterner> interner)
{
    return MathFunc(FuncNode::makeVariable(std::move(name)), std::move(interner));
}

MathFunc MathFunc::linearCombination(std::vector<Real> coeffs, const std::vector<MathFunc>& terms)
{
    std::vector<FuncNodePtr> nodes;
    nodes.reserve(terms.size());
    for (const auto& t : terms) {
        SVMF_THROW_IF(!t.isValid(), InvalidArgumentException, "MathFunc::linearCombination: invalid term");
        nodes.push_back(t.nodeShared());
    }

    auto interner = terms.empty() ? ConstantInterner::shared() : terms.front().interner();
    const NodeBuilder builder(*interner);
    return MathFunc(builder.linearCombination(std::move(coeffs), std::move(nodes)), std::move(interner));
}

MathFunc MathFunc::linearCombination(Real c1, const MathFunc& f1, Real c2, const MathFunc& f2)
{
    return linearCombination(std::vector<Real>{c1, c2}, std::vector<MathFunc>{f1, f2});
}

MathFunc MathFunc::sum(const std::vector<MathFunc>& terms)
{
    SVMF_THROW_IF(terms.empty(), MalformedConstructionException, "MathFunc::sum: at least one term is required");

    MathFunc acc = terms.front();
    (void)acc.checkedNode("MathFunc::sum");
    for (std::size_t i = 1; i < terms.size(); ++i) {
        acc = acc.add(terms[i]);
    }
    return acc;
}

// ---- Algebra ----

MathFunc MathFunc::wrap(FuncNodePtr node) const
{
    return MathFunc(std::move(node), interner_);
}

const FuncNode& MathFunc::checkedNode(const char* where) const
{
    SVMF_THROW_IF(node_ == nullptr, InvalidArgumentException, std::string(where) + ": invalid (empty) function");
    return *node_;
}

MathFunc MathFunc::add(const MathFunc& rhs) const
{
    (void)checkedNode("MathFunc::add");
    (void)rhs.checkedNode("MathFunc::add");
    return wrap(NodeBuilder(*interner_).add(node_, rhs.node_));
}

MathFunc MathFunc::add(Real rhs) const
{
    (void)checkedNode("MathFunc::add");
    const NodeBuilder b(*interner_);
    return wrap(b.add(node_, b.constant(rhs)));
}

MathFunc MathFunc::subtract(const MathFunc& rhs) const
{
    (void)checkedNode("MathFunc::subtract");
    (void)rhs.checkedNode("MathFunc::subtract");
    return wrap(NodeBuilder(*interner_).subtract(node_, rhs.node_));
}

MathFunc MathFunc::subtract(Real rhs) const
{
    (void)checkedNode("MathFunc::subtract");
    const NodeBuilder b(*interner_);
    return wrap(b.subtract(node_, b.constant(rhs)));
}

MathFunc MathFunc::multiply(const MathFunc& rhs) const
{
    (void)checkedNode("MathFunc::multiply");
    (void)rhs.checkedNode("MathFunc::multiply");
    return wrap(NodeBuilder(*interner_).multiply(node_, rhs.node_));
}

MathFunc MathFunc::multiply(Real rhs) const
{
    (void)checkedNode("MathFunc::multiply");
    const NodeBuilder b(*interner_);
    return wrap(b.multiply(node_, b.constant(rhs)));
}

MathFunc MathFunc::divide(const MathFunc& rhs) const
{
    (void)checkedNode("MathFunc::divide");
    (void)rhs.checkedNode("MathFunc::divide");
    return wrap(NodeBuilder(*interner_).divide(node_, rhs.node_));
}

MathFunc MathFunc::divide(Real rhs) const
{
    (void)checkedNode("MathFunc::divide");
    const NodeBuilder b(*interner_);
    return wrap(b.divide(node_, b.constant(rhs)));
}

MathFunc MathFunc::negate() const
{
    (void)checkedNode("MathFunc::negate");
    return wrap(NodeBuilder(*interner_).negate(node_));
}

MathFunc MathFunc::pow(Real exponent) const
{
    (void)checkedNode("MathFunc::pow");
    return wrap(NodeBuilder(*interner_).pow(node_, exponent));
}

MathFunc MathFunc::pow(const MathFunc& exponent) const
{
    (void)checkedNode("MathFunc::pow");
    (void)exponent.checkedNode("MathFunc::pow");
    return wrap(NodeBuilder(*interner_).power(node_, exponent.node_));
}

MathFunc MathFunc::sqrt() const
{
    (void)checkedNode("MathFunc::sqrt");
    return wrap(NodeBuilder(*interner_).sqrt(node_));
}

MathFunc MathFunc::abs() const
{
    (void)checkedNode("MathFunc::abs");
    return wrap(NodeBuilder(*interner_).abs(node_));
}

MathFunc MathFunc::sign() const
{
    (void)checkedNode("MathFunc::sign");
    return wrap(NodeBuilder(*interner_).sign(node_));
}

MathFunc MathFunc::exp() const
{
    (void)checkedNode("MathFunc::exp");
    return wrap(NodeBuilder(*interner_).exp(node_));
}

MathFunc MathFunc::log() const
{
    (void)checkedNode("MathFunc::log");
    return wrap(NodeBuilder(*interner_).log(node_));
}

MathFunc MathFunc::sin() const
{
    (void)checkedNode("MathFunc::sin");
    return wrap(NodeBuilder(*interner_).sin(node_));
}

MathFunc MathFunc::cos() const
{
    (void)checkedNode("MathFunc::cos");
    return wrap(NodeBuilder(*interner_).cos(node_));
}

// ---- Query ----

const std::vector<std::string>& MathFunc::freeVariableNames() const
{
    return checkedNode("MathFunc::freeVariableNames").freeVariables();
}

bool MathFunc::dependsOn(std::string_view name) const
{
    return checkedNode("MathFunc::dependsOn").dependsOn(name);
}

bool MathFunc::isConstant() const noexcept
{
    return node_ != nullptr && node_->isConstant();
}

bool MathFunc::isZero() const noexcept
{
    return isConstant() && node_->as<ConstantTerm>()->value == 0.0;
}

bool MathFunc::isInteger() const noexcept
{
    if (!isConstant()) {
        return false;
    }
    const Real v = node_->as<ConstantTerm>()->value;
    return std::floor(v) == v;
}

bool MathFunc::isReal() const noexcept
{
    return isConstant();
}

Real MathFunc::constantValue() const
{
    const auto* c = checkedNode("MathFunc::constantValue").as<ConstantTerm>();
    SVMF_THROW_IF(c == nullptr, InvalidArgumentException,
                  "MathFunc::constantValue: '" + toExpressionString() + "' is not a constant");
    return c->value;
}

// ---- Names and argument slots ----

MathFunc MathFunc::setName(std::string name) const
{
    SVMF_THROW_IF(checkedNode("MathFunc::setName").isLeaf(), UnsupportedMutationException,
                  "MathFunc::setName: constant and variable leaves are shared and cannot be renamed");
    MathFunc out = *this;
    out.name_ = std::move(name);
    return out;
}

MathFunc MathFunc::setVariableNames(const std::vector<std::string>& names) const
{
    const auto& node = checkedNode("MathFunc::setVariableNames");
    SVMF_THROW_IF(node.isLeaf(), UnsupportedMutationException,
                  "MathFunc::setVariableNames: constant and variable leaves are shared and cannot be re-scoped");

    const auto& vars = node.freeVariables();
    SVMF_THROW_IF(names.size() != vars.size(), MalformedConstructionException,
                  "MathFunc::setVariableNames: " + std::to_string(names.size()) + " names for "
                  + std::to_string(vars.size()) + " free variables");

    NodeSubstitutions renames;
    renames.reserve(vars.size());
    for (std::size_t i = 0; i < vars.size(); ++i) {
        if (vars[i] != names[i]) {
            renames.emplace_back(vars[i], FuncNode::makeVariable(names[i]));
        }
    }

    MathFunc out = *this;
    out.argument_index_.reset();
    if (!renames.empty()) {
        out.node_ = func::substitute(node_, renames, NodeBuilder(*interner_), CompositionPolicy::Merge);
    }
    return out;
}

MathFunc MathFunc::setArgumentIndex(ArgumentIndex index) const
{
    for (const auto& v : checkedNode("MathFunc::setArgumentIndex").freeVariables()) {
        SVMF_THROW_IF(index.find(v) == index.end(), MalformedConstructionException,
                      "MathFunc::setArgumentIndex: no slot for free variable '" + v + "'");
    }
    std::map<ArgIndex, std::string> owners;
    for (const auto& [name, slot] : index) {
        const auto [it, inserted] = owners.emplace(slot, name);
        SVMF_THROW_IF(!inserted, MalformedConstructionException,
                      "MathFunc::setArgumentIndex: slot " + std::to_string(slot) + " is assigned to both '"
                      + it->second + "' and '" + name + "'");
    }
    MathFunc out = *this;
    out.argument_index_ = std::move(index);
    return out;
}

std::vector<std::string> MathFunc::argumentOrder() const
{
    if (!argument_index_) {
        return freeVariableNames();
    }

    // Unused slots stay empty.
    std::size_t n = 0;
    for (const auto& [name, slot] : *argument_index_) {
        n = std::max<std::size_t>(n, static_cast<std::size_t>(slot) + 1u);
    }
    std::vector<std::string> order(n);
    for (const auto& [name, slot] : *argument_index_) {
        if (order[slot].empty()) {
            order[slot] = name;
        }
    }
    return order;
}

// ---- Evaluation ----

Real MathFunc::apply(const VariableContext& context) const
{
    return evaluate(checkedNode("MathFunc::apply"), context);
}

Real MathFunc::apply(const VariableContext& context, EvaluationCache& cache) const
{
    return evaluate(checkedNode("MathFunc::apply"), context, cache);
}

Real MathFunc::apply(std::span<const Real> args) const
{
    const auto& node = checkedNode("MathFunc::apply");

    VariableContext context;
    if (argument_index_) {
        for (const auto& v : node.freeVariables()) {
            const auto slot = static_cast<std::size_t>(argument_index_->find(v)->second);
            SVMF_THROW_IF(slot >= args.size(), InvalidArgumentException,
                          "MathFunc::apply: no argument for slot " + std::to_string(slot) + " ('" + v + "')");
            context.set(v, args[slot]);
        }
    } else {
        const auto& vars = node.freeVariables();
        SVMF_THROW_IF(args.size() < vars.size(), InvalidArgumentException,
                      "MathFunc::apply: " + std::to_string(args.size()) + " arguments for "
                      + std::to_string(vars.size()) + " free variables");
        for (std::size_t i = 0; i < vars.size(); ++i) {
            context.set(vars[i], args[i]);
        }
    }
    return evaluate(node, context);
}

std::vector<Real> MathFunc::applyBatch(const std::vector<VariableContext>& contexts,
                                       const BatchOptions& options) const
{
    return evaluateBatch(checkedNode("MathFunc::applyBatch"), contexts, options);
}

std::vector<Real> MathFunc::applyBatch(const VariableBatch& batch) const
{
    return evaluateBatch(checkedNode("MathFunc::applyBatch"), batch);
}

// ---- Calculus ----

MathFunc MathFunc::diff(std::string_view variable) const
{
    (void)checkedNode("MathFunc::diff");
    return wrap(differentiate(node_, variable, NodeBuilder(*interner_)));
}

std::vector<MathFunc> MathFunc::grad() const
{
    return grad(freeVariableNames());
}

std::vector<MathFunc> MathFunc::grad(const std::vector<std::string>& variables) const
{
    (void)checkedNode("MathFunc::grad");
    const auto partials = gradient(node_, variables, NodeBuilder(*interner_));

    std::vector<MathFunc> out;
    out.reserve(partials.size());
    for (const auto& p : partials) {
        out.push_back(wrap(p));
    }
    return out;
}

// ---- Composition ----

MathFunc MathFunc::compose(const MathFuncMap& substitutions, CompositionPolicy policy) const
{
    (void)checkedNode("MathFunc::compose");
    return wrap(func::compose(node_, toNodeSubstitutions(substitutions), policy));
}

MathFunc MathFunc::substitute(const MathFuncMap& substitutions, CompositionPolicy policy) const
{
    (void)checkedNode("MathFunc::substitute");
    return wrap(func::substitute(node_, toNodeSubstitutions(substitutions), NodeBuilder(*interner_), policy));
}

// ---- Compilation ----

std::shared_ptr<const jit::CompiledEvaluator>
MathFunc::compile(const std::vector<std::string>& variable_order, const CompileOptions& options) const
{
    (void)checkedNode("MathFunc::compile");
    return jit::FuncCompiler::getOrCreate(options)->compile(node_, variable_order);
}

std::shared_ptr<const jit::CompiledEvaluator> MathFunc::compile() const
{
    return compile(argumentOrder());
}

// ---- Printing ----

std::string MathFunc::toExpressionString() const
{
    return func::toExpressionString(checkedNode("MathFunc::toExpressionString"));
}

std::string MathFunc::toString() const
{
    const auto& node = checkedNode("MathFunc::toString");

    std::vector<std::string> arguments;
    for (auto& a : argumentOrder()) {
        if (!a.empty()) {
            arguments.push_back(std::move(a));
        }
    }
    return toFunctionString(node, name_, arguments);
}

} // namespace func
} // namespace svmf
