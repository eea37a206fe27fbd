/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/ExpressionPrinter.h"

#include <charconv>
#include <functional>
#include <map>
#include <utility>

namespace svmf {
namespace func {

namespace {

struct Printed {
    std::string text;
    int level;
    bool negative_literal{false};   ///< Needs parentheses wherever a leading minus would bind to an operator
};

using Environment = std::map<std::string, Printed, std::less<>>;

[[nodiscard]] std::string formatNumber(Real value)
{
    // Shortest text that reads back to the same double.
    char buf[32];
    const auto result = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, result.ptr);
}

[[nodiscard]] const char* functionName(UnaryKind kind) noexcept
{
    switch (kind) {
        case UnaryKind::Sqrt: return "sqrt";
        case UnaryKind::Abs: return "abs";
        case UnaryKind::Sign: return "sign";
        case UnaryKind::Exp: return "exp";
        case UnaryKind::Log: return "log";
        case UnaryKind::Sin: return "sin";
        case UnaryKind::Cos: return "cos";
        case UnaryKind::Negate:
        case UnaryKind::Power:
            break;
    }
    return "";
}

[[nodiscard]] std::string group(const Printed& child, bool wrap)
{
    return wrap ? "(" + child.text + ")" : child.text;
}

[[nodiscard]] std::string operand(const Printed& child, bool wrap)
{
    return group(child, wrap || child.negative_literal);
}

class Printer {
public:
    explicit Printer(const Environment& env) : env_(env) {}

    [[nodiscard]] Printed print(const FuncNode& node) const
    {
        const int level = precedenceLevel(node.precedence());

        switch (node.type()) {
            case FuncNodeType::Constant: {
                const Real value = node.as<ConstantTerm>()->value;
                return {formatNumber(value), level, value < 0.0};
            }
            case FuncNodeType::Variable: {
                const auto& name = node.as<VariableTerm>()->name;
                if (auto it = env_.find(name); it != env_.end()) {
                    return it->second;
                }
                return {name, level};
            }
            case FuncNodeType::Binary: {
                const auto& b = *node.as<BinaryTerm>();
                const Printed lhs = print(*b.left);
                const Printed rhs = print(*b.right);
                switch (b.kind) {
                    // A sum may start with a bare negative literal.
                    case BinaryKind::Add:
                        return {group(lhs, lhs.level > level) + " + " + operand(rhs, rhs.level > level), level};
                    case BinaryKind::Subtract:
                        return {group(lhs, lhs.level > level) + " - " + operand(rhs, rhs.level >= level), level};
                    case BinaryKind::Multiply:
                        return {operand(lhs, lhs.level > level) + "*" + operand(rhs, rhs.level > level), level};
                    case BinaryKind::Divide:
                        return {operand(lhs, lhs.level > level) + "/" + operand(rhs, rhs.level >= level), level};
                    case BinaryKind::Power:
                        return {operand(lhs, lhs.level >= level) + "^" + operand(rhs, rhs.level >= level), level};
                }
                break;
            }
            case FuncNodeType::Unary: {
                const auto& u = *node.as<UnaryTerm>();
                const Printed arg = print(*u.arg);
                if (u.kind == UnaryKind::Negate) {
                    return {"-" + operand(arg, arg.level > level), level};
                }
                if (u.kind == UnaryKind::Power) {
                    const Printed exponent{formatNumber(u.exponent), 0, u.exponent < 0.0};
                    return {operand(arg, arg.level >= level) + "^" + operand(exponent, false), level};
                }
                // The call parentheses already group the argument.
                return {std::string(functionName(u.kind)) + "(" + arg.text + ")", precedenceLevel(Precedence::Atom)};
            }
            case FuncNodeType::LinearCombination: {
                const auto& lc = *node.as<LinearCombinationTerm>();
                const int product = precedenceLevel(Precedence::Product);
                std::string text;
                for (std::size_t i = 0; i < lc.terms.size(); ++i) {
                    const Printed term = print(*lc.terms[i]);
                    Real c = lc.coeffs[i];
                    if (i > 0) {
                        text += (c < 0.0) ? " - " : " + ";
                        if (c < 0.0) c = -c;
                    } else if (c < 0.0) {
                        text += "-";
                        c = -c;
                    }
                    text += formatNumber(c) + "*" + operand(term, term.level > product);
                }
                return {text, level};
            }
            case FuncNodeType::Composite: {
                const auto& comp = *node.as<CompositeTerm>();
                Environment inner = env_;
                for (const auto& [name, value] : comp.substitutions) {
                    inner.insert_or_assign(name, print(*value));
                }
                return Printer(inner).print(*comp.outer);
            }
        }
        return {"?", 0};
    }

private:
    const Environment& env_;
};

} // namespace

std::string toExpressionString(const FuncNode& node)
{
    const Environment empty;
    return Printer(empty).print(node).text;
}

std::string toFunctionString(const FuncNode& node,
                             const std::string& name,
                             const std::vector<std::string>& arguments)
{
    std::string out = name + "(";
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) out += ", ";
        out += arguments[i];
    }
    out += ") = ";
    out += toExpressionString(node);
    return out;
}

} // namespace func
} // namespace svmf
