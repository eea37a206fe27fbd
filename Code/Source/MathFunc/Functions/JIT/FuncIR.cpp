/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/JIT/FuncIR.h"

#include "Core/FuncException.h"
#include "Functions/FuncAlgebra.h"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace svmf {
namespace func {
namespace jit {

namespace {

constexpr std::uint64_t kFNVOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFNVPrime = 1099511628211ULL;

inline void hashMix(std::uint64_t& h, std::uint64_t v) noexcept
{
    h ^= v;
    h *= kFNVPrime;
}

[[nodiscard]] bool isCommutative(FuncIROpType t) noexcept
{
    return t == FuncIROpType::Add || t == FuncIROpType::Multiply;
}

[[nodiscard]] FuncIROpType opTypeFor(BinaryKind kind) noexcept
{
    switch (kind) {
        case BinaryKind::Add: return FuncIROpType::Add;
        case BinaryKind::Subtract: return FuncIROpType::Subtract;
        case BinaryKind::Multiply: return FuncIROpType::Multiply;
        case BinaryKind::Divide: return FuncIROpType::Divide;
        case BinaryKind::Power: return FuncIROpType::Power;
    }
    return FuncIROpType::Add;
}

[[nodiscard]] FuncIROpType opTypeFor(UnaryKind kind) noexcept
{
    switch (kind) {
        case UnaryKind::Negate: return FuncIROpType::Negate;
        case UnaryKind::Sqrt: return FuncIROpType::Sqrt;
        case UnaryKind::Power: return FuncIROpType::PowConst;
        case UnaryKind::Abs: return FuncIROpType::Abs;
        case UnaryKind::Sign: return FuncIROpType::Sign;
        case UnaryKind::Exp: return FuncIROpType::Exp;
        case UnaryKind::Log: return FuncIROpType::Log;
        case UnaryKind::Sin: return FuncIROpType::Sin;
        case UnaryKind::Cos: return FuncIROpType::Cos;
    }
    return FuncIROpType::Negate;
}

[[nodiscard]] std::optional<BinaryKind> binaryKindFor(FuncIROpType t) noexcept
{
    switch (t) {
        case FuncIROpType::Add: return BinaryKind::Add;
        case FuncIROpType::Subtract: return BinaryKind::Subtract;
        case FuncIROpType::Multiply: return BinaryKind::Multiply;
        case FuncIROpType::Divide: return BinaryKind::Divide;
        case FuncIROpType::Power: return BinaryKind::Power;
        default: return std::nullopt;
    }
}

[[nodiscard]] std::optional<UnaryKind> unaryKindFor(FuncIROpType t) noexcept
{
    switch (t) {
        case FuncIROpType::Negate: return UnaryKind::Negate;
        case FuncIROpType::Sqrt: return UnaryKind::Sqrt;
        case FuncIROpType::PowConst: return UnaryKind::Power;
        case FuncIROpType::Abs: return UnaryKind::Abs;
        case FuncIROpType::Sign: return UnaryKind::Sign;
        case FuncIROpType::Exp: return UnaryKind::Exp;
        case FuncIROpType::Log: return UnaryKind::Log;
        case FuncIROpType::Sin: return UnaryKind::Sin;
        case FuncIROpType::Cos: return UnaryKind::Cos;
        default: return std::nullopt;
    }
}

[[nodiscard]] std::uint64_t realBits(Real v) noexcept
{
    return std::bit_cast<std::uint64_t>(v);
}

[[nodiscard]] Real bitsReal(std::uint64_t bits) noexcept
{
    return std::bit_cast<Real>(bits);
}

struct Builder {
    FuncIRBuildOptions options{};

    std::vector<FuncIROp> ops{};
    std::vector<std::uint32_t> children{};

    // hash -> candidate op indices (collision-resolved by structural equality).
    std::unordered_map<std::uint64_t, std::vector<std::uint32_t>> hash_to_ops{};

    [[nodiscard]] std::uint64_t opHash(FuncIROpType type,
                                       std::uint64_t imm0,
                                       std::uint64_t imm1,
                                       std::span<const std::uint32_t> kids) const noexcept
    {
        std::uint64_t h = kFNVOffset;
        hashMix(h, static_cast<std::uint64_t>(type));
        hashMix(h, imm0);
        hashMix(h, imm1);
        hashMix(h, static_cast<std::uint64_t>(kids.size()));
        for (const auto k : kids) {
            hashMix(h, static_cast<std::uint64_t>(k));
        }
        return h;
    }

    [[nodiscard]] bool opEquals(std::uint32_t idx,
                                FuncIROpType type,
                                std::uint64_t imm0,
                                std::uint64_t imm1,
                                std::span<const std::uint32_t> kids) const noexcept
    {
        if (idx >= ops.size()) return false;
        const auto& op = ops[idx];
        if (op.type != type || op.imm0 != imm0 || op.imm1 != imm1) return false;
        if (op.child_count != kids.size()) return false;
        for (std::size_t i = 0; i < kids.size(); ++i) {
            if (children[static_cast<std::size_t>(op.first_child) + i] != kids[i]) return false;
        }
        return true;
    }

    [[nodiscard]] std::optional<Real> constantOf(std::uint32_t idx) const noexcept
    {
        const auto& op = ops[idx];
        if (op.type != FuncIROpType::Constant) return std::nullopt;
        return bitsReal(op.imm0);
    }

    [[nodiscard]] std::uint32_t constant(Real value)
    {
        return emitRaw(FuncIROpType::Constant, realBits(value), 0u, {});
    }

    [[nodiscard]] std::uint32_t argument(std::uint32_t slot)
    {
        return emitRaw(FuncIROpType::Argument, slot, 0u, {});
    }

    [[nodiscard]] std::uint32_t binary(FuncIROpType type, std::uint32_t a, std::uint32_t b)
    {
        if (options.fold_constants) {
            const auto ca = constantOf(a);
            const auto cb = constantOf(b);
            if (ca && cb) {
                return constant(applyBinary(*binaryKindFor(type), *ca, *cb));
            }
        }
        std::uint32_t kids[2] = {a, b};
        if (options.canonicalize_commutative && isCommutative(type) && kids[0] > kids[1]) {
            std::swap(kids[0], kids[1]);
        }
        return emitRaw(type, 0u, 0u, kids);
    }

    [[nodiscard]] std::uint32_t unary(FuncIROpType type, std::uint32_t a, Real exponent)
    {
        const std::uint64_t imm0 = (type == FuncIROpType::PowConst) ? realBits(exponent) : 0u;
        if (options.fold_constants) {
            if (const auto ca = constantOf(a)) {
                return constant(applyUnary(*unaryKindFor(type), *ca, exponent));
            }
        }
        const std::uint32_t kids[1] = {a};
        return emitRaw(type, imm0, 0u, kids);
    }

    [[nodiscard]] std::uint32_t emitRaw(FuncIROpType type,
                                        std::uint64_t imm0,
                                        std::uint64_t imm1,
                                        std::span<const std::uint32_t> kids)
    {
        const std::uint64_t h = opHash(type, imm0, imm1, kids);
        if (options.cse) {
            if (auto it = hash_to_ops.find(h); it != hash_to_ops.end()) {
                for (const auto cand : it->second) {
                    if (opEquals(cand, type, imm0, imm1, kids)) {
                        return cand;
                    }
                }
            }
        }

        const auto first = static_cast<std::uint32_t>(children.size());
        children.insert(children.end(), kids.begin(), kids.end());

        const auto idx = static_cast<std::uint32_t>(ops.size());
        ops.push_back(FuncIROp{
            .type = type,
            .first_child = first,
            .child_count = static_cast<std::uint32_t>(kids.size()),
            .imm0 = imm0,
            .imm1 = imm1,
        });

        hash_to_ops[h].push_back(idx);
        return idx;
    }
};

using NameBindings = std::map<std::string, std::uint32_t, std::less<>>;

/**
 * @brief Lowers one variable scope; Composite nodes open a nested scope
 */
struct ScopeLowerer {
    Builder& builder;
    const NameBindings& bindings;
    std::unordered_map<const FuncNode*, std::uint32_t> memo{};

    [[nodiscard]] std::uint32_t lower(const FuncNode& node)
    {
        if (auto it = memo.find(&node); it != memo.end()) {
            return it->second;
        }
        const std::uint32_t idx = lowerNode(node);
        memo.emplace(&node, idx);
        return idx;
    }

    [[nodiscard]] std::uint32_t lowerNode(const FuncNode& node)
    {
        switch (node.type()) {
            case FuncNodeType::Constant:
                return builder.constant(node.as<ConstantTerm>()->value);

            case FuncNodeType::Variable: {
                const auto& name = node.as<VariableTerm>()->name;
                auto it = bindings.find(name);
                SVMF_THROW_IF(it == bindings.end(), MalformedConstructionException,
                              "compile: variable order is missing free variable '" + name + "'");
                return it->second;
            }

            case FuncNodeType::Binary: {
                const auto& b = *node.as<BinaryTerm>();
                const auto lhs = lower(*b.left);
                const auto rhs = lower(*b.right);
                return builder.binary(opTypeFor(b.kind), lhs, rhs);
            }

            case FuncNodeType::Unary: {
                const auto& u = *node.as<UnaryTerm>();
                return builder.unary(opTypeFor(u.kind), lower(*u.arg), u.exponent);
            }

            case FuncNodeType::LinearCombination: {
                // c0*t0 + c1*t1 + ..., accumulated left to right like the tree evaluator.
                const auto& lc = *node.as<LinearCombinationTerm>();
                std::uint32_t acc = 0;
                for (std::size_t i = 0; i < lc.terms.size(); ++i) {
                    const auto coeff = builder.constant(lc.coeffs[i]);
                    const auto term = builder.binary(FuncIROpType::Multiply, coeff, lower(*lc.terms[i]));
                    acc = (i == 0u) ? term : builder.binary(FuncIROpType::Add, acc, term);
                }
                return acc;
            }

            case FuncNodeType::Composite: {
                const auto& comp = *node.as<CompositeTerm>();
                NameBindings inner = bindings;
                for (const auto& [name, value] : comp.substitutions) {
                    inner.insert_or_assign(name, lower(*value));
                }
                ScopeLowerer nested{builder, inner};
                return nested.lower(*comp.outer);
            }
        }
        SVMF_THROW(FuncException, "lowerToFuncIR: unexpected node type");
    }
};

} // namespace

const char* funcIROpName(FuncIROpType type) noexcept
{
    switch (type) {
        case FuncIROpType::Constant: return "Constant";
        case FuncIROpType::Argument: return "Argument";
        case FuncIROpType::Add: return "Add";
        case FuncIROpType::Subtract: return "Subtract";
        case FuncIROpType::Multiply: return "Multiply";
        case FuncIROpType::Divide: return "Divide";
        case FuncIROpType::Power: return "Power";
        case FuncIROpType::Negate: return "Negate";
        case FuncIROpType::Sqrt: return "Sqrt";
        case FuncIROpType::PowConst: return "PowConst";
        case FuncIROpType::Abs: return "Abs";
        case FuncIROpType::Sign: return "Sign";
        case FuncIROpType::Exp: return "Exp";
        case FuncIROpType::Log: return "Log";
        case FuncIROpType::Sin: return "Sin";
        case FuncIROpType::Cos: return "Cos";
    }
    return "Unknown";
}

std::uint64_t FuncIR::stableHash64() const
{
    if (ops.empty()) {
        return 0;
    }
    SVMF_THROW_IF(root >= ops.size(), InvalidArgumentException, "FuncIR::stableHash64: root index out of range");

    // Structural hash per op (children < parent due to post-order lowering).
    std::vector<std::uint64_t> op_hash(ops.size(), 0);

    for (std::size_t i = 0; i < ops.size(); ++i) {
        const auto& op = ops[i];

        std::uint64_t h = kFNVOffset;
        hashMix(h, 0x4649525f5631ULL); // "FIR_V1" tag
        hashMix(h, static_cast<std::uint64_t>(op.type));
        hashMix(h, op.imm0);
        hashMix(h, op.imm1);
        hashMix(h, static_cast<std::uint64_t>(op.child_count));

        if (op.child_count == 2u && isCommutative(op.type)) {
            const auto a_idx = child(op, 0);
            const auto b_idx = child(op, 1);
            SVMF_THROW_IF(a_idx >= i || b_idx >= i, FuncException, "FuncIR::stableHash64: non-topological child index");
            hashMix(h, std::min(op_hash[a_idx], op_hash[b_idx]));
            hashMix(h, std::max(op_hash[a_idx], op_hash[b_idx]));
        } else {
            for (std::uint32_t c = 0; c < op.child_count; ++c) {
                const auto child_idx = child(op, c);
                SVMF_THROW_IF(child_idx >= i, FuncException, "FuncIR::stableHash64: non-topological child index");
                hashMix(h, op_hash[child_idx]);
            }
        }

        op_hash[i] = h;
    }

    std::uint64_t h = op_hash[root];
    hashMix(h, static_cast<std::uint64_t>(argument_count));
    return h;
}

std::string FuncIR::dump() const
{
    std::ostringstream oss;
    oss << "FuncIR: " << ops.size() << " ops, " << argument_count << " arguments, root %" << root << "\n";
    for (std::size_t i = 0; i < ops.size(); ++i) {
        const auto& op = ops[i];
        oss << "  %" << i << " = " << funcIROpName(op.type);
        switch (op.type) {
            case FuncIROpType::Constant:
                oss << " " << bitsReal(op.imm0);
                break;
            case FuncIROpType::Argument:
                oss << " [" << op.imm0 << "]";
                break;
            case FuncIROpType::PowConst:
                oss << " %" << child(op, 0) << ", " << bitsReal(op.imm0);
                break;
            default:
                for (std::uint32_t c = 0; c < op.child_count; ++c) {
                    oss << (c == 0u ? " %" : ", %") << child(op, c);
                }
                break;
        }
        oss << "\n";
    }
    return oss.str();
}

FuncIR lowerToFuncIR(const FuncNode& root,
                     const std::vector<std::string>& variable_order,
                     const FuncIRBuildOptions& options)
{
    NameBindings slots;
    for (std::size_t i = 0; i < variable_order.size(); ++i) {
        slots.emplace(variable_order[i], static_cast<std::uint32_t>(i));
    }
    for (const auto& name : root.freeVariables()) {
        SVMF_THROW_IF(slots.find(name) == slots.end(), MalformedConstructionException,
                      "compile: variable order is missing free variable '" + name + "'");
    }

    Builder b;
    b.options = options;

    // Only variables the tree uses get an Argument op.
    NameBindings bindings;
    for (const auto& name : root.freeVariables()) {
        bindings.emplace(name, b.argument(slots.find(name)->second));
    }

    ScopeLowerer top{b, bindings};
    const auto root_idx = top.lower(root);

    FuncIR ir;
    ir.ops = std::move(b.ops);
    ir.children = std::move(b.children);
    ir.root = root_idx;
    ir.argument_count = static_cast<std::uint32_t>(variable_order.size());
    return ir;
}

} // namespace jit
} // namespace func
} // namespace svmf
