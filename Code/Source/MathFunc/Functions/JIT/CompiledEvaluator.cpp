/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/JIT/CompiledEvaluator.h"

#include "Core/FuncConfig.h"
#include "Core/FuncException.h"
#include "Functions/FuncAlgebra.h"
#include "Functions/JIT/JITEngine.h"

#include <array>
#include <bit>
#include <cmath>
#include <utility>

namespace svmf {
namespace func {
namespace jit {

std::shared_ptr<const CompiledEvaluator>
CompiledEvaluator::fromTape(const FuncIR& ir, std::vector<std::string> variable_order)
{
    SVMF_THROW_IF(ir.empty(), InvalidArgumentException, "CompiledEvaluator::fromTape: empty IR");
    SVMF_THROW_IF(ir.root >= ir.ops.size(), InvalidArgumentException,
                  "CompiledEvaluator::fromTape: IR root out of range");

    auto out = std::shared_ptr<CompiledEvaluator>(new CompiledEvaluator());
    out->backend_ = CompileBackend::Tape;
    out->setVariableOrder(std::move(variable_order));
    out->ir_hash_ = ir.stableHash64();
    out->root_ = ir.root;

    out->tape_.reserve(ir.ops.size());
    for (const auto& op : ir.ops) {
        TapeInstruction ins;
        ins.opcode = op.type;
        switch (op.type) {
            case FuncIROpType::Constant:
                ins.imm = std::bit_cast<Real>(op.imm0);
                break;
            case FuncIROpType::Argument:
                ins.a = static_cast<std::uint32_t>(op.imm0);
                SVMF_THROW_IF(ins.a >= out->variable_order_.size(), InvalidArgumentException,
                              "CompiledEvaluator::fromTape: argument slot out of range");
                break;
            case FuncIROpType::PowConst:
                ins.a = ir.child(op, 0);
                ins.imm = std::bit_cast<Real>(op.imm0);
                break;
            default:
                ins.a = ir.child(op, 0);
                if (op.child_count > 1u) {
                    ins.b = ir.child(op, 1);
                }
                break;
        }
        out->tape_.push_back(ins);
    }
    return out;
}

std::shared_ptr<const CompiledEvaluator>
CompiledEvaluator::fromNative(NativeFunction function,
                              std::shared_ptr<JITEngine> engine,
                              std::uint64_t ir_hash,
                              std::vector<std::string> variable_order)
{
    SVMF_CHECK_NOT_NULL(function, "CompiledEvaluator::fromNative: function");
    SVMF_CHECK_NOT_NULL(engine, "CompiledEvaluator::fromNative: engine");

    auto out = std::shared_ptr<CompiledEvaluator>(new CompiledEvaluator());
    out->backend_ = CompileBackend::LLVM;
    out->setVariableOrder(std::move(variable_order));
    out->ir_hash_ = ir_hash;
    out->native_ = function;
    out->engine_ = std::move(engine);
    return out;
}

void CompiledEvaluator::setVariableOrder(std::vector<std::string> order)
{
    variable_order_ = std::move(order);
    argument_index_.clear();
    for (std::size_t i = 0; i < variable_order_.size(); ++i) {
        argument_index_.emplace(variable_order_[i], static_cast<ArgIndex>(i));
    }
}

Real CompiledEvaluator::runTape(const Real* SVMF_RESTRICT args, Real* SVMF_RESTRICT regs) const noexcept
{
    const std::size_t n = tape_.size();
    for (std::size_t i = 0; i < n; ++i) {
        const auto& ins = tape_[i];
        switch (ins.opcode) {
            case FuncIROpType::Constant: regs[i] = ins.imm; break;
            case FuncIROpType::Argument: regs[i] = args[ins.a]; break;
            case FuncIROpType::Add: regs[i] = regs[ins.a] + regs[ins.b]; break;
            case FuncIROpType::Subtract: regs[i] = regs[ins.a] - regs[ins.b]; break;
            case FuncIROpType::Multiply: regs[i] = regs[ins.a] * regs[ins.b]; break;
            case FuncIROpType::Divide: regs[i] = regs[ins.a] / regs[ins.b]; break;
            case FuncIROpType::Power: regs[i] = std::pow(regs[ins.a], regs[ins.b]); break;
            case FuncIROpType::Negate: regs[i] = -regs[ins.a]; break;
            case FuncIROpType::Sqrt: regs[i] = std::sqrt(regs[ins.a]); break;
            case FuncIROpType::PowConst: regs[i] = std::pow(regs[ins.a], ins.imm); break;
            case FuncIROpType::Abs: regs[i] = std::fabs(regs[ins.a]); break;
            case FuncIROpType::Sign: regs[i] = signOf(regs[ins.a]); break;
            case FuncIROpType::Exp: regs[i] = std::exp(regs[ins.a]); break;
            case FuncIROpType::Log: regs[i] = std::log(regs[ins.a]); break;
            case FuncIROpType::Sin: regs[i] = std::sin(regs[ins.a]); break;
            case FuncIROpType::Cos: regs[i] = std::cos(regs[ins.a]); break;
        }
    }
    return regs[root_];
}

Real CompiledEvaluator::evaluate(std::span<const Real> args) const
{
    SVMF_THROW_IF(args.size() < variable_order_.size(), InvalidArgumentException,
                  "CompiledEvaluator::evaluate: " + std::to_string(args.size()) + " arguments for "
                  + std::to_string(variable_order_.size()) + " variables");

    if (native_ != nullptr) {
        return native_(args.data());
    }

    if (SVMF_LIKELY(tape_.size() <= config::TAPE_STACK_REGISTERS)) {
        std::array<Real, config::TAPE_STACK_REGISTERS> regs;
        return runTape(args.data(), regs.data());
    }

    thread_local std::vector<Real> workspace;
    if (workspace.size() < tape_.size()) {
        workspace.resize(tape_.size());
    }
    return runTape(args.data(), workspace.data());
}

Real CompiledEvaluator::evaluateWith(std::span<const Real> args, std::span<Real> workspace) const
{
    SVMF_THROW_IF(args.size() < variable_order_.size(), InvalidArgumentException,
                  "CompiledEvaluator::evaluateWith: " + std::to_string(args.size()) + " arguments for "
                  + std::to_string(variable_order_.size()) + " variables");

    if (native_ != nullptr) {
        return native_(args.data());
    }

    SVMF_THROW_IF(workspace.size() < tape_.size(), InvalidArgumentException,
                  "CompiledEvaluator::evaluateWith: workspace holds " + std::to_string(workspace.size())
                  + " registers, tape needs " + std::to_string(tape_.size()));
    return runTape(args.data(), workspace.data());
}

void CompiledEvaluator::evaluateBatch(std::span<const Real> points, std::span<Real> out) const
{
    const std::size_t stride = variable_order_.size();
    SVMF_THROW_IF(points.size() != out.size() * stride, InvalidArgumentException,
                  "CompiledEvaluator::evaluateBatch: " + std::to_string(points.size())
                  + " values do not form " + std::to_string(out.size()) + " points of "
                  + std::to_string(stride) + " arguments");

    if (native_ != nullptr) {
        for (std::size_t i = 0; i < out.size(); ++i) {
            out[i] = native_(points.data() + i * stride);
        }
        return;
    }

    std::vector<Real> regs(tape_.size());
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = runTape(points.data() + i * stride, regs.data());
    }
}

} // namespace jit
} // namespace func
} // namespace svmf
