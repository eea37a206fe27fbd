/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/JIT/LLVMGen.h"

#include "Core/FuncConfig.h"
#include "Core/Logger.h"

#include <bit>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if SVMF_ENABLE_LLVM_JIT
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Intrinsics.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>
#endif

namespace svmf {
namespace func {
namespace jit {

namespace {

#if SVMF_ENABLE_LLVM_JIT
[[nodiscard]] std::string sanitizeFilename(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (const char ch : s) {
        const bool ok =
            (ch >= 'a' && ch <= 'z') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch >= '0' && ch <= '9') ||
            (ch == '_' || ch == '-' || ch == '.');
        out.push_back(ok ? ch : '_');
    }
    return out;
}

void writeTextFile(const std::filesystem::path& path, std::string_view contents)
{
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        SVMF_LOG_WARNING("LLVMGen: cannot create dump directory '" + path.parent_path().string() + "'");
        return;
    }

    std::ofstream os(path, std::ios::trunc);
    if (!os.good()) {
        SVMF_LOG_WARNING("LLVMGen: cannot open '" + path.string() + "' for writing");
        return;
    }
    os.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    os.flush();
}

[[nodiscard]] std::filesystem::path dumpPath(const JITOptions& options,
                                            std::string_view symbol,
                                            std::string_view suffix)
{
    const std::filesystem::path dir =
        options.dump_directory.empty() ? std::filesystem::path("svmf_jit_dumps")
                                       : std::filesystem::path(options.dump_directory);
    return dir / (sanitizeFilename(symbol) + std::string(suffix));
}
#endif

} // namespace

LLVMGen::LLVMGen(JITOptions options)
    : options_(std::move(options))
{
}

LLVMGenResult LLVMGen::compileFunction(JITEngine& engine,
                                       const FuncIR& ir,
                                       std::string_view symbol,
                                       std::uintptr_t& out_address) const
{
    (void)engine;
    (void)ir;
    (void)symbol;
    out_address = 0;

#if !SVMF_ENABLE_LLVM_JIT
    return LLVMGenResult{.ok = false, .message = "LLVMGen: svMathFunc was built without LLVM JIT support"};
#else
    if (ir.empty() || ir.root >= ir.ops.size()) {
        return LLVMGenResult{.ok = false, .message = "LLVMGen: empty or malformed IR"};
    }

    try {
        auto ctx = std::make_unique<llvm::LLVMContext>();
        auto module = std::make_unique<llvm::Module>(std::string(symbol), *ctx);
        module->setModuleIdentifier(std::string(symbol));

        const std::string target_triple = engine.targetTriple();
        const std::string data_layout = engine.dataLayoutString();
        if (!target_triple.empty()) {
            module->setTargetTriple(target_triple);
        }
        if (!data_layout.empty()) {
            module->setDataLayout(data_layout);
        }

        llvm::IRBuilder<> builder(*ctx);
        auto* f64 = builder.getDoubleTy();
        auto* f64_ptr = llvm::PointerType::getUnqual(f64);
        auto* fn_ty = llvm::FunctionType::get(f64, {f64_ptr}, /*isVarArg=*/false);

        auto* fn = llvm::Function::Create(fn_ty,
                                          llvm::GlobalValue::ExternalLinkage,
                                          std::string(symbol),
                                          module.get());
        fn->setDoesNotThrow();

        auto* entry = llvm::BasicBlock::Create(*ctx, "entry", fn);
        builder.SetInsertPoint(entry);

        auto* args_ptr = fn->getArg(0);
        args_ptr->setName("args");

        auto f64c = [&](double v) -> llvm::Value* {
            return llvm::ConstantFP::get(f64, v);
        };

        auto* fabs_fn = llvm::Intrinsic::getDeclaration(module.get(), llvm::Intrinsic::fabs, {f64});
        auto* sqrt_fn = llvm::Intrinsic::getDeclaration(module.get(), llvm::Intrinsic::sqrt, {f64});
        auto* exp_fn = llvm::Intrinsic::getDeclaration(module.get(), llvm::Intrinsic::exp, {f64});
        auto* log_fn = llvm::Intrinsic::getDeclaration(module.get(), llvm::Intrinsic::log, {f64});
        auto* pow_fn = llvm::Intrinsic::getDeclaration(module.get(), llvm::Intrinsic::pow, {f64});
        auto* sin_fn = llvm::Intrinsic::getDeclaration(module.get(), llvm::Intrinsic::sin, {f64});
        auto* cos_fn = llvm::Intrinsic::getDeclaration(module.get(), llvm::Intrinsic::cos, {f64});

        std::vector<llvm::Value*> values(ir.ops.size(), nullptr);
        auto operand = [&](const FuncIROp& op, std::uint32_t i) -> llvm::Value* {
            return values[ir.child(op, i)];
        };

        for (std::size_t i = 0; i < ir.ops.size(); ++i) {
            const auto& op = ir.ops[i];
            llvm::Value* v = nullptr;
            switch (op.type) {
                case FuncIROpType::Constant:
                    v = f64c(std::bit_cast<double>(op.imm0));
                    break;
                case FuncIROpType::Argument: {
                    auto* gep = builder.CreateGEP(f64, args_ptr, builder.getInt64(op.imm0));
                    v = builder.CreateLoad(f64, gep);
                    break;
                }
                case FuncIROpType::Add:
                    v = builder.CreateFAdd(operand(op, 0), operand(op, 1));
                    break;
                case FuncIROpType::Subtract:
                    v = builder.CreateFSub(operand(op, 0), operand(op, 1));
                    break;
                case FuncIROpType::Multiply:
                    v = builder.CreateFMul(operand(op, 0), operand(op, 1));
                    break;
                case FuncIROpType::Divide:
                    v = builder.CreateFDiv(operand(op, 0), operand(op, 1));
                    break;
                case FuncIROpType::Power:
                    v = builder.CreateCall(pow_fn, {operand(op, 0), operand(op, 1)});
                    break;
                case FuncIROpType::Negate:
                    v = builder.CreateFNeg(operand(op, 0));
                    break;
                case FuncIROpType::Sqrt:
                    v = builder.CreateCall(sqrt_fn, {operand(op, 0)});
                    break;
                case FuncIROpType::PowConst:
                    v = builder.CreateCall(pow_fn, {operand(op, 0), f64c(std::bit_cast<double>(op.imm0))});
                    break;
                case FuncIROpType::Abs:
                    v = builder.CreateCall(fabs_fn, {operand(op, 0)});
                    break;
                case FuncIROpType::Sign: {
                    // +1 / -1 away from zero, the operand itself for +-0 and NaN
                    auto* a = operand(op, 0);
                    auto* gt0 = builder.CreateFCmpOGT(a, f64c(0.0));
                    auto* lt0 = builder.CreateFCmpOLT(a, f64c(0.0));
                    auto* neg_or_self = builder.CreateSelect(lt0, f64c(-1.0), a);
                    v = builder.CreateSelect(gt0, f64c(1.0), neg_or_self);
                    break;
                }
                case FuncIROpType::Exp:
                    v = builder.CreateCall(exp_fn, {operand(op, 0)});
                    break;
                case FuncIROpType::Log:
                    v = builder.CreateCall(log_fn, {operand(op, 0)});
                    break;
                case FuncIROpType::Sin:
                    v = builder.CreateCall(sin_fn, {operand(op, 0)});
                    break;
                case FuncIROpType::Cos:
                    v = builder.CreateCall(cos_fn, {operand(op, 0)});
                    break;
            }
            if (v == nullptr) {
                return LLVMGenResult{.ok = false,
                                     .message = std::string("LLVMGen: unsupported op ") + funcIROpName(op.type)};
            }
            values[i] = v;
        }

        builder.CreateRet(values[ir.root]);

        if (llvm::verifyModule(*module, &llvm::errs())) {
            return LLVMGenResult{.ok = false, .message = "LLVMGen: generated module failed verification"};
        }

        if (options_.dump_llvm_ir) {
            std::string ir_text;
            llvm::raw_string_ostream os(ir_text);
            module->print(os, nullptr);
            os.flush();
            writeTextFile(dumpPath(options_, symbol, ".ll"), ir_text);
            writeTextFile(dumpPath(options_, symbol, ".funcir.txt"), ir.dump());
        }

        llvm::orc::ThreadSafeModule tsm(std::move(module), std::move(ctx));
        engine.addModule(std::move(tsm));
        out_address = engine.lookup(symbol);
        return LLVMGenResult{.ok = true, .message = {}};
    } catch (const std::exception& e) {
        return LLVMGenResult{.ok = false, .message = std::string("LLVMGen: exception: ") + e.what()};
    }
#endif
}

} // namespace jit
} // namespace func
} // namespace svmf
