/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/JIT/JITEngine.h"

#include "Core/FuncConfig.h"
#include "Core/FuncException.h"
#include "Core/Logger.h"
#include "Functions/JIT/LLVMJITBuildInfo.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#if SVMF_ENABLE_LLVM_JIT
#include <llvm/ExecutionEngine/ObjectCache.h>
#include <llvm/ExecutionEngine/Orc/CompileUtils.h>
#include <llvm/ExecutionEngine/Orc/Core.h>
#include <llvm/ExecutionEngine/Orc/ExecutionUtils.h>
#include <llvm/ExecutionEngine/Orc/IRCompileLayer.h>
#include <llvm/ExecutionEngine/Orc/IRTransformLayer.h>
#include <llvm/ExecutionEngine/Orc/LLJIT.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/Module.h>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/CodeGen.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/TargetSelect.h>
#endif

namespace svmf {
namespace func {
namespace jit {

namespace {

#if SVMF_ENABLE_LLVM_JIT
[[nodiscard]] int clampOptLevel(int level) noexcept
{
    return std::clamp(level, 0, 3);
}

[[nodiscard]] std::string describe(llvm::Error err)
{
    return llvm::toString(std::move(err));
}

[[nodiscard]] llvm::CodeGenOpt::Level codeGenLevel(int level) noexcept
{
    switch (clampOptLevel(level)) {
        case 0: return llvm::CodeGenOpt::None;
        case 1: return llvm::CodeGenOpt::Less;
        case 2: return llvm::CodeGenOpt::Default;
        default: return llvm::CodeGenOpt::Aggressive;
    }
}

[[nodiscard]] llvm::OptimizationLevel passLevel(int level) noexcept
{
    switch (clampOptLevel(level)) {
        case 0: return llvm::OptimizationLevel::O0;
        case 1: return llvm::OptimizationLevel::O1;
        case 2: return llvm::OptimizationLevel::O2;
        default: return llvm::OptimizationLevel::O3;
    }
}

/**
 * @brief Object files on disk, one per module identifier and code generation setting
 *
 * A file is written under a temporary name and renamed into place, so
 * processes sharing the directory only ever read complete objects.
 */
class DiskObjectCache final : public llvm::ObjectCache {
public:
    DiskObjectCache(std::filesystem::path directory, std::string settings)
        : directory_(std::move(directory)), settings_(std::move(settings))
    {
    }

    DiskObjectCache(const DiskObjectCache&) = delete;
    DiskObjectCache& operator=(const DiskObjectCache&) = delete;

    void notifyObjectCompiled(const llvm::Module* module, llvm::MemoryBufferRef object) override
    {
        if (module == nullptr) {
            return;
        }

        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            SVMF_LOG_WARNING("LLVM JIT: object cache directory '" + directory_.string() + "' is unusable: " +
                             ec.message());
            return;
        }

        const auto path = pathFor(*module);
        if (std::filesystem::exists(path, ec)) {
            return;
        }

        auto staging = path;
        staging += ".tmp" + std::to_string(stagingId());
        {
            std::ofstream os(staging, std::ios::binary | std::ios::trunc);
            os.write(object.getBufferStart(), static_cast<std::streamsize>(object.getBufferSize()));
            if (!os) {
                os.close();
                std::filesystem::remove(staging, ec);
                return;
            }
        }

        std::filesystem::rename(staging, path, ec);
        if (ec) {
            std::filesystem::remove(staging, ec);
            return;
        }
        stored_.fetch_add(1u, std::memory_order_relaxed);
    }

    [[nodiscard]] std::unique_ptr<llvm::MemoryBuffer> getObject(const llvm::Module* module) override
    {
        if (module == nullptr) {
            return nullptr;
        }

        auto buffer = llvm::MemoryBuffer::getFile(pathFor(*module).string(), /*IsText=*/false);
        if (!buffer) {
            misses_.fetch_add(1u, std::memory_order_relaxed);
            return nullptr;
        }
        loaded_.fetch_add(1u, std::memory_order_relaxed);
        return std::move(*buffer);
    }

    [[nodiscard]] JITObjectCacheStats stats() const noexcept
    {
        JITObjectCacheStats s;
        s.stored = stored_.load(std::memory_order_relaxed);
        s.loaded = loaded_.load(std::memory_order_relaxed);
        s.misses = misses_.load(std::memory_order_relaxed);
        return s;
    }

private:
    [[nodiscard]] std::filesystem::path pathFor(const llvm::Module& module) const
    {
        std::string name = module.getModuleIdentifier() + "." + settings_;
        std::replace_if(name.begin(), name.end(),
                        [](char c) { return !(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.'); },
                        '_');
        return directory_ / (name + ".o");
    }

    [[nodiscard]] std::uint64_t stagingId()
    {
        const auto now = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
        return now ^ (staging_counter_.fetch_add(1u, std::memory_order_relaxed) << 48);
    }

    std::filesystem::path directory_;
    std::string settings_;
    std::atomic<std::uint64_t> stored_{0};
    std::atomic<std::uint64_t> loaded_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> staging_counter_{0};
};

void initializeNativeTarget()
{
    static std::once_flag once;
    std::call_once(once, []() {
        SVMF_THROW_IF(llvm::InitializeNativeTarget(), BackendException,
                      "LLVM JIT: native target is not available");
        SVMF_THROW_IF(llvm::InitializeNativeTargetAsmPrinter(), BackendException,
                      "LLVM JIT: native asm printer is not available");
        SVMF_THROW_IF(llvm::InitializeNativeTargetAsmParser(), BackendException,
                      "LLVM JIT: native asm parser is not available");
    });
}

/// Default new-pass-manager pipeline at `level`
void optimizeModule(llvm::Module& module, llvm::OptimizationLevel level, bool vectorize)
{
    llvm::PipelineTuningOptions tuning;
    tuning.LoopVectorization = vectorize;
    tuning.SLPVectorization = vectorize;

    llvm::LoopAnalysisManager lam;
    llvm::FunctionAnalysisManager fam;
    llvm::CGSCCAnalysisManager cgam;
    llvm::ModuleAnalysisManager mam;

    llvm::PassBuilder passes(nullptr, tuning);
    passes.registerModuleAnalyses(mam);
    passes.registerCGSCCAnalyses(cgam);
    passes.registerFunctionAnalyses(fam);
    passes.registerLoopAnalyses(lam);
    passes.crossRegisterProxies(lam, fam, cgam, mam);

    passes.buildPerModuleDefaultPipeline(level).run(module, mam);
}

// LLVM 14 sets the object cache on the IR compiler, not on the layer.
[[nodiscard]] bool attachObjectCache(llvm::orc::LLJIT& jit, llvm::ObjectCache& cache)
{
    auto& compiler = jit.getIRCompileLayer().getCompiler();
    if (auto* concurrent = dynamic_cast<llvm::orc::ConcurrentIRCompiler*>(&compiler)) {
        concurrent->setObjectCache(&cache);
        return true;
    }
    if (auto* simple = dynamic_cast<llvm::orc::SimpleCompiler*>(&compiler)) {
        simple->setObjectCache(&cache);
        return true;
    }
    return false;
}
#endif

} // namespace

struct JITEngine::Impl {
#if SVMF_ENABLE_LLVM_JIT
    explicit Impl(const JITOptions& opts)
        : options(opts)
    {
    }

    void start();

    JITOptions options;
    std::unique_ptr<DiskObjectCache> object_cache{};    // outlives the JIT that points at it
    std::unique_ptr<llvm::orc::LLJIT> jit{};
    std::string target_triple{};
    std::string data_layout{};
#endif
};

#if SVMF_ENABLE_LLVM_JIT
void JITEngine::Impl::start()
{
    const int opt_level = clampOptLevel(options.optimization_level);

    auto host = llvm::orc::JITTargetMachineBuilder::detectHost();
    SVMF_THROW_IF(!host, BackendException, "LLVM JIT: cannot describe the host target: " + describe(host.takeError()));
    host->setCodeGenOptLevel(codeGenLevel(opt_level));
    target_triple = host->getTargetTriple().str();

    llvm::orc::LLJITBuilder builder;
    builder.setJITTargetMachineBuilder(std::move(*host));
    auto created = builder.create();
    SVMF_THROW_IF(!created, BackendException, "LLVM JIT: cannot create LLJIT: " + describe(created.takeError()));
    jit = std::move(*created);
    data_layout = jit->getDataLayout().getStringRepresentation();

    // Intrinsics may lower to libm calls (pow, sin, ...) resolved in this process.
    auto process = llvm::orc::DynamicLibrarySearchGenerator::GetForCurrentProcess(
        jit->getDataLayout().getGlobalPrefix());
    SVMF_THROW_IF(!process, BackendException,
                  "LLVM JIT: cannot search process symbols: " + describe(process.takeError()));
    jit->getMainJITDylib().addGenerator(std::move(*process));

    if (opt_level > 0) {
        const llvm::OptimizationLevel level = passLevel(opt_level);
        const bool vectorize = options.vectorize;
        jit->getIRTransformLayer().setTransform(
            [level, vectorize](llvm::orc::ThreadSafeModule tsm, llvm::orc::MaterializationResponsibility&)
                -> llvm::Expected<llvm::orc::ThreadSafeModule> {
                tsm.withModuleDo([&](llvm::Module& module) { optimizeModule(module, level, vectorize); });
                return std::move(tsm);
            });
    }

    if (!options.cache_directory.empty()) {
        const std::string settings = target_triple + "-O" + std::to_string(opt_level) + (options.vectorize ? "v" : "");
        object_cache = std::make_unique<DiskObjectCache>(options.cache_directory, settings);
        if (!attachObjectCache(*jit, *object_cache)) {
            SVMF_LOG_WARNING("LLVM JIT: the IR compiler takes no object cache; '" + options.cache_directory +
                             "' is not used");
            object_cache.reset();
        }
    }
}
#endif

std::unique_ptr<JITEngine> JITEngine::create(const JITOptions& options)
{
#if SVMF_ENABLE_LLVM_JIT
    try {
        initializeNativeTarget();

        auto impl = std::make_unique<Impl>(options);
        impl->start();

        SVMF_LOG_INFO("LLVM JIT: ready (LLVM " + llvmVersionString() + ", " + impl->target_triple + ", O" +
                      std::to_string(clampOptLevel(options.optimization_level)) +
                      (impl->object_cache ? ", objects in " + options.cache_directory : std::string()) + ")");

        auto engine = std::unique_ptr<JITEngine>(new JITEngine());
        engine->impl_ = std::move(impl);
        return engine;
    } catch (const std::exception& e) {
        SVMF_LOG_WARNING(std::string("LLVM JIT: engine unavailable: ") + e.what());
        return {};
    }
#else
    (void)options;
    return {};
#endif
}

JITEngine::~JITEngine() = default;

bool JITEngine::available() const noexcept
{
    return impl_ != nullptr;
}

void JITEngine::addModule(llvm::orc::ThreadSafeModule&& module)
{
#if SVMF_ENABLE_LLVM_JIT
    std::lock_guard<std::mutex> lock(mutex_);
    SVMF_THROW_IF(impl_ == nullptr, BackendException, "JITEngine::addModule: engine is not available");

    if (auto err = impl_->jit->addIRModule(std::move(module))) {
        SVMF_THROW(BackendException, "JITEngine::addModule: " + describe(std::move(err)));
    }
#else
    (void)module;
    SVMF_THROW(BackendException, "JITEngine::addModule: svMathFunc was built without LLVM JIT support");
#endif
}

JITEngine::SymbolAddress JITEngine::lookup(std::string_view name)
{
#if SVMF_ENABLE_LLVM_JIT
    std::lock_guard<std::mutex> lock(mutex_);
    SVMF_THROW_IF(impl_ == nullptr, BackendException, "JITEngine::lookup: engine is not available");

    auto symbol = impl_->jit->lookup(llvm::StringRef(name.data(), name.size()));
    SVMF_THROW_IF(!symbol, BackendException,
                  "JITEngine::lookup: '" + std::string(name) + "': " + describe(symbol.takeError()));
    return static_cast<SymbolAddress>(symbol->getAddress());
#else
    (void)name;
    SVMF_THROW(BackendException, "JITEngine::lookup: svMathFunc was built without LLVM JIT support");
#endif
}

std::string JITEngine::targetTriple() const
{
#if SVMF_ENABLE_LLVM_JIT
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_ ? impl_->target_triple : std::string();
#else
    return {};
#endif
}

std::string JITEngine::dataLayoutString() const
{
#if SVMF_ENABLE_LLVM_JIT
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_ ? impl_->data_layout : std::string();
#else
    return {};
#endif
}

JITObjectCacheStats JITEngine::objectCacheStats() const
{
#if SVMF_ENABLE_LLVM_JIT
    std::lock_guard<std::mutex> lock(mutex_);
    if (impl_ && impl_->object_cache) {
        return impl_->object_cache->stats();
    }
#endif
    return {};
}

} // namespace jit
} // namespace func
} // namespace svmf
