/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/JIT/FuncCompiler.h"

#include "Core/FuncConfig.h"
#include "Core/FuncException.h"
#include "Core/Logger.h"
#include "Functions/JIT/FuncIR.h"
#include "Functions/JIT/LLVMGen.h"

#include <cstdio>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <utility>

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

[[nodiscard]] std::uint64_t hashString(std::string_view s) noexcept
{
    std::uint64_t h = kFNVOffset;
    for (const char c : s) {
        hashMix(h, static_cast<std::uint64_t>(static_cast<unsigned char>(c)));
    }
    return h;
}

[[nodiscard]] std::string toHex(std::uint64_t v)
{
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(v));
    return std::string(buf);
}

struct CacheKey {
    const FuncNode* node{nullptr};
    std::vector<std::string> variable_order{};

    bool operator==(const CacheKey& other) const noexcept
    {
        return node == other.node && variable_order == other.variable_order;
    }
};

struct CacheKeyHash {
    std::size_t operator()(const CacheKey& k) const noexcept
    {
        std::uint64_t h = kFNVOffset;
        hashMix(h, static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(k.node)));
        hashMix(h, static_cast<std::uint64_t>(k.variable_order.size()));
        for (const auto& name : k.variable_order) {
            hashMix(h, hashString(name));
        }
        return static_cast<std::size_t>(h);
    }
};

struct CacheEntry {
    std::weak_ptr<const FuncNode> node{};
    std::shared_ptr<const CompiledEvaluator> evaluator{};
    std::uint64_t last_use{0};
};

/// Native code already defined in the engine, with the IR it was generated from
struct NativeKernel {
    std::string ir_text{};
    std::uintptr_t address{0};     ///< 0 when code generation failed
};

[[nodiscard]] bool wantsNative(CompileBackend backend) noexcept
{
    return backend == CompileBackend::LLVM || backend == CompileBackend::Auto;
}

} // namespace

struct FuncCompiler::Impl {
    explicit Impl(CompileOptions options_in)
        : options(std::move(options_in))
    {
        if (wantsNative(options.backend)) {
            options.jit.enable = true;
        }
    }

    CompileOptions options{};

    mutable std::mutex mutex{};
    std::shared_ptr<JITEngine> engine{};
    bool engine_attempted{false};

    std::unordered_map<CacheKey, CacheEntry, CacheKeyHash> cache{};
    std::uint64_t use_clock{0};
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
    std::uint64_t native_compiles{0};
    std::uint64_t kernel_reuses{0};
    std::uint64_t tape_fallbacks{0};

    // Every symbol defined in the engine, by IR hash. Survives clear(), since
    // the engine cannot drop code that evaluators may still call.
    std::unordered_map<std::uint64_t, std::vector<NativeKernel>> kernels{};

    /// Engine on first use; nullptr when the LLVM back end is unavailable
    JITEngine* engineLocked()
    {
        if (!engine_attempted) {
            engine_attempted = true;
            engine = std::shared_ptr<JITEngine>(JITEngine::create(options.jit));
        }
        return engine.get();
    }

    void makeRoomLocked()
    {
        if (cache.size() < config::COMPILE_CACHE_CAPACITY) {
            return;
        }

        for (auto it = cache.begin(); it != cache.end();) {
            if (it->second.node.expired()) {
                it = cache.erase(it);
                ++evictions;
            } else {
                ++it;
            }
        }

        while (cache.size() >= config::COMPILE_CACHE_CAPACITY && !cache.empty()) {
            auto oldest = cache.begin();
            for (auto it = cache.begin(); it != cache.end(); ++it) {
                if (it->second.last_use < oldest->second.last_use) {
                    oldest = it;
                }
            }
            cache.erase(oldest);
            ++evictions;
        }
    }

    std::shared_ptr<const CompiledEvaluator> build(const FuncIR& ir,
                                                   const std::vector<std::string>& variable_order)
    {
        if (wantsNative(options.backend)) {
            JITEngine* jit_engine = engineLocked();
            if (jit_engine == nullptr) {
                ++tape_fallbacks;
                if (options.backend == CompileBackend::LLVM) {
                    SVMF_LOG_WARNING("FuncCompiler: LLVM back end unavailable; using the tape interpreter");
                }
                return CompiledEvaluator::fromTape(ir, variable_order);
            }

            const std::uint64_t ir_hash = ir.stableHash64();
            std::string ir_text = ir.dump();
            auto& defined = kernels[ir_hash];

            if (options.jit.cache_kernels) {
                for (const auto& kernel : defined) {
                    if (kernel.address != 0 && kernel.ir_text == ir_text) {
                        ++kernel_reuses;
                        return CompiledEvaluator::fromNative(
                            reinterpret_cast<CompiledEvaluator::NativeFunction>(kernel.address),
                            engine, ir_hash, variable_order);
                    }
                }
            }

            // The first kernel for a hash is named by the hash alone, so the
            // same function has the same module identifier in every process.
            std::string symbol = "svmf_func_" + toHex(ir_hash);
            if (!defined.empty()) {
                symbol += "_" + std::to_string(defined.size());
            }

            std::uintptr_t address = 0;
            const LLVMGen gen(options.jit);
            const auto result = gen.compileFunction(*jit_engine, ir, symbol, address);
            defined.push_back(NativeKernel{std::move(ir_text), result.ok ? address : 0});
            if (result.ok && address != 0) {
                ++native_compiles;
                return CompiledEvaluator::fromNative(reinterpret_cast<CompiledEvaluator::NativeFunction>(address),
                                                     engine, ir_hash, variable_order);
            }

            ++tape_fallbacks;
            SVMF_LOG_WARNING("FuncCompiler: native compilation failed (" + result.message +
                             "); using the tape interpreter");
        }
        return CompiledEvaluator::fromTape(ir, variable_order);
    }
};

FuncCompiler::FuncCompiler(CompileOptions options)
    : impl_(std::make_unique<Impl>(std::move(options)))
{
}

FuncCompiler::~FuncCompiler() = default;

std::shared_ptr<FuncCompiler> FuncCompiler::getOrCreate(const CompileOptions& options)
{
    struct CompilerKey {
        CompileBackend backend{CompileBackend::Tape};
        bool cse{true};
        bool fold_constants{true};
        bool cache_compiled{true};
        int optimization_level{2};
        bool vectorize{true};
        bool cache_kernels{true};
        std::string cache_directory{};
        bool dump_llvm_ir{false};
        std::string dump_directory{};

        bool operator==(const CompilerKey& other) const noexcept
        {
            return backend == other.backend &&
                   cse == other.cse &&
                   fold_constants == other.fold_constants &&
                   cache_compiled == other.cache_compiled &&
                   optimization_level == other.optimization_level &&
                   vectorize == other.vectorize &&
                   cache_kernels == other.cache_kernels &&
                   cache_directory == other.cache_directory &&
                   dump_llvm_ir == other.dump_llvm_ir &&
                   dump_directory == other.dump_directory;
        }
    };

    struct CompilerKeyHash {
        std::size_t operator()(const CompilerKey& k) const noexcept
        {
            std::uint64_t h = kFNVOffset;
            hashMix(h, static_cast<std::uint64_t>(k.backend));
            hashMix(h, static_cast<std::uint64_t>(k.cse ? 1u : 0u));
            hashMix(h, static_cast<std::uint64_t>(k.fold_constants ? 1u : 0u));
            hashMix(h, static_cast<std::uint64_t>(k.cache_compiled ? 1u : 0u));
            hashMix(h, static_cast<std::uint64_t>(static_cast<std::int64_t>(k.optimization_level)));
            hashMix(h, static_cast<std::uint64_t>(k.vectorize ? 1u : 0u));
            hashMix(h, static_cast<std::uint64_t>(k.cache_kernels ? 1u : 0u));
            hashMix(h, hashString(k.cache_directory));
            hashMix(h, static_cast<std::uint64_t>(k.dump_llvm_ir ? 1u : 0u));
            hashMix(h, hashString(k.dump_directory));
            return static_cast<std::size_t>(h);
        }
    };

    static std::mutex registry_mutex;
    static std::unordered_map<CompilerKey, std::shared_ptr<FuncCompiler>, CompilerKeyHash> registry;

    CompilerKey key;
    key.backend = options.backend;
    key.cse = options.cse;
    key.fold_constants = options.fold_constants;
    key.cache_compiled = options.cache_compiled;
    key.optimization_level = options.jit.optimization_level;
    key.vectorize = options.jit.vectorize;
    key.cache_kernels = options.jit.cache_kernels;
    key.cache_directory = options.jit.cache_directory;
    key.dump_llvm_ir = options.jit.dump_llvm_ir;
    key.dump_directory = options.jit.dump_directory;

    std::lock_guard<std::mutex> lock(registry_mutex);
    if (auto it = registry.find(key); it != registry.end()) {
        return it->second;
    }

    auto compiler = std::shared_ptr<FuncCompiler>(new FuncCompiler(options));
    registry[key] = compiler;
    return compiler;
}

std::shared_ptr<const CompiledEvaluator>
FuncCompiler::compile(const FuncNodePtr& node, const std::vector<std::string>& variable_order)
{
    SVMF_CHECK_NOT_NULL(node, "FuncCompiler::compile: node");

    std::lock_guard<std::mutex> lock(impl_->mutex);

    CacheKey key{node.get(), variable_order};
    if (impl_->options.cache_compiled) {
        if (auto it = impl_->cache.find(key); it != impl_->cache.end()) {
            if (it->second.node.lock() == node) {
                ++impl_->hits;
                it->second.last_use = ++impl_->use_clock;
                return it->second.evaluator;
            }
            // Node freed and its address reused
            impl_->cache.erase(it);
            ++impl_->evictions;
        }
    }
    ++impl_->misses;

    Timer timer;
    timer.start();

    FuncIRBuildOptions ir_options;
    ir_options.cse = impl_->options.cse;
    ir_options.fold_constants = impl_->options.fold_constants;
    const FuncIR ir = lowerToFuncIR(*node, variable_order, ir_options);

    auto evaluator = impl_->build(ir, variable_order);

    timer.stop();
    SVMF_LOG_DEBUG("FuncCompiler: compiled " + std::to_string(ir.opCount()) + " ops for " +
                   std::to_string(variable_order.size()) + " arguments with the " +
                   compileBackendName(evaluator->backend()) + " back end in " +
                   std::to_string(timer.elapsed()) + "s");

    if (impl_->options.cache_compiled) {
        impl_->makeRoomLocked();
        CacheEntry entry;
        entry.node = node;
        entry.evaluator = evaluator;
        entry.last_use = ++impl_->use_clock;
        impl_->cache[std::move(key)] = std::move(entry);
    }
    return evaluator;
}

const CompileOptions& FuncCompiler::options() const noexcept
{
    return impl_->options;
}

bool FuncCompiler::nativeAvailable() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!wantsNative(impl_->options.backend)) {
        return false;
    }
    return impl_->engineLocked() != nullptr;
}

FuncCompileCacheStats FuncCompiler::cacheStats() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    FuncCompileCacheStats s;
    s.hits = impl_->hits;
    s.misses = impl_->misses;
    s.evictions = impl_->evictions;
    s.entries = static_cast<std::uint64_t>(impl_->cache.size());
    s.native_compiles = impl_->native_compiles;
    s.kernel_reuses = impl_->kernel_reuses;
    s.tape_fallbacks = impl_->tape_fallbacks;
    if (impl_->engine) {
        s.object = impl_->engine->objectCacheStats();
    }
    return s;
}

void FuncCompiler::clear()
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->cache.clear();
    impl_->hits = 0;
    impl_->misses = 0;
    impl_->evictions = 0;
}

} // namespace jit
} // namespace func
} // namespace svmf
