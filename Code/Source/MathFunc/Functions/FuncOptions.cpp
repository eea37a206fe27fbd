/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/FuncOptions.h"

#include "Core/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace svmf {
namespace func {

namespace {

[[nodiscard]] std::optional<int> getenvInt(const char* name)
{
    const char* v = std::getenv(name);
    if (v == nullptr) return std::nullopt;
    char* end = nullptr;
    const long out = std::strtol(v, &end, 10);
    if (end == v) return std::nullopt;
    if (out < std::numeric_limits<int>::min()) return std::nullopt;
    if (out > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(out);
}

} // namespace

const char* compileBackendName(CompileBackend backend) noexcept
{
    switch (backend) {
        case CompileBackend::Tape: return "tape";
        case CompileBackend::LLVM: return "llvm";
        case CompileBackend::Auto: return "auto";
    }
    return "unknown";
}

std::optional<CompileBackend> parseCompileBackend(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "tape") return CompileBackend::Tape;
    if (lower == "llvm" || lower == "jit") return CompileBackend::LLVM;
    if (lower == "auto") return CompileBackend::Auto;
    return std::nullopt;
}

CompileOptions defaultCompileOptions()
{
    CompileOptions options;

    if (const char* env_backend = std::getenv("SVMF_COMPILE_BACKEND")) {
        if (auto backend = parseCompileBackend(env_backend)) {
            options.backend = *backend;
            options.jit.enable = (*backend != CompileBackend::Tape);
        } else {
            SVMF_LOG_WARNING(std::string("Ignoring unknown SVMF_COMPILE_BACKEND '") + env_backend + "'");
        }
    }

    if (auto level = getenvInt("SVMF_JIT_OPT_LEVEL")) {
        options.jit.optimization_level = std::clamp(*level, 0, 3);
    }

    return options;
}

} // namespace func
} // namespace svmf
