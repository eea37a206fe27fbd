/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/JIT/LLVMJITBuildInfo.h"

#include "Core/FuncConfig.h"

#include <string>

#if SVMF_ENABLE_LLVM_JIT
#include <llvm/Config/llvm-config.h>
#endif

namespace svmf {
namespace func {
namespace jit {

bool llvmJITEnabled() noexcept
{
    return SVMF_ENABLE_LLVM_JIT != 0;
}

std::string llvmVersionString()
{
#if SVMF_ENABLE_LLVM_JIT
    return LLVM_VERSION_STRING;
#else
    return {};
#endif
}

} // namespace jit
} // namespace func
} // namespace svmf
