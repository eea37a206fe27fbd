/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef SVMF_FUNC_CONSTANT_INTERNER_H
#define SVMF_FUNC_CONSTANT_INTERNER_H

/**
 * @file ConstantInterner.h
 * @brief Shares one Constant node per distinct floating-point value
 */

#include "Functions/FuncNode.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace svmf {
namespace func {

/**
 * @brief Thread-safe cache of Constant nodes keyed by value
 *
 * Values are keyed on their IEEE bit pattern, so 0.0 and -0.0 map to
 * different nodes and every NaN payload is its own entry. Nodes obtained from
 * the same interner may be compared by identity.
 *
 * Entries live as long as the interner. Most callers use shared(); tests and
 * callers minting many distinct literals can own an isolated instance and
 * drop it when done.
 */
class ConstantInterner {
public:
    ConstantInterner() = default;

    ConstantInterner(const ConstantInterner&) = delete;
    ConstantInterner& operator=(const ConstantInterner&) = delete;

    /**
     * @brief Return the unique Constant node for `value`, creating it on first use
     */
    [[nodiscard]] FuncNodePtr intern(Real value);

    [[nodiscard]] FuncNodePtr zero() { return intern(0.0); }
    [[nodiscard]] FuncNodePtr one() { return intern(1.0); }

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool contains(Real value) const;

    /**
     * @brief Default interner used when no explicit instance is supplied
     */
    [[nodiscard]] static std::shared_ptr<ConstantInterner> shared();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, FuncNodePtr> constants_;
};

} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_CONSTANT_INTERNER_H
