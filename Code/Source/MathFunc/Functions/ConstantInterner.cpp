/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/ConstantInterner.h"

#include <bit>

namespace svmf {
namespace func {

FuncNodePtr ConstantInterner::intern(Real value)
{
    const auto key = std::bit_cast<std::uint64_t>(value);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = constants_.find(key);
    if (it != constants_.end()) {
        return it->second;
    }
    auto node = FuncNode::makeConstant(value);
    constants_.emplace(key, node);
    return node;
}

std::size_t ConstantInterner::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return constants_.size();
}

bool ConstantInterner::contains(Real value) const
{
    const auto key = std::bit_cast<std::uint64_t>(value);
    std::lock_guard<std::mutex> lock(mutex_);
    return constants_.count(key) != 0u;
}

std::shared_ptr<ConstantInterner> ConstantInterner::shared()
{
    static const std::shared_ptr<ConstantInterner> instance = std::make_shared<ConstantInterner>();
    return instance;
}

} // namespace func
} // namespace svmf
