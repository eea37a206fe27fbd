/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_ConstantInterner.cpp
 * @brief Unit tests for ConstantInterner
 */

#include <gtest/gtest.h>

#include "Functions/ConstantInterner.h"
#include "Functions/FuncAlgebra.h"

#include <cmath>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace svmf {
namespace func {
namespace test {

TEST(ConstantInterner, EqualValuesShareOneNode)
{
    ConstantInterner interner;
    const auto a = interner.intern(2.5);
    const auto b = interner.intern(2.5);
    const auto c = interner.intern(3.5);

    EXPECT_EQ(a.get(), b.get());
    EXPECT_NE(a.get(), c.get());
    ASSERT_TRUE(a->isConstant());
    EXPECT_DOUBLE_EQ(a->as<ConstantTerm>()->value, 2.5);
    EXPECT_EQ(interner.size(), 2u);
}

TEST(ConstantInterner, KeysOnBitPattern)
{
    ConstantInterner interner;
    const auto pos = interner.intern(0.0);
    const auto neg = interner.intern(-0.0);
    EXPECT_NE(pos.get(), neg.get());
    EXPECT_TRUE(std::signbit(neg->as<ConstantTerm>()->value));

    EXPECT_EQ(interner.zero().get(), pos.get());
    EXPECT_TRUE(interner.contains(-0.0));
    EXPECT_FALSE(interner.contains(1.0));
    (void)interner.one();
    EXPECT_TRUE(interner.contains(1.0));
}

TEST(ConstantInterner, InstancesAreIsolated)
{
    ConstantInterner first;
    ConstantInterner second;
    EXPECT_NE(first.intern(7.0).get(), second.intern(7.0).get());
    EXPECT_EQ(first.size(), 1u);
    EXPECT_EQ(second.size(), 1u);
}

TEST(ConstantInterner, SharedInstanceIsProcessWide)
{
    const auto a = ConstantInterner::shared();
    const auto b = ConstantInterner::shared();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(a->intern(42.0).get(), b->intern(42.0).get());
}

TEST(ConstantInterner, FoldedResultsAreInterned)
{
    ConstantInterner interner;
    const NodeBuilder b(interner);
    const auto sum = b.add(b.constant(2.0), b.constant(4.0));
    EXPECT_EQ(sum.get(), interner.intern(6.0).get());

    const auto root = b.sqrt(b.constant(9.0));
    EXPECT_EQ(root.get(), interner.intern(3.0).get());
}

TEST(ConstantInterner, ConcurrentInterningSharesNodes)
{
    constexpr std::size_t kThreads = 8;
    constexpr std::size_t kStride = 8;
    constexpr std::size_t kPerThread = 32;
    constexpr std::size_t kValues = kStride * (kThreads - 1) + kPerThread;

    ConstantInterner interner;
    // seen[t][k] is what thread t got for value k, or null when t never asked.
    std::vector<std::vector<const FuncNode*>> seen(kThreads, std::vector<const FuncNode*>(kValues, nullptr));

    auto worker = [&](std::size_t t) {
        for (int round = 0; round < 4; ++round) {
            for (std::size_t i = 0; i < kPerThread; ++i) {
                const std::size_t k = t * kStride + (round % 2 == 0 ? i : kPerThread - 1 - i);
                seen[t][k] = interner.intern(0.25 * static_cast<Real>(k) - 3.0).get();
            }
        }
    };

    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < kThreads; ++t) threads.emplace_back(worker, t);
    for (auto& th : threads) th.join();

    EXPECT_EQ(interner.size(), kValues);
    for (std::size_t k = 0; k < kValues; ++k) {
        const FuncNode* ref = nullptr;
        for (std::size_t t = 0; t < kThreads; ++t) {
            const FuncNode* s = seen[t][k];
            if (s == nullptr) continue;
            if (ref == nullptr) ref = s;
            EXPECT_EQ(ref, s) << "value index " << k;
        }
        ASSERT_NE(ref, nullptr);
        EXPECT_EQ(ref, interner.intern(0.25 * static_cast<Real>(k) - 3.0).get());
    }
    EXPECT_EQ(interner.size(), kValues);
}

} // namespace test
} // namespace func
} // namespace svmf
