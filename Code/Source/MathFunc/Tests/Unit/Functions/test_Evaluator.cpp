/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_Evaluator.cpp
 * @brief Unit tests for tree evaluation, the per-call cache and batch evaluation
 */

#include <gtest/gtest.h>

#include "Core/FuncConfig.h"
#include "Core/FuncException.h"
#include "Functions/Composition.h"
#include "Functions/ConstantInterner.h"
#include "Functions/Evaluator.h"
#include "Functions/FuncAlgebra.h"

#include <cmath>
#include <cstddef>
#include <vector>

namespace svmf {
namespace func {
namespace test {

namespace {

class EvaluatorTest : public ::testing::Test {
protected:
    ConstantInterner interner;
    NodeBuilder b{interner};
    FuncNodePtr x = FuncNode::makeVariable("x");
    FuncNodePtr y = FuncNode::makeVariable("y");
};

} // namespace

TEST_F(EvaluatorTest, SharedSubtreeIsComputedOnce)
{
    const auto s = b.add(x, y);
    const auto f = b.multiply(s, s);

    EvaluationCache cache;
    const VariableContext ctx{{"x", 1.0}, {"y", 2.0}};
    EXPECT_DOUBLE_EQ(evaluate(*f, ctx, cache), 9.0);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 2u);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(EvaluatorTest, CacheIsResetPerCall)
{
    const auto s = b.add(x, y);
    const auto f = b.multiply(s, s);

    EvaluationCache cache;
    EXPECT_DOUBLE_EQ(evaluate(*f, {{"x", 1.0}, {"y", 2.0}}, cache), 9.0);
    // A stale entry would return 9 again.
    EXPECT_DOUBLE_EQ(evaluate(*f, {{"x", 2.0}, {"y", 2.0}}, cache), 16.0);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 2u);
}

TEST_F(EvaluatorTest, CacheDoesNotChangeResults)
{
    const auto s = b.sin(b.multiply(x, y));
    const auto f = b.linearCombination({0.5, -2.0, 1.0}, {s, b.exp(s), b.divide(s, b.add(x, b.constant(1.0)))});

    for (const Real xv : {-1.5, 0.0, 0.25, 3.0}) {
        const VariableContext ctx{{"x", xv}, {"y", 1.75}};
        EvaluationCache cache;
        const Real cached = evaluate(*f, ctx, cache);
        const Real uncached = evaluate(*f, ctx);
        EXPECT_EQ(cached, uncached) << "x=" << xv;
        EXPECT_GT(cache.hits(), 0u);
    }
}

TEST_F(EvaluatorTest, ConstantAndVariableRoots)
{
    EXPECT_DOUBLE_EQ(evaluate(*b.constant(-4.5), {}), -4.5);
    EXPECT_DOUBLE_EQ(evaluate(*x, {{"x", 8.0}}), 8.0);

    EvaluationCache cache;
    EXPECT_DOUBLE_EQ(evaluate(*x, {{"x", 8.0}}, cache), 8.0);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(EvaluatorTest, UnboundVariableNamesTheVariable)
{
    const auto f = b.add(x, y);
    try {
        (void)evaluate(*f, {{"x", 1.0}});
        FAIL() << "expected UnboundVariableException";
    } catch (const UnboundVariableException& e) {
        EXPECT_EQ(e.variable(), "y");
        EXPECT_EQ(e.status(), FuncStatus::UnboundVariable);
    }
}

TEST_F(EvaluatorTest, CompositeBindsSubstitutedNames)
{
    const auto r = FuncNode::makeVariable("r");
    // Outer x stays the caller's x; r takes the inner value.
    const auto composed = compose(b.subtract(r, x), {{"r", b.multiply(x, y)}});

    const VariableContext ctx{{"x", 3.0}, {"y", 4.0}};
    EXPECT_DOUBLE_EQ(evaluate(*composed, ctx), 9.0);

    EvaluationCache cache;
    EXPECT_DOUBLE_EQ(evaluate(*composed, ctx, cache), 9.0);

    // A caller binding for r is shadowed by the substitution.
    EXPECT_DOUBLE_EQ(evaluate(*composed, {{"x", 3.0}, {"y", 4.0}, {"r", 100.0}}), 9.0);
}

TEST_F(EvaluatorTest, IEEESemanticsArePreserved)
{
    EXPECT_TRUE(std::isinf(evaluate(*b.divide(b.constant(1.0), x), {{"x", 0.0}})));
    EXPECT_TRUE(std::isnan(evaluate(*b.sqrt(x), {{"x", -1.0}})));
    EXPECT_TRUE(std::isnan(evaluate(*b.log(x), {{"x", -1.0}})));
    EXPECT_TRUE(std::isnan(evaluate(*b.divide(x, x), {{"x", 0.0}})));
}

TEST_F(EvaluatorTest, BatchMatchesPointwise)
{
    const auto f = b.add(b.multiply(x, x), b.cos(y));

    std::vector<VariableContext> contexts;
    const std::size_t n = config::BATCH_PARALLEL_THRESHOLD + 17u;
    for (std::size_t i = 0; i < n; ++i) {
        const Real t = 0.01 * static_cast<Real>(i);
        contexts.push_back({{"x", t}, {"y", 1.0 - t}});
    }

    BatchOptions serial;
    serial.parallel = false;
    BatchOptions parallel_no_cache;
    parallel_no_cache.use_cache = false;
    parallel_no_cache.num_threads = 2;

    const auto a = evaluateBatch(*f, contexts, serial);
    const auto c = evaluateBatch(*f, contexts, parallel_no_cache);
    ASSERT_EQ(a.size(), n);
    ASSERT_EQ(c.size(), n);
    for (std::size_t i = 0; i < n; ++i) {
        const Real expected = evaluate(*f, contexts[i]);
        EXPECT_EQ(a[i], expected);
        EXPECT_EQ(c[i], expected);
    }
}

TEST_F(EvaluatorTest, BatchPropagatesUnboundVariable)
{
    const auto f = b.add(x, y);
    std::vector<VariableContext> contexts{{{"x", 1.0}, {"y", 1.0}}, {{"x", 2.0}}};
    EXPECT_THROW((void)evaluateBatch(*f, contexts), UnboundVariableException);

    const std::vector<VariableContext> none;
    EXPECT_TRUE(evaluateBatch(*f, none).empty());
}

TEST_F(EvaluatorTest, ColumnBatchMatchesPointwise)
{
    const auto s = b.add(x, y);
    const auto r = FuncNode::makeVariable("r");
    const auto f = b.linearCombination({2.0, 1.0},
                                       {b.multiply(s, s), compose(b.sqrt(r), {{"r", b.multiply(x, x)}})});

    VariableBatch batch;
    batch.setColumn("x", {0.5, 1.0, 2.0, 4.0});
    batch.setColumn("y", {1.0, -1.0, 0.0, 3.0});

    const auto values = evaluateBatch(*f, batch);
    ASSERT_EQ(values.size(), batch.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
        const Real expected = evaluate(*f, batch.contextAt(i));
        EXPECT_NEAR(values[i], expected, 1e-12 * (1.0 + std::fabs(expected))) << "point " << i;
    }

    EXPECT_THROW(batch.setColumn("z", {1.0}), InvalidArgumentException);

    VariableBatch missing;
    missing.setColumn("x", {1.0});
    EXPECT_THROW((void)evaluateBatch(*f, missing), UnboundVariableException);
}

TEST(VariableBatch, RoundTripsThroughContexts)
{
    const std::vector<VariableContext> contexts{{{"a", 1.0}, {"b", 2.0}}, {{"a", 3.0}, {"b", 4.0}}};
    const auto batch = VariableBatch::fromContexts(contexts);
    EXPECT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch.columnCount(), 2u);
    EXPECT_EQ(batch.column("b"), (std::vector<Real>{2.0, 4.0}));
    EXPECT_DOUBLE_EQ(batch.contextAt(1).at("a"), 3.0);
    EXPECT_THROW((void)batch.column("c"), UnboundVariableException);
    EXPECT_THROW((void)batch.contextAt(2), InvalidArgumentException);
}

TEST(VariableContext, LookupAndArrays)
{
    VariableContext ctx{{"x", 1.0}};
    ctx.set("y", 2.0).set("x", 5.0);
    EXPECT_EQ(ctx.size(), 2u);
    EXPECT_DOUBLE_EQ(ctx.at("x"), 5.0);
    EXPECT_FALSE(ctx.get("z").has_value());
    EXPECT_FALSE(ctx.contains("z"));
    EXPECT_THROW((void)ctx.at("z"), UnboundVariableException);
    EXPECT_EQ(ctx.names(), (std::vector<std::string>{"x", "y"}));

    const std::vector<std::string> names{"u", "v"};
    const std::vector<Real> values{1.0, 2.0, 3.0};
    const auto from = VariableContext::fromArrays(names, values);
    EXPECT_EQ(from.size(), 2u);
    EXPECT_DOUBLE_EQ(from.at("v"), 2.0);

    const std::vector<Real> too_few{1.0};
    EXPECT_THROW((void)VariableContext::fromArrays(names, too_few), InvalidArgumentException);
}

} // namespace test
} // namespace func
} // namespace svmf
