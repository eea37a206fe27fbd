/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_CompiledEvaluator.cpp
 * @brief Unit tests for the register-tape evaluator
 */

#include <gtest/gtest.h>

#include "Core/FuncConfig.h"
#include "Core/FuncException.h"
#include "Functions/ConstantInterner.h"
#include "Functions/Evaluator.h"
#include "Functions/FuncAlgebra.h"
#include "Functions/JIT/CompiledEvaluator.h"
#include "Functions/JIT/FuncIR.h"
#include "Tests/Unit/Functions/JITTestHelpers.h"

#include <cmath>
#include <string>
#include <vector>

namespace svmf {
namespace func {
namespace test {

namespace {

class CompiledEvaluatorTest : public ::testing::Test {
protected:
    ConstantInterner interner;
    NodeBuilder b{interner};
    FuncNodePtr x = FuncNode::makeVariable("x");
    FuncNodePtr y = FuncNode::makeVariable("y");
    FuncNodePtr z = FuncNode::makeVariable("z");

    [[nodiscard]] std::shared_ptr<const jit::CompiledEvaluator>
    tape(const FuncNodePtr& f, const std::vector<std::string>& order) const
    {
        return jit::CompiledEvaluator::fromTape(jit::lowerToFuncIR(*f, order), order);
    }

    /// Every operator once, over positive arguments
    [[nodiscard]] FuncNodePtr everything() const
    {
        const auto s = b.add(x, b.multiply(y, z));
        return b.linearCombination(
            {1.0, 0.5, -2.0, 1.5},
            {b.divide(b.sqrt(s), b.subtract(b.exp(b.negate(x)), b.constant(3.0))),
             b.power(y, b.log(s)),
             b.multiply(b.sin(z), b.cos(b.pow(x, 2.5))),
             b.add(b.abs(b.subtract(x, y)), b.sign(b.subtract(z, x)))});
    }
};

} // namespace

TEST_F(CompiledEvaluatorTest, TapeMatchesTreeEvaluation)
{
    const std::vector<std::string> order{"x", "y", "z"};
    const auto f = everything();
    const auto ev = tape(f, order);
    EXPECT_EQ(ev->backend(), CompileBackend::Tape);
    EXPECT_EQ(ev->argumentCount(), 3u);

    for (const auto& pt : positiveSamplePoints(order.size())) {
        const Real expected = evaluate(*f, contextFrom(order, pt));
        EXPECT_NEAR(ev->evaluate(pt), expected, 1e-12 * (1.0 + std::fabs(expected)));
    }
}

TEST_F(CompiledEvaluatorTest, ArgumentSlotsFollowTheGivenOrder)
{
    const auto f = b.subtract(x, y);
    const auto xy = tape(f, {"x", "y"});
    const auto yx = tape(f, {"y", "x"});

    const std::vector<Real> args{5.0, 2.0};
    EXPECT_DOUBLE_EQ(xy->evaluate(args), 3.0);
    EXPECT_DOUBLE_EQ(yx->evaluate(args), -3.0);

    EXPECT_EQ(yx->argumentIndex().at("y"), 0u);
    EXPECT_EQ(yx->argumentIndex().at("x"), 1u);
    EXPECT_EQ(yx->variableOrder(), (std::vector<std::string>{"y", "x"}));
}

TEST_F(CompiledEvaluatorTest, UnusedSlotsAndExtraValuesAreIgnored)
{
    const auto ev = tape(b.multiply(z, z), {"x", "y", "z"});
    const std::vector<Real> args{100.0, -100.0, 3.0, 42.0};
    EXPECT_DOUBLE_EQ(ev->evaluate(args), 9.0);
}

TEST_F(CompiledEvaluatorTest, TooFewArgumentsAreRejected)
{
    const auto ev = tape(b.add(x, y), {"x", "y"});
    const std::vector<Real> one{1.0};
    EXPECT_THROW((void)ev->evaluate(one), InvalidArgumentException);

    std::vector<Real> regs(ev->registerCount());
    EXPECT_THROW((void)ev->evaluateWith(one, regs), InvalidArgumentException);
}

TEST_F(CompiledEvaluatorTest, CallerWorkspace)
{
    const auto f = everything();
    const std::vector<std::string> order{"x", "y", "z"};
    const auto ev = tape(f, order);

    std::vector<Real> regs(ev->registerCount());
    for (const auto& pt : positiveSamplePoints(order.size())) {
        EXPECT_EQ(ev->evaluateWith(pt, regs), ev->evaluate(pt));
    }

    std::vector<Real> small(ev->registerCount() - 1u);
    const auto pt = positiveSamplePoints(order.size()).front();
    EXPECT_THROW((void)ev->evaluateWith(pt, small), InvalidArgumentException);
}

TEST_F(CompiledEvaluatorTest, LongTapesUseHeapRegisters)
{
    // A chain longer than the stack register file.
    FuncNodePtr f = x;
    for (std::size_t i = 0; i < config::TAPE_STACK_REGISTERS + 8u; ++i) {
        f = b.add(b.multiply(f, b.constant(0.5)), y);
    }
    const std::vector<std::string> order{"x", "y"};
    const auto ev = tape(f, order);
    EXPECT_GT(ev->registerCount(), config::TAPE_STACK_REGISTERS);

    const std::vector<Real> args{3.0, 1.0};
    const Real expected = evaluate(*f, contextFrom(order, args));
    EXPECT_NEAR(ev->evaluate(args), expected, 1e-12 * (1.0 + std::fabs(expected)));
}

TEST_F(CompiledEvaluatorTest, RowMajorBatch)
{
    const auto f = b.add(b.multiply(x, x), y);
    const auto ev = tape(f, {"x", "y"});

    const std::vector<Real> points{1.0, 0.0,
                                   2.0, 1.0,
                                   3.0, -1.0};
    std::vector<Real> out(3);
    ev->evaluateBatch(points, out);
    EXPECT_EQ(out, (std::vector<Real>{1.0, 5.0, 8.0}));

    std::vector<Real> wrong(2);
    EXPECT_THROW(ev->evaluateBatch(points, wrong), InvalidArgumentException);
}

TEST_F(CompiledEvaluatorTest, ConstantFunction)
{
    const auto ev = tape(b.constant(7.0), {});
    EXPECT_EQ(ev->argumentCount(), 0u);
    EXPECT_DOUBLE_EQ(ev->evaluate(std::vector<Real>{}), 7.0);
}

TEST_F(CompiledEvaluatorTest, HashTracksStructure)
{
    const std::vector<std::string> order{"x", "y"};
    const auto a = tape(b.add(x, y), order);
    const auto c = tape(b.add(y, x), order);
    const auto d = tape(b.multiply(x, y), order);
    EXPECT_EQ(a->irHash(), c->irHash());
    EXPECT_NE(a->irHash(), d->irHash());
}

} // namespace test
} // namespace func
} // namespace svmf
