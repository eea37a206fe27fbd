/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_MathFunc.cpp
 * @brief Unit tests for the MathFunc handle (construction, algebra, evaluation, naming)
 */

#include <gtest/gtest.h>

#include "Core/FuncException.h"
#include "Functions/MathFunc.h"
#include "Tests/Unit/Functions/JITTestHelpers.h"

#include <array>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace svmf {
namespace func {
namespace test {

namespace {

struct XY {
    std::shared_ptr<ConstantInterner> interner{std::make_shared<ConstantInterner>()};
    MathFunc x{MathFunc::variable("x", interner)};
    MathFunc y{MathFunc::variable("y", interner)};
    MathFunc z{MathFunc::variable("z", interner)};
};

} // namespace

TEST(MathFunc, SumOfSquaresEvaluatesAndDifferentiates)
{
    XY v;
    const auto f = v.x * v.x + v.y * v.y;

    EXPECT_DOUBLE_EQ(f.apply({{"x", 3.0}, {"y", 4.0}}), 25.0);

    const auto g = f.grad();
    ASSERT_EQ(g.size(), 2u);
    EXPECT_DOUBLE_EQ(g[0].apply({{"x", 3.0}, {"y", 4.0}}), 6.0);
    EXPECT_DOUBLE_EQ(g[1].apply({{"x", 3.0}, {"y", 4.0}}), 8.0);
}

TEST(MathFunc, SqrtDerivativeAtFour)
{
    XY v;
    const auto df = sqrt(v.x).diff("x");
    EXPECT_DOUBLE_EQ(df.apply({{"x", 4.0}}), 0.25);
}

TEST(MathFunc, ComposeSubstitutesNamedVariables)
{
    XY v;
    const auto r = MathFunc::variable("r", v.interner);
    const auto s = MathFunc::variable("s", v.interner);
    const auto outer = r * s + 1.0;

    const auto composed = outer.compose({{"r", v.x * v.x}, {"s", v.y + 1.0}});
    EXPECT_DOUBLE_EQ(composed.apply({{"x", 2.0}, {"y", 1.0}}), 9.0);
    EXPECT_EQ(composed.freeVariableNames(), (std::vector<std::string>{"x", "y"}));

    const auto substituted = outer.substitute({{"r", v.x * v.x}, {"s", v.y + 1.0}});
    EXPECT_DOUBLE_EQ(substituted.apply({{"x", 2.0}, {"y", 1.0}}), 9.0);
}

TEST(MathFunc, LinearCombinationEvaluatesAndValidatesCounts)
{
    XY v;
    const auto lc = MathFunc::linearCombination({2.0, 3.0}, {v.x, v.y});
    EXPECT_DOUBLE_EQ(lc.apply({{"x", 1.0}, {"y", 1.0}}), 5.0);

    EXPECT_THROW((void)MathFunc::linearCombination({2.0}, {v.x, v.y}), MalformedConstructionException);
    EXPECT_THROW((void)MathFunc::linearCombination({}, {}), MalformedConstructionException);

    const auto two_term = MathFunc::linearCombination(2.0, v.x, -1.0, v.y);
    EXPECT_DOUBLE_EQ(two_term.apply({{"x", 3.0}, {"y", 1.0}}), 5.0);
}

TEST(MathFunc, PrintsWithConventionalGrouping)
{
    XY v;
    EXPECT_EQ(((v.x + v.y) / v.z).toExpressionString(), "(x + y)/z");
    EXPECT_EQ((v.x * v.x + v.y * v.y).toExpressionString(), "x*x + y*y");
    EXPECT_EQ((v.x - (v.y - v.z)).toExpressionString(), "x - (y - z)");
    EXPECT_EQ((v.x / (v.y * v.z)).toExpressionString(), "x/(y*z)");
}

TEST(MathFunc, LiteralsOnEitherSide)
{
    XY v;
    const VariableContext ctx{{"x", 2.0}};

    EXPECT_DOUBLE_EQ((v.x + 1.0).apply(ctx), 3.0);
    EXPECT_DOUBLE_EQ((1.0 + v.x).apply(ctx), 3.0);
    EXPECT_DOUBLE_EQ((v.x - 5.0).apply(ctx), -3.0);
    EXPECT_DOUBLE_EQ((5.0 - v.x).apply(ctx), 3.0);
    EXPECT_DOUBLE_EQ((v.x * 4.0).apply(ctx), 8.0);
    EXPECT_DOUBLE_EQ((4.0 * v.x).apply(ctx), 8.0);
    EXPECT_DOUBLE_EQ((v.x / 4.0).apply(ctx), 0.5);
    EXPECT_DOUBLE_EQ((4.0 / v.x).apply(ctx), 2.0);
    EXPECT_DOUBLE_EQ((-v.x).apply(ctx), -2.0);
}

TEST(MathFunc, ElementaryFunctions)
{
    XY v;
    const VariableContext ctx{{"x", 0.5}};

    EXPECT_DOUBLE_EQ(pow(v.x, 3.0).apply(ctx), std::pow(0.5, 3.0));
    EXPECT_DOUBLE_EQ(pow(v.x, v.x).apply(ctx), std::pow(0.5, 0.5));
    EXPECT_DOUBLE_EQ(abs(-v.x).apply(ctx), 0.5);
    EXPECT_DOUBLE_EQ(sign(-v.x).apply(ctx), -1.0);
    EXPECT_DOUBLE_EQ(exp(v.x).apply(ctx), std::exp(0.5));
    EXPECT_DOUBLE_EQ(log(v.x).apply(ctx), std::log(0.5));
    EXPECT_DOUBLE_EQ(sin(v.x).apply(ctx), std::sin(0.5));
    EXPECT_DOUBLE_EQ(cos(v.x).apply(ctx), std::cos(0.5));
}

TEST(MathFunc, ConstantPredicates)
{
    auto interner = std::make_shared<ConstantInterner>();
    const auto three = MathFunc::constant(3.0, interner);
    const auto half = MathFunc::constant(0.5, interner);
    const auto zero = MathFunc::constant(0.0, interner);
    const auto x = MathFunc::variable("x", interner);

    EXPECT_TRUE(three.isConstant());
    EXPECT_TRUE(three.isInteger());
    EXPECT_TRUE(three.isReal());
    EXPECT_FALSE(three.isZero());
    EXPECT_DOUBLE_EQ(three.constantValue(), 3.0);

    EXPECT_FALSE(half.isInteger());
    EXPECT_TRUE(zero.isZero());

    EXPECT_FALSE(x.isConstant());
    EXPECT_FALSE(x.isReal());
    EXPECT_THROW((void)x.constantValue(), InvalidArgumentException);

    // Constant operands fold through the interner.
    const auto six = three * 2.0;
    EXPECT_TRUE(six.isConstant());
    EXPECT_EQ(six.nodeShared(), interner->intern(6.0));
}

TEST(MathFunc, SumRequiresTerms)
{
    XY v;
    EXPECT_THROW((void)MathFunc::sum({}), MalformedConstructionException);
    EXPECT_DOUBLE_EQ(MathFunc::sum({v.x, v.y, v.z}).apply({{"x", 1.0}, {"y", 2.0}, {"z", 3.0}}), 6.0);
}

TEST(MathFunc, UnboundVariableIsReported)
{
    XY v;
    const auto f = v.x + v.y;
    try {
        (void)f.apply({{"x", 1.0}});
        FAIL() << "expected UnboundVariableException";
    } catch (const UnboundVariableException& e) {
        EXPECT_EQ(e.variable(), "y");
    }
}

TEST(MathFunc, DivisionByZeroFollowsIEEE)
{
    XY v;
    const auto f = v.x / v.y;
    EXPECT_TRUE(std::isinf(f.apply({{"x", 1.0}, {"y", 0.0}})));
    EXPECT_TRUE(std::isnan(f.apply({{"x", 0.0}, {"y", 0.0}})));
    EXPECT_TRUE(std::isnan(sqrt(v.x).apply({{"x", -1.0}})));
}

TEST(MathFunc, NamesAndToString)
{
    XY v;
    const auto f = (v.x * v.x + v.y * v.y).setName("g");
    EXPECT_EQ(f.name(), "g");
    EXPECT_EQ(f.toString(), "g(x, y) = x*x + y*y");

    EXPECT_THROW((void)v.x.setName("h"), UnsupportedMutationException);
    EXPECT_THROW((void)MathFunc::constant(1.0, v.interner).setName("h"), UnsupportedMutationException);
}

TEST(MathFunc, SetVariableNamesRenamesPositionally)
{
    XY v;
    const auto f = v.x - 2.0 * v.y;

    const auto swapped = f.setVariableNames({"y", "x"});
    EXPECT_EQ(swapped.toExpressionString(), "y - 2*x");
    EXPECT_DOUBLE_EQ(swapped.apply({{"x", 1.0}, {"y", 5.0}}), 3.0);

    const auto renamed = f.setVariableNames({"s", "t"});
    EXPECT_EQ(renamed.freeVariableNames(), (std::vector<std::string>{"s", "t"}));

    EXPECT_THROW((void)f.setVariableNames({"s"}), MalformedConstructionException);
    EXPECT_THROW((void)v.x.setVariableNames({"s"}), UnsupportedMutationException);
}

TEST(MathFunc, PositionalApplyUsesFreeVariableOrderOrArgumentIndex)
{
    XY v;
    const auto f = v.x - v.y;

    const std::array<Real, 2> args{5.0, 2.0};
    EXPECT_DOUBLE_EQ(f.apply(std::span<const Real>(args)), 3.0);

    const std::array<Real, 1> short_args{5.0};
    EXPECT_THROW((void)f.apply(std::span<const Real>(short_args)), InvalidArgumentException);

    const auto indexed = f.setArgumentIndex({{"x", 1}, {"y", 0}});
    EXPECT_DOUBLE_EQ(indexed.apply(std::span<const Real>(args)), -3.0);
    EXPECT_EQ(indexed.argumentOrder(), (std::vector<std::string>{"y", "x"}));

    EXPECT_THROW((void)f.setArgumentIndex({{"x", 0}}), MalformedConstructionException);
}

TEST(MathFunc, ArgumentIndexSlotsAreExclusive)
{
    XY v;
    const auto f = v.x + v.y;

    EXPECT_THROW((void)f.setArgumentIndex({{"x", 0}, {"y", 0}}), MalformedConstructionException);
    EXPECT_THROW((void)f.setArgumentIndex({{"x", 1}, {"y", 0}, {"z", 1}}), MalformedConstructionException);

    // Gaps are allowed; every slot that is read compiles to the same value.
    const auto indexed = f.setArgumentIndex({{"x", 2}, {"y", 0}});
    EXPECT_EQ(indexed.argumentOrder(), (std::vector<std::string>{"y", "", "x"}));

    const std::array<Real, 3> args{1.5, 100.0, 4.0};
    const auto compiled = indexed.compile(indexed.argumentOrder(), makeTapeCompileOptions());
    ASSERT_NE(compiled, nullptr);
    EXPECT_DOUBLE_EQ(compiled->evaluate(args), indexed.apply(std::span<const Real>(args)));
    EXPECT_DOUBLE_EQ(compiled->evaluate(args), 5.5);
}

TEST(MathFunc, BatchMatchesSingleEvaluation)
{
    XY v;
    const auto f = v.x * v.y + sqrt(v.x);

    std::vector<VariableContext> contexts;
    VariableBatch batch;
    std::vector<Real> xs;
    std::vector<Real> ys;
    for (int i = 0; i < 10; ++i) {
        const Real x = 0.5 + i;
        const Real y = 2.0 - 0.25 * i;
        contexts.push_back(VariableContext{{"x", x}, {"y", y}});
        xs.push_back(x);
        ys.push_back(y);
    }
    batch.setColumn("x", xs);
    batch.setColumn("y", ys);

    const auto by_context = f.applyBatch(contexts);
    const auto by_column = f.applyBatch(batch);
    ASSERT_EQ(by_context.size(), contexts.size());
    ASSERT_EQ(by_column.size(), contexts.size());
    for (std::size_t i = 0; i < contexts.size(); ++i) {
        const Real expected = f.apply(contexts[i]);
        EXPECT_DOUBLE_EQ(by_context[i], expected);
        EXPECT_DOUBLE_EQ(by_column[i], expected);
    }
}

TEST(MathFunc, CompileMatchesApply)
{
    XY v;
    const auto f = v.x * v.x + 3.0 * v.y - v.x / v.y;
    const std::vector<std::string> order{"y", "x"};

    const auto compiled = f.compile(order, makeTapeCompileOptions());
    ASSERT_NE(compiled, nullptr);

    const std::array<Real, 2> args{2.0, 3.0};
    EXPECT_DOUBLE_EQ(compiled->evaluate(args), f.apply({{"x", 3.0}, {"y", 2.0}}));

    EXPECT_THROW((void)f.compile({"x"}, makeTapeCompileOptions()), MalformedConstructionException);
}

TEST(MathFunc, InvalidHandleRejectsOperations)
{
    const MathFunc empty;
    EXPECT_FALSE(empty.isValid());
    EXPECT_FALSE(empty.isConstant());
    EXPECT_THROW((void)empty.freeVariableNames(), InvalidArgumentException);
    EXPECT_THROW((void)empty.toExpressionString(), InvalidArgumentException);
}

} // namespace test
} // namespace func
} // namespace svmf
