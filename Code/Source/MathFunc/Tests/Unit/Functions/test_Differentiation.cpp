/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_Differentiation.cpp
 * @brief Unit tests for symbolic differentiation
 *
 * Derivatives are compared numerically against hand-derived formulas at a
 * handful of points rather than structurally.
 */

#include <gtest/gtest.h>

#include "Core/FuncException.h"
#include "Functions/Composition.h"
#include "Functions/ConstantInterner.h"
#include "Functions/Differentiation.h"
#include "Functions/Evaluator.h"
#include "Functions/FuncAlgebra.h"

#include <cmath>
#include <functional>
#include <string>
#include <vector>

namespace svmf {
namespace func {
namespace test {

namespace {

class DifferentiationTest : public ::testing::Test {
protected:
    ConstantInterner interner;
    NodeBuilder b{interner};
    FuncNodePtr x = FuncNode::makeVariable("x");
    FuncNodePtr y = FuncNode::makeVariable("y");

    [[nodiscard]] FuncNodePtr d(const FuncNodePtr& f, const std::string& var) const
    {
        return differentiate(f, var, b);
    }

    void expectMatches(const FuncNodePtr& df, const std::function<Real(Real, Real)>& expected) const
    {
        const std::vector<std::pair<Real, Real>> points{{0.5, 1.5}, {1.25, 0.75}, {2.0, 3.0}, {3.5, 0.2}};
        for (const auto& [xv, yv] : points) {
            const VariableContext ctx{{"x", xv}, {"y", yv}};
            EXPECT_NEAR(evaluate(*df, ctx), expected(xv, yv), 1e-12 * (1.0 + std::fabs(expected(xv, yv))))
                << "at x=" << xv << ", y=" << yv;
        }
    }
};

} // namespace

TEST_F(DifferentiationTest, ConstantsAndForeignVariablesGiveZero)
{
    const auto dc = d(b.constant(5.0), "x");
    EXPECT_EQ(dc.get(), interner.zero().get());

    const auto dy = d(b.multiply(y, y), "x");
    EXPECT_EQ(dy.get(), interner.zero().get());

    const auto dx = d(x, "x");
    EXPECT_EQ(dx.get(), interner.one().get());
}

TEST_F(DifferentiationTest, ProductRule)
{
    const auto f = b.multiply(b.multiply(x, x), y);
    expectMatches(d(f, "x"), [](Real xv, Real yv) { return 2.0 * xv * yv; });
    expectMatches(d(f, "y"), [](Real xv, Real) { return xv * xv; });
}

TEST_F(DifferentiationTest, QuotientRule)
{
    const auto f = b.divide(x, b.add(y, x));
    expectMatches(d(f, "x"), [](Real xv, Real yv) { return yv / ((xv + yv) * (xv + yv)); });
    expectMatches(d(f, "y"), [](Real xv, Real yv) { return -xv / ((xv + yv) * (xv + yv)); });
}

TEST_F(DifferentiationTest, ConstantAndFunctionExponents)
{
    expectMatches(d(b.pow(x, 3.0), "x"), [](Real xv, Real) { return 3.0 * xv * xv; });
    expectMatches(d(b.pow(x, -0.5), "x"), [](Real xv, Real) { return -0.5 * std::pow(xv, -1.5); });
    expectMatches(d(b.pow(x, 0.0), "x"), [](Real, Real) { return 0.0; });

    // x^y
    const auto f = b.power(x, y);
    expectMatches(d(f, "x"), [](Real xv, Real yv) { return yv * std::pow(xv, yv - 1.0); });
    expectMatches(d(f, "y"), [](Real xv, Real yv) { return std::pow(xv, yv) * std::log(xv); });
}

TEST_F(DifferentiationTest, ElementaryFunctions)
{
    expectMatches(d(b.sqrt(x), "x"), [](Real xv, Real) { return 0.5 / std::sqrt(xv); });
    expectMatches(d(b.exp(b.multiply(x, y)), "x"), [](Real xv, Real yv) { return yv * std::exp(xv * yv); });
    expectMatches(d(b.log(x), "x"), [](Real xv, Real) { return 1.0 / xv; });
    expectMatches(d(b.sin(x), "x"), [](Real xv, Real) { return std::cos(xv); });
    expectMatches(d(b.cos(x), "x"), [](Real xv, Real) { return -std::sin(xv); });
    expectMatches(d(b.negate(x), "x"), [](Real, Real) { return -1.0; });
    expectMatches(d(b.abs(x), "x"), [](Real, Real) { return 1.0; });
    expectMatches(d(b.sign(x), "x"), [](Real, Real) { return 0.0; });
}

TEST_F(DifferentiationTest, LinearCombinationIsTermwise)
{
    const auto f = b.linearCombination({2.0, -3.0}, {b.multiply(x, x), b.multiply(x, y)});
    expectMatches(d(f, "x"), [](Real xv, Real yv) { return 4.0 * xv - 3.0 * yv; });
    expectMatches(d(f, "y"), [](Real xv, Real) { return -3.0 * xv; });
}

TEST_F(DifferentiationTest, CompositeChainRuleMatchesSubstitution)
{
    const auto r = FuncNode::makeVariable("r");
    const auto outer = b.sin(b.multiply(r, r));
    const NodeSubstitutions subs{{"r", b.add(x, b.multiply(x, y))}};

    const auto composed = compose(outer, subs);
    ASSERT_EQ(composed->type(), FuncNodeType::Composite);
    const auto expanded = substitute(outer, subs, b);

    for (const auto& var : {std::string("x"), std::string("y")}) {
        const auto dc = d(composed, var);
        const auto de = d(expanded, var);
        for (const Real xv : {0.3, 1.1, 2.4}) {
            const VariableContext ctx{{"x", xv}, {"y", 0.7}};
            EXPECT_NEAR(evaluate(*dc, ctx), evaluate(*de, ctx), 1e-10) << var << " at x=" << xv;
        }
    }
}

TEST_F(DifferentiationTest, MergedNamesGetChainAndDirectTerms)
{
    // outer = x + r with r := x*y; the outer x is the same x as in r.
    const auto r = FuncNode::makeVariable("r");
    const auto composed = compose(b.add(x, r), {{"r", b.multiply(x, y)}});

    expectMatches(d(composed, "x"), [](Real, Real yv) { return 1.0 + yv; });
    expectMatches(d(composed, "y"), [](Real xv, Real) { return xv; });
}

TEST_F(DifferentiationTest, GradientFollowsRequestedOrder)
{
    const auto f = b.add(b.multiply(x, x), b.multiply(b.constant(3.0), y));
    const auto g = gradient(f, {"y", "x", "z"}, b);
    ASSERT_EQ(g.size(), 3u);

    const VariableContext ctx{{"x", 2.0}, {"y", 5.0}};
    EXPECT_DOUBLE_EQ(evaluate(*g[0], ctx), 3.0);
    EXPECT_DOUBLE_EQ(evaluate(*g[1], ctx), 4.0);
    EXPECT_EQ(g[2].get(), interner.zero().get());
}

TEST_F(DifferentiationTest, EmptyVariableNameIsRejected)
{
    EXPECT_THROW((void)d(x, ""), InvalidArgumentException);
    EXPECT_THROW((void)differentiate(nullptr, "x", b), InvalidArgumentException);
}

} // namespace test
} // namespace func
} // namespace svmf
