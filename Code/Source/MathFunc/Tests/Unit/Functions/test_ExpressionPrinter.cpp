/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_ExpressionPrinter.cpp
 * @brief Unit tests for infix printing with minimal parentheses
 */

#include <gtest/gtest.h>

#include "Functions/Composition.h"
#include "Functions/ConstantInterner.h"
#include "Functions/ExpressionPrinter.h"
#include "Functions/FuncAlgebra.h"

#include <string>

namespace svmf {
namespace func {
namespace test {

namespace {

class ExpressionPrinterTest : public ::testing::Test {
protected:
    ConstantInterner interner;
    NodeBuilder b{interner};
    FuncNodePtr x = FuncNode::makeVariable("x");
    FuncNodePtr y = FuncNode::makeVariable("y");
    FuncNodePtr z = FuncNode::makeVariable("z");

    [[nodiscard]] static std::string str(const FuncNodePtr& f) { return toExpressionString(*f); }
};

} // namespace

TEST_F(ExpressionPrinterTest, Leaves)
{
    EXPECT_EQ(str(x), "x");
    EXPECT_EQ(str(b.constant(2.0)), "2");
    EXPECT_EQ(str(b.constant(0.25)), "0.25");
    EXPECT_EQ(str(b.constant(-2.0)), "-2");
}

TEST_F(ExpressionPrinterTest, SumsAndProducts)
{
    EXPECT_EQ(str(b.add(b.multiply(x, x), b.multiply(y, y))), "x*x + y*y");
    EXPECT_EQ(str(b.multiply(b.add(x, y), z)), "(x + y)*z");
    EXPECT_EQ(str(b.multiply(b.constant(2.0), x)), "2*x");
    EXPECT_EQ(str(b.add(b.multiply(b.constant(2.0), x), b.multiply(b.constant(3.0), y))), "2*x + 3*y");
}

TEST_F(ExpressionPrinterTest, RightOperandsOfNonAssociativeOperators)
{
    EXPECT_EQ(str(b.divide(b.add(x, y), z)), "(x + y)/z");
    EXPECT_EQ(str(b.subtract(x, b.subtract(y, z))), "x - (y - z)");
    EXPECT_EQ(str(b.subtract(b.subtract(x, y), z)), "x - y - z");
    EXPECT_EQ(str(b.subtract(x, b.add(y, z))), "x - (y + z)");
    EXPECT_EQ(str(b.divide(x, b.multiply(y, z))), "x/(y*z)");
    EXPECT_EQ(str(b.divide(b.multiply(x, y), z)), "x*y/z");
}

TEST_F(ExpressionPrinterTest, Powers)
{
    EXPECT_EQ(str(b.pow(x, 2.0)), "x^2");
    EXPECT_EQ(str(b.pow(x, -0.5)), "x^(-0.5)");
    EXPECT_EQ(str(b.pow(b.add(x, y), 2.0)), "(x + y)^2");
    EXPECT_EQ(str(b.power(x, y)), "x^y");
    EXPECT_EQ(str(b.power(b.power(x, y), z)), "(x^y)^z");
    EXPECT_EQ(str(b.power(x, b.add(y, z))), "x^(y + z)");
}

TEST_F(ExpressionPrinterTest, NegativeConstantOperands)
{
    EXPECT_EQ(str(b.add(x, b.constant(-2.0))), "x + (-2)");
    EXPECT_EQ(str(b.multiply(b.constant(-2.0), x)), "(-2)*x");
    EXPECT_EQ(str(b.add(b.constant(-2.0), y)), "-2 + y");
    EXPECT_EQ(str(b.subtract(b.constant(-2.0), y)), "-2 - y");
    EXPECT_EQ(str(b.power(b.constant(-2.0), x)), "(-2)^x");
    EXPECT_EQ(str(FuncNode::makeUnary(UnaryKind::Negate, b.constant(-2.0))), "-(-2)");
}

TEST_F(ExpressionPrinterTest, SubstitutedNegativeConstants)
{
    const auto minus_two = b.constant(-2.0);
    EXPECT_EQ(str(compose(x, {{"x", minus_two}})), "-2");
    EXPECT_EQ(str(compose(b.add(x, y), {{"x", minus_two}})), "-2 + y");
    EXPECT_EQ(str(compose(b.add(y, x), {{"x", minus_two}})), "y + (-2)");
    EXPECT_EQ(str(compose(b.multiply(y, x), {{"x", minus_two}})), "y*(-2)");
}

TEST_F(ExpressionPrinterTest, NumbersRoundTrip)
{
    EXPECT_EQ(str(b.constant(1.0 / 3.0)), "0.3333333333333333");
    EXPECT_EQ(str(b.multiply(x, b.constant(1.0 / 3.0))), "x*0.3333333333333333");
    EXPECT_EQ(str(b.constant(0.1)), "0.1");
    EXPECT_EQ(str(b.constant(123456789.0)), "123456789");
    EXPECT_EQ(str(b.pow(x, 1.0 / 3.0)), "x^0.3333333333333333");
    EXPECT_NE(str(b.constant(1.0 / 3.0)), str(b.constant(0.333333)));
}

TEST_F(ExpressionPrinterTest, UnaryForms)
{
    EXPECT_EQ(str(b.negate(x)), "-x");
    EXPECT_EQ(str(b.negate(b.add(x, y))), "-(x + y)");
    EXPECT_EQ(str(b.sqrt(x)), "sqrt(x)");
    EXPECT_EQ(str(b.sqrt(b.add(x, y))), "sqrt(x + y)");
    EXPECT_EQ(str(b.abs(x)), "abs(x)");
    EXPECT_EQ(str(b.sign(x)), "sign(x)");
    EXPECT_EQ(str(b.exp(x)), "exp(x)");
    EXPECT_EQ(str(b.log(x)), "log(x)");
    EXPECT_EQ(str(b.sin(x)), "sin(x)");
    EXPECT_EQ(str(b.cos(b.multiply(x, y))), "cos(x*y)");
    EXPECT_EQ(str(b.multiply(b.sin(x), b.cos(x))), "sin(x)*cos(x)");
}

TEST_F(ExpressionPrinterTest, FunctionCallsAreAtoms)
{
    EXPECT_EQ(str(b.pow(b.sqrt(x), 2.0)), "sqrt(x)^2");
    EXPECT_EQ(str(b.power(b.exp(x), y)), "exp(x)^y");
    EXPECT_EQ(str(b.power(x, b.log(y))), "x^log(y)");
    EXPECT_EQ(str(b.pow(b.abs(b.add(x, y)), 3.0)), "abs(x + y)^3");
    EXPECT_EQ(str(b.pow(b.negate(x), 2.0)), "(-x)^2");
    EXPECT_EQ(str(b.negate(b.sin(x))), "-sin(x)");
}

TEST_F(ExpressionPrinterTest, LinearCombinations)
{
    EXPECT_EQ(str(b.linearCombination({2.0, -3.0}, {x, y})), "2*x - 3*y");
    EXPECT_EQ(str(b.linearCombination({-1.0, 0.5}, {b.add(x, y), z})), "-1*(x + y) + 0.5*z");
    EXPECT_EQ(str(b.multiply(b.linearCombination({1.0, 1.0}, {x, y}), z)), "(1*x + 1*y)*z");
}

TEST_F(ExpressionPrinterTest, FunctionSignature)
{
    const auto f = b.add(b.multiply(x, x), b.multiply(y, y));
    EXPECT_EQ(toFunctionString(*f, "g", {"x", "y"}), "g(x, y) = x*x + y*y");
    EXPECT_EQ(toFunctionString(*b.constant(1.0), "one", {}), "one() = 1");
}

} // namespace test
} // namespace func
} // namespace svmf
