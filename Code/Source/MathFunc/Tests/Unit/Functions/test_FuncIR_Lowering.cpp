/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_FuncIR_Lowering.cpp
 * @brief Unit tests for lowering expression trees to FuncIR
 */

#include <gtest/gtest.h>

#include "Core/FuncException.h"
#include "Functions/ConstantInterner.h"
#include "Functions/FuncAlgebra.h"
#include "Functions/JIT/FuncIR.h"

#include <bit>
#include <string>
#include <vector>

namespace svmf {
namespace func {
namespace test {

namespace {

[[nodiscard]] std::size_t countOps(const jit::FuncIR& ir, jit::FuncIROpType type)
{
    std::size_t n = 0;
    for (const auto& op : ir.ops) {
        if (op.type == type) ++n;
    }
    return n;
}

} // namespace

TEST(FuncIRLowering, PostOrderWithArgumentsFirst)
{
    const auto x = FuncNode::makeVariable("x");
    const auto y = FuncNode::makeVariable("y");
    const auto f = FuncNode::makeBinary(BinaryKind::Add,
                                        FuncNode::makeBinary(BinaryKind::Multiply, x, x),
                                        FuncNode::makeBinary(BinaryKind::Multiply, y, y));

    const auto ir = jit::lowerToFuncIR(*f, {"x", "y"});
    ASSERT_EQ(ir.opCount(), 5u);
    EXPECT_EQ(ir.argument_count, 2u);
    EXPECT_EQ(ir.root, 4u);

    EXPECT_EQ(ir.ops[0].type, jit::FuncIROpType::Argument);
    EXPECT_EQ(ir.ops[0].imm0, 0u);
    EXPECT_EQ(ir.ops[1].type, jit::FuncIROpType::Argument);
    EXPECT_EQ(ir.ops[1].imm0, 1u);
    EXPECT_EQ(ir.ops[4].type, jit::FuncIROpType::Add);

    for (std::size_t i = 0; i < ir.ops.size(); ++i) {
        for (std::uint32_t c = 0; c < ir.ops[i].child_count; ++c) {
            EXPECT_LT(ir.child(ir.ops[i], c), i);
        }
    }
}

TEST(FuncIRLowering, CommonSubexpressionsAreShared)
{
    const auto x = FuncNode::makeVariable("x");
    const auto y = FuncNode::makeVariable("y");
    // Two structurally equal but distinct nodes.
    const auto s1 = FuncNode::makeBinary(BinaryKind::Add, x, y);
    const auto s2 = FuncNode::makeBinary(BinaryKind::Add, x, y);
    const auto f = FuncNode::makeBinary(BinaryKind::Multiply, s1, s2);

    jit::FuncIRBuildOptions with_cse;
    const auto shared = jit::lowerToFuncIR(*f, {"x", "y"}, with_cse);
    EXPECT_EQ(countOps(shared, jit::FuncIROpType::Add), 1u);
    EXPECT_EQ(shared.opCount(), 4u);

    jit::FuncIRBuildOptions without_cse;
    without_cse.cse = false;
    const auto separate = jit::lowerToFuncIR(*f, {"x", "y"}, without_cse);
    EXPECT_EQ(countOps(separate, jit::FuncIROpType::Add), 2u);
}

TEST(FuncIRLowering, ConstantSubtreesFold)
{
    const auto two = FuncNode::makeConstant(2.0);
    const auto three = FuncNode::makeConstant(3.0);
    const auto x = FuncNode::makeVariable("x");
    const auto f = FuncNode::makeBinary(BinaryKind::Multiply,
                                        FuncNode::makeBinary(BinaryKind::Add, two, three), x);

    const auto folded = jit::lowerToFuncIR(*f, {"x"});
    EXPECT_EQ(countOps(folded, jit::FuncIROpType::Add), 0u);
    const auto& root = folded.ops[folded.root];
    ASSERT_EQ(root.type, jit::FuncIROpType::Multiply);
    bool found_five = false;
    for (std::uint32_t c = 0; c < root.child_count; ++c) {
        const auto& operand = folded.ops[folded.child(root, c)];
        if (operand.type == jit::FuncIROpType::Constant) {
            found_five = (std::bit_cast<double>(operand.imm0) == 5.0);
        }
    }
    EXPECT_TRUE(found_five);

    jit::FuncIRBuildOptions no_fold;
    no_fold.fold_constants = false;
    const auto unfolded = jit::lowerToFuncIR(*f, {"x"}, no_fold);
    EXPECT_EQ(countOps(unfolded, jit::FuncIROpType::Add), 1u);
}

TEST(FuncIRLowering, MissingVariableIsRejected)
{
    const auto f = FuncNode::makeBinary(BinaryKind::Subtract,
                                        FuncNode::makeVariable("x"), FuncNode::makeVariable("y"));
    EXPECT_THROW((void)jit::lowerToFuncIR(*f, {"x"}), MalformedConstructionException);
}

TEST(FuncIRLowering, ExtraVariablesOnlyWidenTheArgumentArray)
{
    const auto f = FuncNode::makeUnary(UnaryKind::Sqrt, FuncNode::makeVariable("y"));
    const auto ir = jit::lowerToFuncIR(*f, {"x", "y", "z"});
    EXPECT_EQ(ir.argument_count, 3u);
    ASSERT_EQ(countOps(ir, jit::FuncIROpType::Argument), 1u);
    EXPECT_EQ(ir.ops[0].imm0, 1u);
}

TEST(FuncIRLowering, StableHashIgnoresCommutativeOperandOrder)
{
    const auto x = FuncNode::makeVariable("x");
    const auto y = FuncNode::makeVariable("y");
    const auto xy = FuncNode::makeBinary(BinaryKind::Add, x, y);
    const auto yx = FuncNode::makeBinary(BinaryKind::Add, y, x);
    const auto x_minus_y = FuncNode::makeBinary(BinaryKind::Subtract, x, y);

    const std::vector<std::string> order{"x", "y"};
    const auto h_xy = jit::lowerToFuncIR(*xy, order).stableHash64();
    EXPECT_EQ(h_xy, jit::lowerToFuncIR(*yx, order).stableHash64());
    EXPECT_NE(h_xy, jit::lowerToFuncIR(*x_minus_y, order).stableHash64());

    // Same tree, wider argument array
    EXPECT_NE(h_xy, jit::lowerToFuncIR(*xy, {"x", "y", "z"}).stableHash64());
}

TEST(FuncIRLowering, CompositeAndLinearCombinationAreInlined)
{
    ConstantInterner interner;
    const NodeBuilder b(interner);
    const auto r = FuncNode::makeVariable("r");
    const auto x = FuncNode::makeVariable("x");
    const auto outer = b.linearCombination({2.0, 3.0}, {r, b.sqrt(r)});
    const auto composite = FuncNode::makeComposite(outer, {{"r", b.multiply(x, x)}});

    const auto ir = jit::lowerToFuncIR(*composite, {"x"});
    EXPECT_EQ(countOps(ir, jit::FuncIROpType::Argument), 1u);
    EXPECT_EQ(countOps(ir, jit::FuncIROpType::Sqrt), 1u);
    EXPECT_EQ(countOps(ir, jit::FuncIROpType::Add), 1u);
    EXPECT_EQ(countOps(ir, jit::FuncIROpType::Multiply), 3u);

    const std::string text = ir.dump();
    EXPECT_NE(text.find("Sqrt"), std::string::npos);
    EXPECT_NE(text.find("Argument [0]"), std::string::npos);
}

} // namespace test
} // namespace func
} // namespace svmf
