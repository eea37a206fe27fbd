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

#ifndef SVMF_FUNC_EXPRESSION_PRINTER_H
#define SVMF_FUNC_EXPRESSION_PRINTER_H

/**
 * @file ExpressionPrinter.h
 * @brief Infix rendering of expression trees for diagnostics
 *
 * A child is parenthesized when its precedence level is greater than the
 * parent's, or greater than or equal to it for the right operand of
 * subtraction and division and for both operands of a power. Composite nodes
 * print their substituted expansion.
 */

#include "Functions/FuncNode.h"

#include <string>
#include <vector>

namespace svmf {
namespace func {

[[nodiscard]] std::string toExpressionString(const FuncNode& node);

/**
 * @brief "name(x, y) = <expression>"
 */
[[nodiscard]] std::string toFunctionString(const FuncNode& node,
                                           const std::string& name,
                                           const std::vector<std::string>& arguments);

} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_EXPRESSION_PRINTER_H
