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

#ifndef SVMF_FUNC_VARIABLE_CONTEXT_H
#define SVMF_FUNC_VARIABLE_CONTEXT_H

/**
 * @file VariableContext.h
 * @brief Name-to-value bindings for one evaluation point or a column batch of points
 */

#include "Core/Types.h"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace svmf {
namespace func {

/**
 * @brief Values of named variables at a single point
 */
class VariableContext {
public:
    using Storage = std::map<std::string, Real, std::less<>>;

    VariableContext() = default;
    VariableContext(std::initializer_list<std::pair<const std::string, Real>> values);

    /**
     * @brief Bind names[i] to values[i]; extra values are ignored
     *
     * @throws InvalidArgumentException if fewer values than names are given
     */
    [[nodiscard]] static VariableContext fromArrays(std::span<const std::string> names,
                                                    std::span<const Real> values);

    VariableContext& set(std::string name, Real value);

    [[nodiscard]] std::optional<Real> get(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;

    /**
     * @throws UnboundVariableException if `name` is not bound
     */
    [[nodiscard]] Real at(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] const Storage& values() const noexcept { return values_; }

private:
    Storage values_{};
};

/**
 * @brief Column-oriented bindings: each name maps to one value per point
 *
 * All columns hold the same number of points.
 */
class VariableBatch {
public:
    using Column = std::vector<Real>;

    VariableBatch() = default;

    /**
     * @throws InvalidArgumentException if the column length differs from existing columns
     */
    VariableBatch& setColumn(std::string name, Column values);

    [[nodiscard]] bool contains(std::string_view name) const;

    /**
     * @throws UnboundVariableException if `name` has no column
     */
    [[nodiscard]] const Column& column(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t columnCount() const noexcept { return columns_.size(); }

    /// Context for point `i` (all columns).
    [[nodiscard]] VariableContext contextAt(std::size_t i) const;

    [[nodiscard]] static VariableBatch fromContexts(const std::vector<VariableContext>& contexts);

private:
    std::map<std::string, Column, std::less<>> columns_{};
    std::size_t size_{0};
};

} // namespace func
} // namespace svmf

#endif // SVMF_FUNC_VARIABLE_CONTEXT_H
