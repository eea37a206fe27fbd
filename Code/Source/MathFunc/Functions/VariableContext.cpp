/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Functions/VariableContext.h"

#include "Core/FuncException.h"

namespace svmf {
namespace func {

VariableContext::VariableContext(std::initializer_list<std::pair<const std::string, Real>> values)
    : values_(values.begin(), values.end())
{
}

VariableContext VariableContext::fromArrays(std::span<const std::string> names,
                                            std::span<const Real> values)
{
    SVMF_THROW_IF(values.size() < names.size(), InvalidArgumentException,
                  "VariableContext::fromArrays: " + std::to_string(values.size())
                  + " values for " + std::to_string(names.size()) + " names");

    VariableContext ctx;
    for (std::size_t i = 0; i < names.size(); ++i) {
        ctx.set(names[i], values[i]);
    }
    return ctx;
}

VariableContext& VariableContext::set(std::string name, Real value)
{
    values_.insert_or_assign(std::move(name), value);
    return *this;
}

std::optional<Real> VariableContext::get(std::string_view name) const
{
    auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool VariableContext::contains(std::string_view name) const
{
    return values_.find(name) != values_.end();
}

Real VariableContext::at(std::string_view name) const
{
    auto it = values_.find(name);
    if (it == values_.end()) {
        SVMF_THROW(UnboundVariableException, std::string(name));
    }
    return it->second;
}

std::vector<std::string> VariableContext::names() const
{
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto& kv : values_) {
        out.push_back(kv.first);
    }
    return out;
}

// ---------------------------------------------------------------------------

VariableBatch& VariableBatch::setColumn(std::string name, Column values)
{
    const bool replacing_only = columns_.size() == 1u && columns_.begin()->first == name;
    if (!columns_.empty() && !replacing_only) {
        SVMF_THROW_IF(values.size() != size_, InvalidArgumentException,
                      "VariableBatch::setColumn: column '" + name + "' has " + std::to_string(values.size())
                      + " values, expected " + std::to_string(size_));
    }
    size_ = values.size();
    columns_.insert_or_assign(std::move(name), std::move(values));
    return *this;
}

bool VariableBatch::contains(std::string_view name) const
{
    return columns_.find(name) != columns_.end();
}

const VariableBatch::Column& VariableBatch::column(std::string_view name) const
{
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        SVMF_THROW(UnboundVariableException, std::string(name));
    }
    return it->second;
}

VariableContext VariableBatch::contextAt(std::size_t i) const
{
    SVMF_THROW_IF(i >= size_, InvalidArgumentException,
                  "VariableBatch::contextAt: index " + std::to_string(i) + " out of range");
    VariableContext ctx;
    for (const auto& [name, values] : columns_) {
        ctx.set(name, values[i]);
    }
    return ctx;
}

VariableBatch VariableBatch::fromContexts(const std::vector<VariableContext>& contexts)
{
    VariableBatch batch;
    if (contexts.empty()) {
        return batch;
    }

    // Only names bound at every point become columns.
    for (const auto& [name, first_value] : contexts.front().values()) {
        Column values;
        values.reserve(contexts.size());
        values.push_back(first_value);
        bool complete = true;
        for (std::size_t i = 1; i < contexts.size() && complete; ++i) {
            if (auto v = contexts[i].get(name)) {
                values.push_back(*v);
            } else {
                complete = false;
            }
        }
        if (complete) {
            batch.setColumn(name, std::move(values));
        }
    }
    batch.size_ = contexts.size();
    return batch;
}

} // namespace func
} // namespace svmf
