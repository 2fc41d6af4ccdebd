// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <chainbench/core/byte_string.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/runtime/error_record.hpp>

#include <utility>
#include <variant>

CHAINBENCH_NAMESPACE_BEGIN

// Outcome of executing one code unit: either exactly one serialized
// (unsigned) transaction or an error record, never both
class ExecutionResult
{
    std::variant<byte_string, ErrorRecord> value_;

    explicit ExecutionResult(std::variant<byte_string, ErrorRecord> value)
        : value_{std::move(value)}
    {
    }

public:
    static ExecutionResult success(byte_string serialized_transaction)
    {
        return ExecutionResult{std::move(serialized_transaction)};
    }

    static ExecutionResult failure(ErrorRecord error)
    {
        return ExecutionResult{std::move(error)};
    }

    bool has_transaction() const
    {
        return std::holds_alternative<byte_string>(value_);
    }

    byte_string const &transaction() const
    {
        return std::get<byte_string>(value_);
    }

    ErrorRecord const &error() const
    {
        return std::get<ErrorRecord>(value_);
    }
};

CHAINBENCH_NAMESPACE_END
