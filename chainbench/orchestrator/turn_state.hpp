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

#include <chainbench/core/config.hpp>
#include <chainbench/core/fmt.hpp>

#include <boost/describe/enum.hpp>

#include <optional>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

enum class TurnState
{
    AwaitingCode,
    Executing,
    Submitting,
    Scoring,
    Feedback,
    Terminated,
};

BOOST_DESCRIBE_ENUM(
    TurnState, AwaitingCode, Executing, Submitting, Scoring, Feedback,
    Terminated)

enum class TerminationReason
{
    BudgetExhausted,
    FatalBridgeError,
    Cancelled,
};

BOOST_DESCRIBE_ENUM(
    TerminationReason, BudgetExhausted, FatalBridgeError, Cancelled)

bool is_valid_transition(TurnState from, TurnState to);

std::string_view to_string(TurnState);
std::string_view to_string(TerminationReason);
std::optional<TerminationReason>
termination_reason_from_string(std::string_view);

CHAINBENCH_NAMESPACE_END
