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

#include <chainbench/core/config.hpp>
#include <chainbench/orchestrator/turn_state.hpp>

#include <boost/describe/enum_from_string.hpp>
#include <boost/describe/enum_to_string.hpp>

#include <optional>
#include <string>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

bool is_valid_transition(TurnState const from, TurnState const to)
{
    // cancellation and fatal errors may end a run from anywhere
    if (to == TurnState::Terminated) {
        return from != TurnState::Terminated;
    }
    switch (from) {
    case TurnState::AwaitingCode:
        return to == TurnState::Executing;
    case TurnState::Executing:
        return to == TurnState::Submitting || to == TurnState::Feedback;
    case TurnState::Submitting:
        return to == TurnState::Scoring || to == TurnState::Feedback;
    case TurnState::Scoring:
        return to == TurnState::Feedback;
    case TurnState::Feedback:
        return to == TurnState::AwaitingCode;
    case TurnState::Terminated:
        return false;
    }
    return false;
}

std::string_view to_string(TurnState const state)
{
    return boost::describe::enum_to_string(state, "Unknown");
}

std::string_view to_string(TerminationReason const reason)
{
    return boost::describe::enum_to_string(reason, "Unknown");
}

std::optional<TerminationReason>
termination_reason_from_string(std::string_view const s)
{
    TerminationReason reason{};
    if (!boost::describe::enum_from_string(std::string{s}.c_str(), reason)) {
        return std::nullopt;
    }
    return reason;
}

CHAINBENCH_NAMESPACE_END
