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
#include <chainbench/orchestrator/run_state.hpp>
#include <chainbench/runtime/error_record.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

// What the generator sees about the previous turn: a human readable message
// plus the same facts as machine readable fields
struct TurnFeedback
{
    std::string message{};
    nlohmann::json fields{};
};

// Deterministic for equal inputs. error is null for successful turns; logs
// are the program logs of an executed transaction.
TurnFeedback make_feedback(
    TurnRecord const &, uint64_t budget, ErrorRecord const *error,
    std::vector<std::string> const &logs);

CHAINBENCH_NAMESPACE_END
