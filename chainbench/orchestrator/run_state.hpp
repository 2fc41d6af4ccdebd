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
#include <chainbench/decode/instruction_key.hpp>
#include <chainbench/ledger/discovery_ledger.hpp>
#include <chainbench/orchestrator/turn_state.hpp>
#include <chainbench/runtime/error_record.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

struct TurnRecord
{
    // 1-based
    uint64_t index{0};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::milliseconds duration{0};
    uint64_t reward_delta{0};
    uint64_t cumulative_reward{0};
    std::vector<InstructionKey> new_keys{};
    // std::nullopt when the transaction executed successfully
    std::optional<ErrorKind> error{};

    // "success" or the error kind
    std::string outcome() const;
};

struct RunSummary
{
    std::string run_id{};
    std::string model{};
    uint64_t turns_completed{0};
    uint64_t budget{0};
    uint64_t cumulative_reward{0};
    uint64_t distinct_keys{0};
    TerminationReason termination_reason{TerminationReason::BudgetExhausted};
    std::optional<std::string> fatal_error{};
};

// Error record of a turn, kept for the persisted transcript
struct TurnError
{
    uint64_t turn{0};
    nlohmann::json error{};
};

struct RunState
{
    std::string run_id{};
    std::string model{};
    uint64_t turn_index{0};
    uint64_t budget{0};
    uint64_t cumulative_reward{0};
    DiscoveryLedger ledger{};
    std::vector<TurnRecord> transcript{};
    std::vector<TurnError> errors{};
    TurnState state{TurnState::AwaitingCode};
    std::optional<TerminationReason> termination{};
    std::optional<std::string> fatal_error{};

    RunSummary summary() const;
};

std::string format_timestamp(std::chrono::system_clock::time_point);

nlohmann::json to_json(TurnRecord const &);
nlohmann::json to_json(RunSummary const &);

CHAINBENCH_NAMESPACE_END
