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
#include <chainbench/orchestrator/run_state.hpp>
#include <chainbench/orchestrator/turn_state.hpp>
#include <chainbench/runtime/error_record.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <string>
#include <utility>

CHAINBENCH_NAMESPACE_BEGIN

std::string TurnRecord::outcome() const
{
    if (!error.has_value()) {
        return "success";
    }
    return std::string{to_string(*error)};
}

RunSummary RunState::summary() const
{
    return RunSummary{
        .run_id = run_id,
        .model = model,
        .turns_completed = turn_index,
        .budget = budget,
        .cumulative_reward = cumulative_reward,
        .distinct_keys = ledger.size(),
        .termination_reason =
            termination.value_or(TerminationReason::BudgetExhausted),
        .fatal_error = fatal_error};
}

std::string format_timestamp(std::chrono::system_clock::time_point const tp)
{
    auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch())
                        .count() %
                    1000;
    std::time_t const t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", tm, ms);
}

nlohmann::json to_json(TurnRecord const &record)
{
    auto keys = nlohmann::json::array();
    for (auto const &key : record.new_keys) {
        keys.push_back(key.to_string());
    }
    return {
        {"index", record.index},
        {"timestamp", format_timestamp(record.timestamp)},
        {"duration", static_cast<double>(record.duration.count()) / 1000.0},
        {"reward", record.reward_delta},
        {"total_reward", record.cumulative_reward},
        {"outcome", record.outcome()},
        {"instructions_discovered", std::move(keys)}};
}

nlohmann::json to_json(RunSummary const &summary)
{
    return {
        {"run_id", summary.run_id},
        {"model", summary.model},
        {"turns_completed", summary.turns_completed},
        {"budget", summary.budget},
        {"cumulative_reward", summary.cumulative_reward},
        {"distinct_keys", summary.distinct_keys},
        {"termination_reason",
         std::string{to_string(summary.termination_reason)}},
        {"fatal_error",
         summary.fatal_error.has_value() ? nlohmann::json(*summary.fatal_error)
                                         : nlohmann::json(nullptr)}};
}

CHAINBENCH_NAMESPACE_END
