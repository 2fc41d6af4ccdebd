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
#include <chainbench/orchestrator/feedback.hpp>
#include <chainbench/orchestrator/run_state.hpp>
#include <chainbench/runtime/error_record.hpp>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

using namespace chainbench;

char const *suggestion_for(ErrorKind const kind)
{
    switch (kind) {
    case ErrorKind::CompileError:
        return "Check for syntax errors, missing imports, or typos in the "
               "skill code";
    case ErrorKind::InterfaceError:
        return "Export the entry point and return the base64 encoded "
               "unsigned transaction";
    case ErrorKind::RuntimeError:
        return "Inspect the trace and fix the failing call";
    case ErrorKind::PolicyViolation:
        return "Build exactly one transaction per turn and split larger "
               "work across turns";
    case ErrorKind::Timeout:
        return "Return the transaction sooner; avoid long running network "
               "calls";
    case ErrorKind::SubmissionRejected:
        return "Use the provided blockhash and the agent as the only signer";
    case ErrorKind::OnChainFailure:
        return "Read the program logs to find the failing instruction";
    case ErrorKind::FatalBridgeError:
        break;
    }
    return "";
}

std::string progress_line(TurnRecord const &record, uint64_t const budget)
{
    uint64_t const remaining =
        budget > record.index ? budget - record.index : 0;
    return fmt::format(
        "[Message {}/{}] - {} messages remaining",
        record.index,
        budget,
        remaining);
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

TurnFeedback make_feedback(
    TurnRecord const &record, uint64_t const budget,
    ErrorRecord const *const error, std::vector<std::string> const &logs)
{
    TurnFeedback feedback;

    auto keys = nlohmann::json::array();
    for (auto const &key : record.new_keys) {
        keys.push_back(key.to_string());
    }
    feedback.fields = {
        {"turn", record.index},
        {"budget", budget},
        {"remaining", budget > record.index ? budget - record.index : 0},
        {"outcome", record.outcome()},
        {"reward", record.reward_delta},
        {"total_reward", record.cumulative_reward},
        {"new_keys", keys},
        {"logs", logs}};
    if (error != nullptr) {
        feedback.fields["error"] = to_json(*error);
    }

    if (error == nullptr) {
        feedback.message = fmt::format(
            "Transaction executed successfully! Earned {} reward points.\n"
            "Total rewards: {}\n{}",
            record.reward_delta,
            record.cumulative_reward,
            progress_line(record, budget));
        if (!record.new_keys.empty()) {
            feedback.message +=
                fmt::format("\nNew instructions: {}", keys.dump());
        }
    }
    else if (error->kind() == ErrorKind::OnChainFailure) {
        feedback.message = fmt::format(
            "Transaction failed: {}\n{}",
            std::get<OnChainFailure>(error->payload).error,
            progress_line(record, budget));
    }
    else {
        nlohmann::json const body{
            {"error", "Skill execution failed"},
            {"details", to_json(*error)},
            {"suggestion", suggestion_for(error->kind())}};
        feedback.message = fmt::format(
            "{}\n{}",
            body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
            progress_line(record, budget));
    }
    if (!logs.empty()) {
        feedback.message += "\nLogs:";
        for (auto const &line : logs) {
            feedback.message += "\n  ";
            feedback.message += line;
        }
    }
    return feedback;
}

CHAINBENCH_NAMESPACE_END
