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
#include <chainbench/core/result.hpp>
#include <chainbench/decode/instruction_key.hpp>
#include <chainbench/ledger/discovery_ledger.hpp>
#include <chainbench/orchestrator/run_state.hpp>
#include <chainbench/orchestrator/transcript.hpp>
#include <chainbench/orchestrator/transcript_error.hpp>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <unistd.h>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

using namespace chainbench;

std::optional<uint64_t>
get_unsigned(nlohmann::json const &object, char const *const key)
{
    auto const it = object.find(key);
    if (it == object.end() || !it->is_number_unsigned()) {
        return std::nullopt;
    }
    return it->get<uint64_t>();
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

std::filesystem::path transcript_path(
    std::filesystem::path const &output_dir, std::string_view const run_id)
{
    return output_dir / fmt::format("{}_metrics.json", run_id);
}

nlohmann::json transcript_json(RunState const &run)
{
    auto rewards = nlohmann::json::array();
    auto messages = nlohmann::json::array();
    for (auto const &record : run.transcript) {
        rewards.push_back(record.cumulative_reward);
        messages.push_back(to_json(record));
    }
    auto discovered = nlohmann::json::object();
    for (auto const &[key, turn] : run.ledger.entries()) {
        discovered[key.to_string()] = turn;
    }
    auto errors = nlohmann::json::array();
    for (auto const &e : run.errors) {
        errors.push_back({{"turn", e.turn}, {"error", e.error}});
    }
    nlohmann::json j{
        {"run_id", run.run_id},
        {"model", run.model},
        {"budget", run.budget},
        {"cumulative_rewards", std::move(rewards)},
        {"messages", std::move(messages)},
        {"programs_discovered", std::move(discovered)},
        {"errors", std::move(errors)},
        {"termination", nullptr}};
    if (run.termination.has_value()) {
        j["termination"] = to_json(run.summary());
    }
    return j;
}

Result<void> write_transcript(
    std::filesystem::path const &path, nlohmann::json const &transcript)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR(
                "create {}: {}", path.parent_path().string(), ec.message());
            return TranscriptError::CreateDirectoryFailed;
        }
    }
    auto tmp = path;
    tmp += fmt::format(".tmp.{}", ::getpid());
    {
        std::ofstream out{tmp, std::ios::binary | std::ios::trunc};
        if (!out) {
            LOG_ERROR("open {} failed", tmp.string());
            return TranscriptError::OpenFailed;
        }
        out << transcript.dump(
                   2, ' ', false, nlohmann::json::error_handler_t::replace)
            << '\n';
        out.close();
        if (!out) {
            LOG_ERROR("write {} failed", tmp.string());
            std::filesystem::remove(tmp, ec);
            return TranscriptError::WriteFailed;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        LOG_ERROR("rename to {} failed: {}", path.string(), ec.message());
        std::filesystem::remove(tmp, ec);
        return TranscriptError::RenameFailed;
    }
    return success();
}

Result<ReplayedRun> replay_transcript(nlohmann::json const &transcript)
{
    if (!transcript.is_object()) {
        return TranscriptError::Malformed;
    }
    auto const messages = transcript.find("messages");
    auto const rewards = transcript.find("cumulative_rewards");
    auto const discovered = transcript.find("programs_discovered");
    if (messages == transcript.end() || !messages->is_array() ||
        rewards == transcript.end() || !rewards->is_array() ||
        discovered == transcript.end() || !discovered->is_object()) {
        return TranscriptError::Malformed;
    }
    if (rewards->size() != messages->size()) {
        return TranscriptError::RewardMismatch;
    }

    ReplayedRun run;
    uint64_t total = 0;
    uint64_t expected_index = 1;
    for (auto const &message : *messages) {
        if (!message.is_object()) {
            return TranscriptError::Malformed;
        }
        auto const index = get_unsigned(message, "index");
        auto const reward = get_unsigned(message, "reward");
        auto const total_reward = get_unsigned(message, "total_reward");
        auto const keys = message.find("instructions_discovered");
        if (!index.has_value() || !reward.has_value() ||
            !total_reward.has_value() || keys == message.end() ||
            !keys->is_array()) {
            return TranscriptError::Malformed;
        }
        if (*index != expected_index) {
            return TranscriptError::NonConsecutiveIndex;
        }

        std::vector<InstructionKey> parsed;
        for (auto const &key : *keys) {
            if (!key.is_string()) {
                return TranscriptError::Malformed;
            }
            auto k = InstructionKey::parse(key.get<std::string>());
            if (!k.has_value()) {
                return TranscriptError::Malformed;
            }
            parsed.push_back(std::move(*k));
        }
        auto const score = run.ledger.score(parsed, *index);
        // every listed key must have been new on this turn
        if (score.delta != *reward || score.new_keys.size() != parsed.size()) {
            return TranscriptError::RewardMismatch;
        }
        total += score.delta;
        auto const &recorded = (*rewards)[run.cumulative_rewards.size()];
        if (*total_reward != total || !recorded.is_number_unsigned() ||
            recorded.get<uint64_t>() != total) {
            return TranscriptError::RewardMismatch;
        }
        run.cumulative_rewards.push_back(total);
        ++expected_index;
    }

    std::map<std::string, uint64_t> expected;
    for (auto const &[key, turn] : run.ledger.entries()) {
        expected.emplace(key.to_string(), turn);
    }
    if (discovered->size() != expected.size()) {
        return TranscriptError::LedgerMismatch;
    }
    for (auto const &[key, turn] : discovered->items()) {
        auto const it = expected.find(key);
        if (it == expected.end() || !turn.is_number_unsigned() ||
            turn.get<uint64_t>() != it->second) {
            return TranscriptError::LedgerMismatch;
        }
    }
    return run;
}

CHAINBENCH_NAMESPACE_END
