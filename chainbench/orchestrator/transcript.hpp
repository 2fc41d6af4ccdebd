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
#include <chainbench/core/result.hpp>
#include <chainbench/ledger/discovery_ledger.hpp>
#include <chainbench/orchestrator/run_state.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

// <output_dir>/<run_id>_metrics.json
std::filesystem::path transcript_path(
    std::filesystem::path const &output_dir, std::string_view run_id);

nlohmann::json transcript_json(RunState const &);

// Written to a temporary sibling first and renamed over the target, so a
// reader never observes a partial file. Failures are logged with the path and
// leave any previous transcript in place.
Result<void>
write_transcript(std::filesystem::path const &, nlohmann::json const &);

struct ReplayedRun
{
    std::vector<uint64_t> cumulative_rewards{};
    DiscoveryLedger ledger{};
};

// Rebuilds the ledger from the per turn discoveries and checks that every
// reward and running total agrees with it
Result<ReplayedRun> replay_transcript(nlohmann::json const &);

CHAINBENCH_NAMESPACE_END
