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
#include <chainbench/process/subprocess.hpp>
#include <chainbench/runtime/code_unit.hpp>
#include <chainbench/runtime/skill_context.hpp>
#include <chainbench/solana/public_key.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>

CHAINBENCH_NAMESPACE_BEGIN

// One line of runner output: {"serialized_tx": "..."} with exit code 0, or
// {"serialized_tx": null, "error", "details", "type"} with exit code 1
struct SkillReport
{
    int exit_code{1};
    nlohmann::json body{};
};

SkillReport host_skill(SkillEntry const &, SkillContext &);

nlohmann::json make_failure_report(
    std::string const &type, std::string const &error,
    std::string const &details);

// Produces the report for one execution against the given context
using SkillHost = std::function<SkillReport(SkillContext &)>;

// Runs the host in a forked child against a fresh SkillContext. The child's
// report line is returned as stdout_text.
ProcessResult run_hosted_forked(
    SkillHost const &, solana::PublicKey const &identity,
    std::string const &freshness_token, std::chrono::milliseconds timeout,
    uint64_t transactions_per_turn, size_t max_output_bytes,
    std::stop_token = {});

ProcessResult run_skill_forked(
    SkillEntry const &, solana::PublicKey const &identity,
    std::string const &freshness_token, std::chrono::milliseconds timeout,
    uint64_t transactions_per_turn, size_t max_output_bytes,
    std::stop_token = {});

CHAINBENCH_NAMESPACE_END
