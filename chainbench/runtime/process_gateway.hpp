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
#include <chainbench/runtime/gateway.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

struct ProcessGatewayConfig
{
    // e.g. {"bun", "runSkill.ts"} or {"chainbench-skill-runner"}
    std::vector<std::string> runner{};
    std::filesystem::path artifact_root{"code"};
    // allowance for the runner to start before its own timer begins
    std::chrono::milliseconds startup_grace{std::chrono::seconds{5}};
    size_t max_output_bytes{1 << 20};
};

// Writes the code unit to disk and hands it to an external runner process,
// which is killed with its whole process group once the deadline passes
class ProcessGateway final : public RuntimeGateway
{
    ProcessGatewayConfig config_;

public:
    explicit ProcessGateway(ProcessGatewayConfig);

    ExecutionResult execute(
        CodeUnit const &, std::chrono::milliseconds timeout,
        ExecutionContext const &, std::stop_token) override;
};

CHAINBENCH_NAMESPACE_END
