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
#include <chainbench/runtime/native_skill.hpp>
#include <chainbench/runtime/skill_context.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stop_token>

CHAINBENCH_NAMESPACE_BEGIN

struct ForkGatewayConfig
{
    std::filesystem::path artifact_root{"code"};
    uint64_t transactions_per_turn{TRANSACTIONS_PER_TURN};
    size_t max_output_bytes{1 << 20};
    NativeSkillConfig native{};
};

// Runs the code unit's native entry point in a forked child, so a runaway
// unit can be killed without taking the harness down. A unit without an
// entry whose extension names C++ source is compiled into a module first and
// loaded inside the child.
class ForkGateway final : public RuntimeGateway
{
    ForkGatewayConfig config_;

public:
    explicit ForkGateway(ForkGatewayConfig);

    ExecutionResult execute(
        CodeUnit const &, std::chrono::milliseconds timeout,
        ExecutionContext const &, std::stop_token) override;
};

CHAINBENCH_NAMESPACE_END
