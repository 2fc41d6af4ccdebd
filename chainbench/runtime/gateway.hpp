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
#include <chainbench/runtime/code_unit.hpp>
#include <chainbench/runtime/execution_result.hpp>
#include <chainbench/solana/public_key.hpp>

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>

CHAINBENCH_NAMESPACE_BEGIN

struct ExecutionContext
{
    std::string run_id{};
    uint64_t turn{0};
    solana::PublicKey identity{};
    std::string freshness_token{};
};

// Executes one untrusted code unit under a timeout. Implementations never
// return a transaction once the timeout expired or the stop token fired.
class RuntimeGateway
{
public:
    virtual ~RuntimeGateway() = default;

    virtual ExecutionResult execute(
        CodeUnit const &, std::chrono::milliseconds timeout,
        ExecutionContext const &, std::stop_token) = 0;
};

CHAINBENCH_NAMESPACE_END
