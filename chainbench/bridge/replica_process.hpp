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
#include <chainbench/process/background_process.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

struct ReplicaConfig
{
    std::string command{"surfpool"};
    // network the replica forks its state from
    std::string upstream_url{"https://api.mainnet-beta.solana.com"};
    std::string ready_banner{"Connection established."};
    std::chrono::milliseconds startup_timeout{std::chrono::seconds{120}};
    std::chrono::milliseconds shutdown_grace{std::chrono::seconds{8}};
};

// Owns a running replica (surfpool start --no-tui -u <upstream>). The whole
// process group is terminated on destruction.
class ReplicaProcess
{
    ReplicaConfig config_;
    BackgroundProcess process_;

    explicit ReplicaProcess(ReplicaConfig);

public:
    ~ReplicaProcess();

    // Returns once the ready banner was printed
    static Result<std::unique_ptr<ReplicaProcess>> launch(ReplicaConfig);

    std::vector<std::string> command_line() const;
};

CHAINBENCH_NAMESPACE_END
