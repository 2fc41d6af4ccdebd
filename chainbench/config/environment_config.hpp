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

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

CHAINBENCH_NAMESPACE_BEGIN

// Optional per environment defaults; command line flags override them
struct EnvironmentConfig
{
    std::string name{"solana"};
    uint64_t timeout_ms{30'000};
    uint64_t starting_lamports{2'000'000'000};
    uint64_t max_turns{50};
};

// Absent fields keep their defaults. std::nullopt if a field has the wrong
// type or the document is not an object.
std::optional<EnvironmentConfig>
parse_environment_config(nlohmann::json const &);

std::optional<EnvironmentConfig>
load_environment_config(std::filesystem::path const &);

CHAINBENCH_NAMESPACE_END
