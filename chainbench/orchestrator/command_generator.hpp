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
#include <chainbench/orchestrator/code_generator.hpp>

#include <chrono>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

struct CommandGeneratorConfig
{
    std::vector<std::string> command{};
    std::chrono::milliseconds timeout{std::chrono::minutes{5}};
    std::string extension{".cpp"};
};

// Runs an external command per turn. The request, including the previous
// turn's feedback, is written to its stdin as JSON; its stdout is the code,
// optionally wrapped in a fenced code block.
class CommandGenerator final : public CodeGenerator
{
    CommandGeneratorConfig config_;

public:
    explicit CommandGenerator(CommandGeneratorConfig);

    CodeUnit generate(GenerationRequest const &, std::stop_token) override;
};

// First fenced block of a reply, or the whole reply if it has none
std::string extract_code_block(std::string_view);

CHAINBENCH_NAMESPACE_END
