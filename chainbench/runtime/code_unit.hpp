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
#include <chainbench/runtime/skill_context.hpp>

#include <functional>
#include <string>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

// Native form of the code unit contract: takes the freshness token and
// returns the base64 encoded unsigned transaction, or throws
using SkillEntry = std::function<std::string(SkillContext &, std::string_view)>;

// Shared objects loaded by the skill runner export this symbol with C
// linkage and the signature below
using SkillEntryFn = std::string(SkillContext &, std::string_view);
inline constexpr char const *SKILL_ENTRY_SYMBOL = "chainbench_skill_entry";

struct CodeUnit
{
    std::string source{};
    // artifact file extension, including the dot
    std::string extension{".cpp"};
    // only consulted by in process gateways
    SkillEntry entry{};
};

CHAINBENCH_NAMESPACE_END
