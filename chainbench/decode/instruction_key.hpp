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
#include <chainbench/core/fmt.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

// Reward identity of an executed instruction. An empty discriminator stands
// for empty instruction data and orders before every byte value.
struct InstructionKey
{
    std::string program_id{};
    std::optional<uint8_t> discriminator{};

    // "<program_id>:<byte>" or "<program_id>:none"
    std::string to_string() const;

    static std::optional<InstructionKey> parse(std::string_view);

    friend auto
    operator<=>(InstructionKey const &, InstructionKey const &) = default;
    friend bool
    operator==(InstructionKey const &, InstructionKey const &) = default;
};

CHAINBENCH_NAMESPACE_END

template <>
struct fmt::formatter<chainbench::InstructionKey> : public FmtDefaultParse
{
    auto
    format(chainbench::InstructionKey const &key, format_context &ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", key.to_string());
    }
};
