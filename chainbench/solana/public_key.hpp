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

#include <chainbench/core/byte_string.hpp>
#include <chainbench/core/fmt.hpp>
#include <chainbench/solana/config.hpp>

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

CHAINBENCH_SOLANA_NAMESPACE_BEGIN

inline constexpr size_t PUBLIC_KEY_SIZE = 32;
inline constexpr size_t SIGNATURE_SIZE = 64;

struct PublicKey
{
    std::array<uint8_t, PUBLIC_KEY_SIZE> bytes{};

    std::string to_base58() const;

    byte_string_view view() const
    {
        return {bytes.data(), bytes.size()};
    }

    static std::optional<PublicKey> from_base58(std::string_view);
    static std::optional<PublicKey> from_bytes(byte_string_view);

    friend auto operator<=>(PublicKey const &, PublicKey const &) = default;
};

// Blockhashes share the 32 byte base58 representation of keys
using Hash = PublicKey;

using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

// 11111111111111111111111111111111
inline constexpr PublicKey SYSTEM_PROGRAM_ID{};

CHAINBENCH_SOLANA_NAMESPACE_END

template <>
struct fmt::formatter<chainbench::solana::PublicKey> : public FmtDefaultParse
{
    auto format(
        chainbench::solana::PublicKey const &key, format_context &ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", key.to_base58());
    }
};
