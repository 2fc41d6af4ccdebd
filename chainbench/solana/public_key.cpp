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

#include <chainbench/core/base58.hpp>
#include <chainbench/core/byte_string.hpp>
#include <chainbench/solana/config.hpp>
#include <chainbench/solana/public_key.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

CHAINBENCH_SOLANA_NAMESPACE_BEGIN

std::string PublicKey::to_base58() const
{
    return base58_encode(view());
}

std::optional<PublicKey> PublicKey::from_base58(std::string_view const s)
{
    auto const decoded = base58_decode(s);
    if (!decoded.has_value()) {
        return std::nullopt;
    }
    return from_bytes(*decoded);
}

std::optional<PublicKey> PublicKey::from_bytes(byte_string_view const b)
{
    if (b.size() != PUBLIC_KEY_SIZE) {
        return std::nullopt;
    }
    PublicKey key;
    std::copy(b.begin(), b.end(), key.bytes.begin());
    return key;
}

CHAINBENCH_SOLANA_NAMESPACE_END
