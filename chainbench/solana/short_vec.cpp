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

#include <chainbench/core/byte_string.hpp>
#include <chainbench/core/likely.h>
#include <chainbench/core/result.hpp>
#include <chainbench/solana/config.hpp>
#include <chainbench/solana/short_vec.hpp>
#include <chainbench/solana/transaction_error.hpp>

#include <cstdint>

CHAINBENCH_SOLANA_NAMESPACE_BEGIN

void encode_short_vec(byte_string &out, uint16_t value)
{
    for (;;) {
        uint8_t byte = value & 0x7f;
        value >>= 7;
        if (value == 0) {
            out.push_back(byte);
            return;
        }
        out.push_back(byte | 0x80);
    }
}

Result<uint16_t> decode_short_vec(byte_string_view &in)
{
    uint32_t value = 0;
    for (unsigned i = 0; i < 3; ++i) {
        if (CHAINBENCH_UNLIKELY(in.empty())) {
            return TransactionError::InputTooShort;
        }
        uint8_t const byte = in.front();
        in.remove_prefix(1);
        value |= static_cast<uint32_t>(byte & 0x7f) << (7 * i);
        if ((byte & 0x80) == 0) {
            // the third byte may only carry the top two bits
            if (CHAINBENCH_UNLIKELY(value > 0xffff)) {
                return TransactionError::ShortVecOverflow;
            }
            return static_cast<uint16_t>(value);
        }
    }
    return TransactionError::ShortVecOverflow;
}

CHAINBENCH_SOLANA_NAMESPACE_END
