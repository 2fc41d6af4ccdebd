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
#include <chainbench/core/result.hpp>
#include <chainbench/solana/config.hpp>

#include <cstdint>

CHAINBENCH_SOLANA_NAMESPACE_BEGIN

// Compact-u16 length prefix: seven bits per byte, little endian, at most
// three bytes
void encode_short_vec(byte_string &, uint16_t);

// Consumes the prefix from the front of the view
Result<uint16_t> decode_short_vec(byte_string_view &);

CHAINBENCH_SOLANA_NAMESPACE_END
