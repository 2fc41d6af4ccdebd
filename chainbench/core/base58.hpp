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
#include <chainbench/core/config.hpp>

#include <optional>
#include <string>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

// Bitcoin alphabet, as used for Solana public keys, signatures, blockhashes
// and instruction data in json encoded transactions
std::string base58_encode(byte_string_view);

std::optional<byte_string> base58_decode(std::string_view);

CHAINBENCH_NAMESPACE_END
