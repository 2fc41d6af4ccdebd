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

#include <chainbench/core/config.hpp>
#include <chainbench/core/likely.h>
#include <chainbench/core/result.hpp>
#include <chainbench/decode/decode_error.hpp>
#include <chainbench/decode/decoder.hpp>
#include <chainbench/decode/instruction_key.hpp>
#include <chainbench/decode/receipt.hpp>

#include <optional>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

Result<std::vector<InstructionKey>> decode(TransactionReceipt const &receipt)
{
    std::vector<InstructionKey> keys;
    keys.reserve(receipt.instructions.size());
    for (auto const &ix : receipt.instructions) {
        if (CHAINBENCH_UNLIKELY(
                ix.program_id_index >= receipt.account_keys.size())) {
            return DecodeError::ProgramIndexOutOfRange;
        }
        keys.push_back(InstructionKey{
            .program_id = receipt.account_keys[ix.program_id_index],
            .discriminator = ix.data.empty()
                                 ? std::nullopt
                                 : std::optional<uint8_t>{ix.data.front()}});
    }
    return keys;
}

CHAINBENCH_NAMESPACE_END
