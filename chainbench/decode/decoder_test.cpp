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

#include <chainbench/decode/decode_error.hpp>
#include <chainbench/decode/decoder.hpp>
#include <chainbench/decode/instruction_key.hpp>
#include <chainbench/decode/receipt.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <vector>

using namespace chainbench;

TEST(decoder, keys_follow_execution_order)
{
    TransactionReceipt receipt;
    receipt.success = true;
    receipt.account_keys = {"Payer", "A", "B"};
    receipt.instructions = {
        {1, {0x00, 0xff}, 1},
        {2, {0x07}, 2},
        {1, {0x00}, 1},
        {2, {}, 1}};

    auto const keys = decode(receipt);
    ASSERT_TRUE(keys.has_value());
    EXPECT_EQ(
        keys.value(),
        (std::vector<InstructionKey>{
            {"A", 0x00}, {"B", 0x07}, {"A", 0x00}, {"B", std::nullopt}}));
}

TEST(decoder, empty_receipt)
{
    auto const keys = decode(TransactionReceipt{});
    ASSERT_TRUE(keys.has_value());
    EXPECT_TRUE(keys.value().empty());
}

TEST(decoder, program_index_out_of_range)
{
    TransactionReceipt receipt;
    receipt.account_keys = {"Payer", "A"};
    receipt.instructions = {{1, {0x01}, 1}, {2, {0x01}, 1}};

    auto const keys = decode(receipt);
    ASSERT_TRUE(keys.has_error());
    EXPECT_EQ(keys.error(), DecodeError::ProgramIndexOutOfRange);
}
