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
#include <chainbench/decode/receipt_json.hpp>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace chainbench;
using json = nlohmann::json;

namespace
{
    // base58 "2" is the single byte 0x01, "4" is 0x03
    json const RECEIPT = json::parse(R"({
        "slot": 10,
        "meta": {
            "err": null,
            "logMessages": ["Program A invoke [1]", "Program A success"],
            "innerInstructions": [
                {"index": 0, "instructions": [
                    {"programIdIndex": 3, "accounts": [], "data": "4"},
                    {"programIdIndex": 2, "accounts": [], "data": "",
                     "stackHeight": 3}
                ]}
            ],
            "loadedAddresses": {"writable": ["W"], "readonly": ["R"]}
        },
        "transaction": {
            "signatures": ["sig1"],
            "message": {
                "accountKeys": ["Payer", "A", "B"],
                "instructions": [
                    {"programIdIndex": 1, "accounts": [0], "data": "2"},
                    {"programIdIndex": 2, "accounts": [], "data": "4"}
                ]
            }
        }
    })");
}

TEST(receipt_json, parse)
{
    auto const receipt = parse_receipt(RECEIPT);
    ASSERT_TRUE(receipt.has_value());
    auto const &r = receipt.value();
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(r.error.has_value());
    EXPECT_EQ(r.signature, "sig1");
    EXPECT_EQ(r.logs.size(), 2);
    EXPECT_EQ(
        r.account_keys,
        (std::vector<std::string>{"Payer", "A", "B", "W", "R"}));

    ASSERT_EQ(r.instructions.size(), 4);
    EXPECT_EQ(r.instructions[0].stack_height, 1);
    EXPECT_EQ(r.instructions[1].program_id_index, 3);
    EXPECT_EQ(r.instructions[1].stack_height, 2);
    EXPECT_EQ(r.instructions[2].stack_height, 3);
    EXPECT_TRUE(r.instructions[2].data.empty());
    EXPECT_EQ(r.instructions[3].program_id_index, 2);

    auto const keys = decode(r);
    ASSERT_TRUE(keys.has_value());
    EXPECT_EQ(
        keys.value(),
        (std::vector<InstructionKey>{
            {"A", 0x01}, {"W", 0x03}, {"B", std::nullopt}, {"B", 0x03}}));
}

TEST(receipt_json, failed_transaction)
{
    auto j = RECEIPT;
    j["meta"]["err"] = {{"InstructionError", {0, "InvalidAccountData"}}};
    auto const receipt = parse_receipt(j);
    ASSERT_TRUE(receipt.has_value());
    EXPECT_FALSE(receipt.value().success);
    ASSERT_TRUE(receipt.value().error.has_value());
    EXPECT_NE(
        receipt.value().error->find("InvalidAccountData"), std::string::npos);
}

TEST(receipt_json, errors)
{
    auto missing = RECEIPT;
    missing.erase("meta");
    auto const r1 = parse_receipt(missing);
    ASSERT_TRUE(r1.has_error());
    EXPECT_EQ(r1.error(), DecodeError::MissingField);

    auto bad_data = RECEIPT;
    bad_data["transaction"]["message"]["instructions"][0]["data"] = "0OIl";
    auto const r2 = parse_receipt(bad_data);
    ASSERT_TRUE(r2.has_error());
    EXPECT_EQ(r2.error(), DecodeError::InvalidBase58);

    auto bad_inner = RECEIPT;
    bad_inner["meta"]["innerInstructions"][0]["index"] = 5;
    auto const r3 = parse_receipt(bad_inner);
    ASSERT_TRUE(r3.has_error());
    EXPECT_EQ(r3.error(), DecodeError::InnerIndexOutOfRange);

    auto wrong_type = RECEIPT;
    wrong_type["transaction"]["message"]["accountKeys"] = "Payer";
    auto const r4 = parse_receipt(wrong_type);
    ASSERT_TRUE(r4.has_error());
    EXPECT_EQ(r4.error(), DecodeError::WrongType);
}
