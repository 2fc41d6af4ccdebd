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
#include <chainbench/solana/public_key.hpp>
#include <chainbench/solana/transaction.hpp>
#include <chainbench/solana/transaction_error.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace chainbench;
using namespace chainbench::solana;

namespace
{
    PublicKey key(uint8_t const fill)
    {
        PublicKey k;
        k.bytes.fill(fill);
        return k;
    }
}

TEST(transaction, system_transfer_layout)
{
    auto const ix = system_transfer(key(1), key(2), 1'000'000'000);
    EXPECT_EQ(ix.program_id, SYSTEM_PROGRAM_ID);
    ASSERT_EQ(ix.accounts.size(), 2);
    EXPECT_TRUE(ix.accounts[0].is_signer);
    EXPECT_TRUE(ix.accounts[0].is_writable);
    EXPECT_FALSE(ix.accounts[1].is_signer);
    EXPECT_TRUE(ix.accounts[1].is_writable);
    EXPECT_EQ(
        ix.data,
        (byte_string{
            0x02, 0x00, 0x00, 0x00, 0x00, 0xca, 0x9a, 0x3b, 0x00, 0x00, 0x00,
            0x00}));
}

TEST(transaction, compile_orders_accounts)
{
    PublicKey const payer = key(1);
    PublicKey const program = key(9);
    Instruction ix;
    ix.program_id = program;
    ix.accounts = {
        {key(5), false, false},
        {key(4), false, true},
        {key(3), true, false},
        {payer, true, true}};
    ix.data = {0x07};

    auto const msg = compile_message(payer, {ix}, key(0xbb));
    ASSERT_TRUE(msg.has_value());
    auto const &m = msg.value();
    ASSERT_EQ(m.account_keys.size(), 5);
    EXPECT_EQ(m.account_keys[0], payer);
    EXPECT_EQ(m.account_keys[1], key(3));
    EXPECT_EQ(m.account_keys[2], key(4));
    EXPECT_EQ(m.account_keys[3], key(5));
    EXPECT_EQ(m.account_keys[4], program);
    EXPECT_EQ(m.header.num_required_signatures, 2);
    EXPECT_EQ(m.header.num_readonly_signed_accounts, 1);
    EXPECT_EQ(m.header.num_readonly_unsigned_accounts, 2);

    EXPECT_TRUE(m.is_signer(0));
    EXPECT_TRUE(m.is_writable(0));
    EXPECT_TRUE(m.is_signer(1));
    EXPECT_FALSE(m.is_writable(1));
    EXPECT_FALSE(m.is_signer(2));
    EXPECT_TRUE(m.is_writable(2));
    EXPECT_FALSE(m.is_writable(3));
    EXPECT_FALSE(m.is_writable(4));

    ASSERT_EQ(m.instructions.size(), 1);
    EXPECT_EQ(m.instructions[0].program_id_index, 4);
    EXPECT_EQ(m.instructions[0].accounts, (std::vector<uint8_t>{3, 2, 1, 0}));
    EXPECT_EQ(m.instructions[0].data, (byte_string{0x07}));
}

TEST(transaction, unsigned_transaction_decodes)
{
    auto const msg =
        compile_message(key(1), {system_transfer(key(1), key(2), 5)}, key(7));
    ASSERT_TRUE(msg.has_value());

    auto const bytes = make_unsigned_transaction(msg.value());
    // one zeroed signature slot
    EXPECT_EQ(bytes[0], 1);

    auto const tx = decode_transaction(bytes);
    ASSERT_TRUE(tx.has_value());
    EXPECT_EQ(tx.value().signatures.size(), 1);
    EXPECT_EQ(tx.value().signatures[0], Signature{});
    EXPECT_FALSE(tx.value().message.version.has_value());
    EXPECT_EQ(tx.value().message.recent_blockhash, key(7));
    EXPECT_EQ(tx.value().message.account_keys.size(), 3);
    EXPECT_EQ(tx.value().message_bytes, encode_message(msg.value()));
    EXPECT_EQ(encode_transaction(tx.value()), bytes);
}

TEST(transaction, versioned_message)
{
    Message msg;
    msg.version = 0;
    msg.header.num_required_signatures = 1;
    msg.account_keys = {key(1), key(2)};
    msg.instructions.push_back({1, {0}, {0x01, 0x02}});
    msg.address_table_lookups.push_back({key(3), {0, 1}, {2}});

    auto const bytes = encode_message(msg);
    EXPECT_EQ(bytes[0], 0x80);
    auto const decoded = decode_message(bytes);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded.value().version.has_value());
    EXPECT_EQ(*decoded.value().version, 0);
    ASSERT_EQ(decoded.value().address_table_lookups.size(), 1);
    EXPECT_EQ(
        decoded.value().address_table_lookups[0].writable_indexes,
        (std::vector<uint8_t>{0, 1}));
    EXPECT_EQ(encode_message(decoded.value()), bytes);
}

TEST(transaction, decode_errors)
{
    Message msg;
    msg.header.num_required_signatures = 1;
    msg.account_keys = {key(1)};
    auto bytes = encode_message(msg);

    auto trailing = bytes;
    trailing.push_back(0);
    auto const r1 = decode_message(trailing);
    ASSERT_TRUE(r1.has_error());
    EXPECT_EQ(r1.error(), TransactionError::TrailingBytes);

    auto const r2 = decode_message(byte_string_view{bytes}.substr(0, 20));
    ASSERT_TRUE(r2.has_error());
    EXPECT_EQ(r2.error(), TransactionError::InputTooShort);

    auto v1 = bytes;
    v1.insert(v1.begin(), 0x81);
    auto const r3 = decode_message(v1);
    ASSERT_TRUE(r3.has_error());
    EXPECT_EQ(r3.error(), TransactionError::UnsupportedVersion);

    auto bad_header = bytes;
    bad_header[0] = 2;
    auto const r4 = decode_message(bad_header);
    ASSERT_TRUE(r4.has_error());
    EXPECT_EQ(r4.error(), TransactionError::InvalidHeader);

    EXPECT_TRUE(decode_transaction({}).has_error());
}
