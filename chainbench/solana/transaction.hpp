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
#include <chainbench/solana/public_key.hpp>

#include <cstdint>
#include <optional>
#include <vector>

CHAINBENCH_SOLANA_NAMESPACE_BEGIN

struct MessageHeader
{
    uint8_t num_required_signatures{0};
    uint8_t num_readonly_signed_accounts{0};
    uint8_t num_readonly_unsigned_accounts{0};
};

struct CompiledInstruction
{
    uint8_t program_id_index{0};
    std::vector<uint8_t> accounts{};
    byte_string data{};
};

struct AddressTableLookup
{
    PublicKey account_key{};
    std::vector<uint8_t> writable_indexes{};
    std::vector<uint8_t> readonly_indexes{};
};

struct Message
{
    // std::nullopt for legacy messages, otherwise the versioned prefix
    std::optional<uint8_t> version{};
    MessageHeader header{};
    std::vector<PublicKey> account_keys{};
    Hash recent_blockhash{};
    std::vector<CompiledInstruction> instructions{};
    std::vector<AddressTableLookup> address_table_lookups{};

    bool is_signer(size_t index) const;
    bool is_writable(size_t index) const;
};

struct Transaction
{
    std::vector<Signature> signatures{};
    Message message{};
    // exact serialized message, which is what signatures cover
    byte_string message_bytes{};
};

struct AccountMeta
{
    PublicKey pubkey{};
    bool is_signer{false};
    bool is_writable{false};
};

struct Instruction
{
    PublicKey program_id{};
    std::vector<AccountMeta> accounts{};
    byte_string data{};
};

byte_string encode_message(Message const &);
Result<Message> decode_message(byte_string_view);

byte_string encode_transaction(Transaction const &);
Result<Transaction> decode_transaction(byte_string_view);

// Orders accounts as the runtime expects: fee payer first, then signer
// writable, signer readonly, non-signer writable, non-signer readonly, each
// group in order of first appearance.
Result<Message> compile_message(
    PublicKey const &fee_payer, std::vector<Instruction> const &,
    Hash const &recent_blockhash);

// A transaction with every required signature slot zeroed
byte_string make_unsigned_transaction(Message const &);

Instruction system_transfer(
    PublicKey const &from, PublicKey const &to, uint64_t lamports);

CHAINBENCH_SOLANA_NAMESPACE_END
