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

#include <chainbench/core/assert.h>
#include <chainbench/core/byte_string.hpp>
#include <chainbench/core/likely.h>
#include <chainbench/core/result.hpp>
#include <chainbench/solana/config.hpp>
#include <chainbench/solana/public_key.hpp>
#include <chainbench/solana/short_vec.hpp>
#include <chainbench/solana/transaction.hpp>
#include <chainbench/solana/transaction_error.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

using namespace chainbench;
using namespace chainbench::solana;

constexpr uint8_t VERSION_PREFIX_MASK = 0x80;
constexpr size_t MAX_ACCOUNTS = 256;

Result<uint8_t> decode_u8(byte_string_view &in)
{
    if (CHAINBENCH_UNLIKELY(in.empty())) {
        return TransactionError::InputTooShort;
    }
    uint8_t const b = in.front();
    in.remove_prefix(1);
    return b;
}

Result<byte_string_view> decode_bytes(byte_string_view &in, size_t const n)
{
    if (CHAINBENCH_UNLIKELY(in.size() < n)) {
        return TransactionError::InputTooShort;
    }
    byte_string_view const out = in.substr(0, n);
    in.remove_prefix(n);
    return out;
}

Result<PublicKey> decode_key(byte_string_view &in)
{
    auto const b = BOOST_OUTCOME_TRYX(decode_bytes(in, PUBLIC_KEY_SIZE));
    auto key = PublicKey::from_bytes(b);
    CHAINBENCH_ASSERT(key.has_value());
    return *key;
}

Result<std::vector<uint8_t>> decode_u8_vec(byte_string_view &in)
{
    auto const n = BOOST_OUTCOME_TRYX(decode_short_vec(in));
    auto const b = BOOST_OUTCOME_TRYX(decode_bytes(in, n));
    return std::vector<uint8_t>(b.begin(), b.end());
}

void encode_u8_vec(byte_string &out, std::vector<uint8_t> const &v)
{
    encode_short_vec(out, static_cast<uint16_t>(v.size()));
    out.append(v.begin(), v.end());
}

Result<Message> decode_message_prefix(byte_string_view &in)
{
    Message msg;
    if (CHAINBENCH_UNLIKELY(in.empty())) {
        return TransactionError::InputTooShort;
    }
    if (in.front() & VERSION_PREFIX_MASK) {
        uint8_t const version = in.front() & ~VERSION_PREFIX_MASK;
        if (version != 0) {
            return TransactionError::UnsupportedVersion;
        }
        msg.version = version;
        in.remove_prefix(1);
    }

    msg.header.num_required_signatures = BOOST_OUTCOME_TRYX(decode_u8(in));
    msg.header.num_readonly_signed_accounts = BOOST_OUTCOME_TRYX(decode_u8(in));
    msg.header.num_readonly_unsigned_accounts =
        BOOST_OUTCOME_TRYX(decode_u8(in));

    auto const num_keys = BOOST_OUTCOME_TRYX(decode_short_vec(in));
    msg.account_keys.reserve(num_keys);
    for (uint16_t i = 0; i < num_keys; ++i) {
        auto const key = BOOST_OUTCOME_TRYX(decode_key(in));
        msg.account_keys.push_back(key);
    }

    auto const &header = msg.header;
    if (CHAINBENCH_UNLIKELY(
            header.num_required_signatures > msg.account_keys.size() ||
            header.num_readonly_signed_accounts >
                header.num_required_signatures ||
            header.num_readonly_unsigned_accounts >
                msg.account_keys.size() - header.num_required_signatures)) {
        return TransactionError::InvalidHeader;
    }

    msg.recent_blockhash = BOOST_OUTCOME_TRYX(decode_key(in));

    auto const num_instructions = BOOST_OUTCOME_TRYX(decode_short_vec(in));
    msg.instructions.reserve(num_instructions);
    for (uint16_t i = 0; i < num_instructions; ++i) {
        CompiledInstruction ix;
        ix.program_id_index = BOOST_OUTCOME_TRYX(decode_u8(in));
        ix.accounts = BOOST_OUTCOME_TRYX(decode_u8_vec(in));
        auto const data_len = BOOST_OUTCOME_TRYX(decode_short_vec(in));
        auto const data = BOOST_OUTCOME_TRYX(decode_bytes(in, data_len));
        ix.data = byte_string{data};
        msg.instructions.push_back(std::move(ix));
    }

    if (msg.version.has_value()) {
        auto const num_lookups = BOOST_OUTCOME_TRYX(decode_short_vec(in));
        for (uint16_t i = 0; i < num_lookups; ++i) {
            AddressTableLookup lookup;
            lookup.account_key = BOOST_OUTCOME_TRYX(decode_key(in));
            lookup.writable_indexes = BOOST_OUTCOME_TRYX(decode_u8_vec(in));
            lookup.readonly_indexes = BOOST_OUTCOME_TRYX(decode_u8_vec(in));
            msg.address_table_lookups.push_back(std::move(lookup));
        }
    }
    return msg;
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_SOLANA_NAMESPACE_BEGIN

bool Message::is_signer(size_t const index) const
{
    return index < header.num_required_signatures;
}

bool Message::is_writable(size_t const index) const
{
    if (index >= account_keys.size()) {
        return false;
    }
    if (is_signer(index)) {
        return index < static_cast<size_t>(
                           header.num_required_signatures -
                           header.num_readonly_signed_accounts);
    }
    return index < account_keys.size() - header.num_readonly_unsigned_accounts;
}

byte_string encode_message(Message const &msg)
{
    byte_string out;
    if (msg.version.has_value()) {
        out.push_back(VERSION_PREFIX_MASK | *msg.version);
    }
    out.push_back(msg.header.num_required_signatures);
    out.push_back(msg.header.num_readonly_signed_accounts);
    out.push_back(msg.header.num_readonly_unsigned_accounts);

    encode_short_vec(out, static_cast<uint16_t>(msg.account_keys.size()));
    for (auto const &key : msg.account_keys) {
        out.append(key.view());
    }
    out.append(msg.recent_blockhash.view());

    encode_short_vec(out, static_cast<uint16_t>(msg.instructions.size()));
    for (auto const &ix : msg.instructions) {
        out.push_back(ix.program_id_index);
        encode_u8_vec(out, ix.accounts);
        encode_short_vec(out, static_cast<uint16_t>(ix.data.size()));
        out.append(ix.data);
    }

    if (msg.version.has_value()) {
        encode_short_vec(
            out, static_cast<uint16_t>(msg.address_table_lookups.size()));
        for (auto const &lookup : msg.address_table_lookups) {
            out.append(lookup.account_key.view());
            encode_u8_vec(out, lookup.writable_indexes);
            encode_u8_vec(out, lookup.readonly_indexes);
        }
    }
    return out;
}

Result<Message> decode_message(byte_string_view in)
{
    auto msg = BOOST_OUTCOME_TRYX(decode_message_prefix(in));
    if (CHAINBENCH_UNLIKELY(!in.empty())) {
        return TransactionError::TrailingBytes;
    }
    return msg;
}

byte_string encode_transaction(Transaction const &tx)
{
    byte_string out;
    encode_short_vec(out, static_cast<uint16_t>(tx.signatures.size()));
    for (auto const &sig : tx.signatures) {
        out.append(sig.data(), sig.size());
    }
    if (tx.message_bytes.empty()) {
        out.append(encode_message(tx.message));
    }
    else {
        out.append(tx.message_bytes);
    }
    return out;
}

Result<Transaction> decode_transaction(byte_string_view in)
{
    Transaction tx;
    auto const num_signatures = BOOST_OUTCOME_TRYX(decode_short_vec(in));
    tx.signatures.reserve(num_signatures);
    for (uint16_t i = 0; i < num_signatures; ++i) {
        auto const b = BOOST_OUTCOME_TRYX(decode_bytes(in, SIGNATURE_SIZE));
        Signature sig;
        std::copy(b.begin(), b.end(), sig.begin());
        tx.signatures.push_back(sig);
    }
    tx.message_bytes = byte_string{in};
    tx.message = BOOST_OUTCOME_TRYX(decode_message(in));
    return tx;
}

Result<Message> compile_message(
    PublicKey const &fee_payer, std::vector<Instruction> const &instructions,
    Hash const &recent_blockhash)
{
    std::vector<AccountMeta> metas{{fee_payer, true, true}};
    auto const upsert = [&metas](
                            PublicKey const &key,
                            bool const is_signer,
                            bool const is_writable) {
        auto it = std::find_if(
            metas.begin(), metas.end(), [&key](AccountMeta const &m) {
                return m.pubkey == key;
            });
        if (it == metas.end()) {
            metas.push_back({key, is_signer, is_writable});
        }
        else {
            it->is_signer |= is_signer;
            it->is_writable |= is_writable;
        }
    };
    for (auto const &ix : instructions) {
        for (auto const &account : ix.accounts) {
            upsert(account.pubkey, account.is_signer, account.is_writable);
        }
        upsert(ix.program_id, false, false);
    }
    if (CHAINBENCH_UNLIKELY(metas.size() > MAX_ACCOUNTS)) {
        return TransactionError::TooManyAccounts;
    }

    auto const rank = [](AccountMeta const &m) {
        if (m.is_signer) {
            return m.is_writable ? 0 : 1;
        }
        return m.is_writable ? 2 : 3;
    };
    // the fee payer stays in front, it is always a writable signer
    std::stable_sort(
        metas.begin() + 1,
        metas.end(),
        [&rank](AccountMeta const &a, AccountMeta const &b) {
            return rank(a) < rank(b);
        });

    Message msg;
    msg.recent_blockhash = recent_blockhash;
    for (auto const &m : metas) {
        msg.account_keys.push_back(m.pubkey);
        if (m.is_signer) {
            ++msg.header.num_required_signatures;
            if (!m.is_writable) {
                ++msg.header.num_readonly_signed_accounts;
            }
        }
        else if (!m.is_writable) {
            ++msg.header.num_readonly_unsigned_accounts;
        }
    }

    auto const index_of = [&msg](PublicKey const &key) {
        auto const it = std::find(
            msg.account_keys.begin(), msg.account_keys.end(), key);
        CHAINBENCH_ASSERT(it != msg.account_keys.end());
        return static_cast<uint8_t>(it - msg.account_keys.begin());
    };
    for (auto const &ix : instructions) {
        CompiledInstruction compiled;
        compiled.program_id_index = index_of(ix.program_id);
        for (auto const &account : ix.accounts) {
            compiled.accounts.push_back(index_of(account.pubkey));
        }
        compiled.data = ix.data;
        msg.instructions.push_back(std::move(compiled));
    }
    return msg;
}

byte_string make_unsigned_transaction(Message const &msg)
{
    Transaction tx;
    tx.signatures.resize(msg.header.num_required_signatures, Signature{});
    tx.message = msg;
    return encode_transaction(tx);
}

Instruction system_transfer(
    PublicKey const &from, PublicKey const &to, uint64_t const lamports)
{
    constexpr uint32_t TRANSFER = 2;

    Instruction ix;
    ix.program_id = SYSTEM_PROGRAM_ID;
    ix.accounts = {{from, true, true}, {to, false, true}};
    for (unsigned i = 0; i < 4; ++i) {
        ix.data.push_back(static_cast<uint8_t>(TRANSFER >> (8 * i)));
    }
    for (unsigned i = 0; i < 8; ++i) {
        ix.data.push_back(static_cast<uint8_t>(lamports >> (8 * i)));
    }
    return ix;
}

CHAINBENCH_SOLANA_NAMESPACE_END
