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
#include <chainbench/solana/keypair.hpp>
#include <chainbench/solana/public_key.hpp>
#include <chainbench/solana/transaction.hpp>
#include <chainbench/solana/transaction_error.hpp>

#include <boost/outcome/try.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

using namespace chainbench;
using namespace chainbench::solana;

struct MdCtxDeleter
{
    void operator()(EVP_MD_CTX *const ctx) const
    {
        EVP_MD_CTX_free(ctx);
    }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::optional<PublicKey> raw_public_key(EVP_PKEY *const pkey)
{
    PublicKey key;
    size_t len = key.bytes.size();
    if (EVP_PKEY_get_raw_public_key(pkey, key.bytes.data(), &len) != 1 ||
        len != key.bytes.size()) {
        return std::nullopt;
    }
    return key;
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_SOLANA_NAMESPACE_BEGIN

void Keypair::PkeyDeleter::operator()(evp_pkey_st *const pkey) const
{
    EVP_PKEY_free(pkey);
}

Keypair::Keypair(evp_pkey_st *const pkey, PublicKey const &public_key)
    : pkey_{pkey}
    , public_key_{public_key}
{
}

Result<Keypair> Keypair::generate()
{
    EVP_PKEY_CTX *const ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (ctx == nullptr) {
        return TransactionError::InvalidKey;
    }
    EVP_PKEY *pkey = nullptr;
    bool const ok =
        EVP_PKEY_keygen_init(ctx) == 1 && EVP_PKEY_keygen(ctx, &pkey) == 1;
    EVP_PKEY_CTX_free(ctx);
    if (!ok) {
        return TransactionError::InvalidKey;
    }
    auto const public_key = raw_public_key(pkey);
    if (!public_key.has_value()) {
        EVP_PKEY_free(pkey);
        return TransactionError::InvalidKey;
    }
    return Keypair{pkey, *public_key};
}

Result<Keypair> Keypair::from_seed(Seed const &seed)
{
    EVP_PKEY *const pkey = EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr, seed.data(), seed.size());
    if (pkey == nullptr) {
        return TransactionError::InvalidKey;
    }
    auto const public_key = raw_public_key(pkey);
    if (!public_key.has_value()) {
        EVP_PKEY_free(pkey);
        return TransactionError::InvalidKey;
    }
    return Keypair{pkey, *public_key};
}

Result<Signature> Keypair::sign(byte_string_view const message) const
{
    CHAINBENCH_ASSERT(pkey_);
    MdCtx ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        return TransactionError::SigningFailed;
    }
    Signature sig;
    size_t len = sig.size();
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey_.get()) !=
            1 ||
        EVP_DigestSign(
            ctx.get(), sig.data(), &len, message.data(), message.size()) != 1 ||
        len != sig.size()) {
        return TransactionError::SigningFailed;
    }
    return sig;
}

bool verify_signature(
    PublicKey const &key, byte_string_view const message, Signature const &sig)
{
    EVP_PKEY *const pkey = EVP_PKEY_new_raw_public_key(
        EVP_PKEY_ED25519, nullptr, key.bytes.data(), key.bytes.size());
    if (pkey == nullptr) {
        return false;
    }
    MdCtx ctx{EVP_MD_CTX_new()};
    bool const ok =
        ctx &&
        EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey) ==
            1 &&
        EVP_DigestVerify(
            ctx.get(), sig.data(), sig.size(), message.data(), message.size()) ==
            1;
    EVP_PKEY_free(pkey);
    return ok;
}

Result<byte_string>
sign_transaction(byte_string_view const unsigned_tx, Keypair const &keypair)
{
    auto tx = BOOST_OUTCOME_TRYX(decode_transaction(unsigned_tx));

    size_t const required = tx.message.header.num_required_signatures;
    if (tx.signatures.empty()) {
        tx.signatures.resize(required, Signature{});
    }
    if (CHAINBENCH_UNLIKELY(tx.signatures.size() != required)) {
        return TransactionError::SignatureCountMismatch;
    }

    auto const signers_end =
        tx.message.account_keys.begin() + static_cast<std::ptrdiff_t>(required);
    auto const it = std::find(
        tx.message.account_keys.begin(), signers_end, keypair.public_key());
    if (CHAINBENCH_UNLIKELY(it == signers_end)) {
        return TransactionError::SignerNotFound;
    }

    auto const sig = BOOST_OUTCOME_TRYX(keypair.sign(tx.message_bytes));
    tx.signatures[static_cast<size_t>(it - tx.message.account_keys.begin())] =
        sig;
    return encode_transaction(tx);
}

CHAINBENCH_SOLANA_NAMESPACE_END
