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

#include <array>
#include <cstdint>
#include <memory>
#include <optional>

struct evp_pkey_st;

CHAINBENCH_SOLANA_NAMESPACE_BEGIN

using Seed = std::array<uint8_t, 32>;

// An ed25519 identity. Move only; the private key never leaves the process.
class Keypair
{
    struct PkeyDeleter
    {
        void operator()(evp_pkey_st *) const;
    };

    std::unique_ptr<evp_pkey_st, PkeyDeleter> pkey_;
    PublicKey public_key_;

    Keypair(evp_pkey_st *, PublicKey const &);

public:
    Keypair(Keypair &&) noexcept = default;
    Keypair &operator=(Keypair &&) noexcept = default;
    ~Keypair() = default;

    static Result<Keypair> generate();
    static Result<Keypair> from_seed(Seed const &);

    PublicKey const &public_key() const
    {
        return public_key_;
    }

    Result<Signature> sign(byte_string_view message) const;
};

bool verify_signature(
    PublicKey const &, byte_string_view message, Signature const &);

// Decodes an unsigned (or partially signed) transaction, places the
// keypair's signature in the slot matching its position among the required
// signers and re-encodes it. An empty signature list is expanded to the
// number of required signatures.
Result<byte_string> sign_transaction(byte_string_view, Keypair const &);

CHAINBENCH_SOLANA_NAMESPACE_END
