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
#include <chainbench/core/result.hpp>
#include <chainbench/decode/receipt.hpp>
#include <chainbench/solana/keypair.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

CHAINBENCH_NAMESPACE_BEGIN

struct FundedIdentity
{
    solana::Keypair keypair;
    uint64_t lamports{0};
};

// The replica refused the transaction or never confirmed it. Costs the turn,
// not the run.
struct Rejection
{
    std::string message{};
};

using SubmitOutcome = std::variant<TransactionReceipt, Rejection>;

// Access to the sandboxed replica. Errors returned through Result are fatal
// for the run; a transaction the replica does not accept is a Rejection and
// a transaction that executed (successfully or not) is a receipt.
class ValidatorBridge
{
public:
    virtual ~ValidatorBridge() = default;

    // Creates a fresh identity and funds it, waiting for confirmation
    virtual Result<FundedIdentity> reset_identity(std::string_view run_id) = 0;

    // Latest blockhash, used as the freshness token of a turn
    virtual Result<std::string> latest_reference() = 0;

    virtual Result<SubmitOutcome> submit(byte_string_view signed_tx) = 0;
};

CHAINBENCH_NAMESPACE_END
