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

#include <chainbench/core/config.hpp>
#include <chainbench/solana/public_key.hpp>
#include <chainbench/solana/transaction.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

inline constexpr uint64_t TRANSACTIONS_PER_TURN = 1;

class PolicyViolationError : public std::runtime_error
{
    uint64_t attempts_;
    uint64_t limit_;

public:
    PolicyViolationError(uint64_t attempts, uint64_t limit);

    uint64_t attempts() const
    {
        return attempts_;
    }

    uint64_t limit() const
    {
        return limit_;
    }
};

// Capabilities handed to a code unit for one execution. Transaction builds
// are counted per instance; building past the limit throws
// PolicyViolationError and the context stays violated for the rest of the
// execution, even if the code unit catches the exception.
class SkillContext
{
    solana::PublicKey identity_;
    std::string freshness_token_;
    uint64_t builds_{0};
    uint64_t limit_;

public:
    SkillContext(
        solana::PublicKey const &identity, std::string freshness_token,
        uint64_t limit = TRANSACTIONS_PER_TURN);

    solana::PublicKey const &identity() const
    {
        return identity_;
    }

    std::string_view freshness_token() const
    {
        return freshness_token_;
    }

    uint64_t builds() const
    {
        return builds_;
    }

    uint64_t limit() const
    {
        return limit_;
    }

    bool violated() const
    {
        return builds_ > limit_;
    }

    // Compiles the instructions with the identity as fee payer and the
    // freshness token as recent blockhash. Returns the base64 unsigned
    // transaction.
    std::string build_transaction(std::vector<solana::Instruction> const &);
};

CHAINBENCH_NAMESPACE_END
