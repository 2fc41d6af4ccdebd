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

#include <chainbench/core/base64.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/runtime/skill_context.hpp>
#include <chainbench/solana/public_key.hpp>
#include <chainbench/solana/transaction.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

PolicyViolationError::PolicyViolationError(
    uint64_t const attempts, uint64_t const limit)
    : std::runtime_error{fmt::format(
          "Policy violation: attempted to build {} transactions but only {} "
          "transaction is allowed per turn. Split the work into separate "
          "turns, one transaction each.",
          attempts,
          limit)}
    , attempts_{attempts}
    , limit_{limit}
{
}

SkillContext::SkillContext(
    solana::PublicKey const &identity, std::string freshness_token,
    uint64_t const limit)
    : identity_{identity}
    , freshness_token_{std::move(freshness_token)}
    , limit_{limit}
{
}

std::string SkillContext::build_transaction(
    std::vector<solana::Instruction> const &instructions)
{
    ++builds_;
    if (builds_ > limit_) {
        throw PolicyViolationError{builds_, limit_};
    }
    auto const blockhash = solana::Hash::from_base58(freshness_token_);
    if (!blockhash.has_value()) {
        throw std::invalid_argument{
            fmt::format("invalid freshness token '{}'", freshness_token_)};
    }
    auto const message =
        solana::compile_message(identity_, instructions, *blockhash);
    if (!message) {
        throw std::invalid_argument{fmt::format(
            "cannot compile transaction: {}",
            message.error().message().c_str())};
    }
    return base64_encode(solana::make_unsigned_transaction(message.value()));
}

CHAINBENCH_NAMESPACE_END
