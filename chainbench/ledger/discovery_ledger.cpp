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

#include <chainbench/core/config.hpp>
#include <chainbench/core/result.hpp>
#include <chainbench/decode/decoder.hpp>
#include <chainbench/decode/instruction_key.hpp>
#include <chainbench/decode/receipt.hpp>
#include <chainbench/ledger/discovery_ledger.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <utility>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

ScoreResult DiscoveryLedger::score(
    std::vector<InstructionKey> const &keys, uint64_t const turn)
{
    ScoreResult result;
    for (auto const &key : keys) {
        if (discovered_.emplace(key, turn).second) {
            result.new_keys.push_back(key);
            ++result.delta;
        }
    }
    return result;
}

LedgerScore score(
    DiscoveryLedger const &ledger, std::vector<InstructionKey> const &keys,
    uint64_t const turn)
{
    LedgerScore result{.ledger = ledger};
    auto scored = result.ledger.score(keys, turn);
    result.delta = scored.delta;
    result.new_keys = std::move(scored.new_keys);
    return result;
}

Result<ScoreResult> score_receipt(
    DiscoveryLedger &ledger, TransactionReceipt const &receipt,
    uint64_t const turn)
{
    if (!receipt.success) {
        return ScoreResult{};
    }
    auto const keys = BOOST_OUTCOME_TRYX(decode(receipt));
    auto result = ledger.score(keys, turn);
    for (auto const &key : result.new_keys) {
        LOG_INFO("turn {} discovered {}", turn, key);
    }
    return result;
}

CHAINBENCH_NAMESPACE_END
