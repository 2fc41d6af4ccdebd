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
#include <chainbench/core/result.hpp>
#include <chainbench/decode/instruction_key.hpp>
#include <chainbench/decode/receipt.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

struct ScoreResult
{
    uint64_t delta{0};
    // newly discovered keys, in order of first occurrence within the call
    std::vector<InstructionKey> new_keys{};
};

// Run scoped record of every rewarded key and the turn that first produced
// it. Entries are never removed or remapped. Not thread safe; each run owns
// its own instance.
class DiscoveryLedger
{
    std::map<InstructionKey, uint64_t> discovered_;

public:
    ScoreResult score(std::vector<InstructionKey> const &, uint64_t turn);

    bool contains(InstructionKey const &key) const
    {
        return discovered_.contains(key);
    }

    size_t size() const
    {
        return discovered_.size();
    }

    std::map<InstructionKey, uint64_t> const &entries() const
    {
        return discovered_;
    }
};

struct LedgerScore
{
    uint64_t delta{0};
    std::vector<InstructionKey> new_keys{};
    DiscoveryLedger ledger{};
};

// Same as DiscoveryLedger::score, leaving the argument untouched
LedgerScore score(
    DiscoveryLedger const &, std::vector<InstructionKey> const &,
    uint64_t turn);

// A failed receipt always scores zero and leaves the ledger unchanged
Result<ScoreResult> score_receipt(
    DiscoveryLedger &, TransactionReceipt const &, uint64_t turn);

CHAINBENCH_NAMESPACE_END
