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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

struct ReceiptInstruction
{
    uint32_t program_id_index{0};
    byte_string data{};
    // 1 for top level instructions, deeper for cross program invocations
    uint32_t stack_height{1};
};

// Executed transaction as reported by the replica. Instructions are in
// execution order, each top level instruction followed by its inner
// instructions. Account keys are the static keys followed by the lookup
// table loaded writable and then readonly keys.
struct TransactionReceipt
{
    bool success{false};
    std::optional<std::string> error{};
    std::vector<std::string> logs{};
    std::vector<std::string> account_keys{};
    std::vector<ReceiptInstruction> instructions{};
    std::string signature{};
};

CHAINBENCH_NAMESPACE_END
