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

#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

// Maps every executed instruction to (program id, leading data byte),
// preserving execution order and duplicates. Two instructions of one program
// sharing a leading byte yield the same key.
Result<std::vector<InstructionKey>> decode(TransactionReceipt const &);

CHAINBENCH_NAMESPACE_END
