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
#include <chainbench/process/subprocess.hpp>
#include <chainbench/runtime/execution_result.hpp>

#include <chrono>

CHAINBENCH_NAMESPACE_BEGIN

inline constexpr char const *RUNNER_TIMEOUT_MESSAGE =
    "Skill execution timed out.";

// Normalizes a finished runner process into an execution result. The last
// stdout line holding a JSON object is the runner's report; stdout is
// ignored entirely when the deadline expired.
ExecutionResult interpret_runner_output(
    ProcessResult const &, std::chrono::milliseconds timeout);

CHAINBENCH_NAMESPACE_END
