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
#include <chainbench/core/config.hpp>
#include <chainbench/process/subprocess.hpp>
#include <chainbench/runtime/artifact.hpp>
#include <chainbench/runtime/code_unit.hpp>
#include <chainbench/runtime/error_record.hpp>
#include <chainbench/runtime/execution_result.hpp>
#include <chainbench/runtime/gateway.hpp>
#include <chainbench/runtime/process_gateway.hpp>
#include <chainbench/runtime/runner_output.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <filesystem>
#include <stop_token>
#include <string>
#include <utility>

CHAINBENCH_NAMESPACE_BEGIN

ProcessGateway::ProcessGateway(ProcessGatewayConfig config)
    : config_{std::move(config)}
{
    CHAINBENCH_ASSERT(!config_.runner.empty());
}

ExecutionResult ProcessGateway::execute(
    CodeUnit const &unit, std::chrono::milliseconds const timeout,
    ExecutionContext const &context, std::stop_token stop)
{
    if (unit.source.empty()) {
        return ExecutionResult::failure(
            ErrorRecord::interface_error("code unit is empty"));
    }

    auto const path = std::filesystem::absolute(artifact_path(
        config_.artifact_root, context.run_id, context.turn, unit.extension));
    if (auto const written = write_artifact(path, unit.source);
        written.has_error()) {
        return ExecutionResult::failure(ErrorRecord::runtime_error(
            "cannot write code artifact",
            written.error().message().c_str()));
    }

    ProcessSpec spec;
    spec.argv = config_.runner;
    spec.argv.push_back(path.string());
    spec.argv.push_back(std::to_string(timeout.count()));
    spec.argv.push_back(context.identity.to_base58());
    spec.argv.push_back(context.freshness_token);
    spec.timeout = timeout + config_.startup_grace;
    spec.max_output_bytes = config_.max_output_bytes;

    LOG_DEBUG(
        "{} turn {}: running {}", context.run_id, context.turn, path.string());
    auto const process = run_process(spec, std::move(stop));
    if (process.timed_out) {
        LOG_WARNING(
            "{} turn {}: runner killed after {} ms",
            context.run_id,
            context.turn,
            process.duration.count());
    }
    return interpret_runner_output(process, timeout);
}

CHAINBENCH_NAMESPACE_END
