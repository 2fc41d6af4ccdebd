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
#include <chainbench/runtime/artifact.hpp>
#include <chainbench/runtime/code_unit.hpp>
#include <chainbench/runtime/error_record.hpp>
#include <chainbench/runtime/execution_result.hpp>
#include <chainbench/runtime/fork_gateway.hpp>
#include <chainbench/runtime/gateway.hpp>
#include <chainbench/runtime/native_skill.hpp>
#include <chainbench/runtime/runner_output.hpp>
#include <chainbench/runtime/skill_host.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <filesystem>
#include <stop_token>
#include <utility>

CHAINBENCH_NAMESPACE_BEGIN

ForkGateway::ForkGateway(ForkGatewayConfig config)
    : config_{std::move(config)}
{
}

ExecutionResult ForkGateway::execute(
    CodeUnit const &unit, std::chrono::milliseconds const timeout,
    ExecutionContext const &context, std::stop_token stop)
{
    auto const path = std::filesystem::absolute(artifact_path(
        config_.artifact_root, context.run_id, context.turn, unit.extension));
    // an in process entry runs without its artifact; the failure is logged
    auto const written = write_artifact(path, unit.source);

    if (unit.entry) {
        auto const process = run_skill_forked(
            unit.entry,
            context.identity,
            context.freshness_token,
            timeout,
            config_.transactions_per_turn,
            config_.max_output_bytes,
            std::move(stop));
        return interpret_runner_output(process, timeout);
    }
    if (!is_native_source(path)) {
        return ExecutionResult::failure(ErrorRecord::interface_error(
            "code unit has no native entry point"));
    }
    if (written.has_error()) {
        return ExecutionResult::failure(ErrorRecord::runtime_error(
            "cannot write code artifact",
            written.error().message().c_str()));
    }

    auto const build = build_native_skill(config_.native, path, stop);
    if (!build.succeeded) {
        LOG_DEBUG(
            "{} turn {}: build failed with {} diagnostics",
            context.run_id,
            context.turn,
            build.diagnostics.size());
        return ExecutionResult::failure(to_error_record(build));
    }
    auto const process = run_native_skill_forked(
        build.module,
        context.identity,
        context.freshness_token,
        timeout,
        config_.transactions_per_turn,
        config_.max_output_bytes,
        std::move(stop));
    return interpret_runner_output(process, timeout);
}

CHAINBENCH_NAMESPACE_END
