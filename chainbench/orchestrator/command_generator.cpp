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
#include <chainbench/orchestrator/code_generator.hpp>
#include <chainbench/orchestrator/command_generator.hpp>
#include <chainbench/process/subprocess.hpp>
#include <chainbench/runtime/code_unit.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

CHAINBENCH_NAMESPACE_BEGIN

nlohmann::json to_json(GenerationRequest const &request)
{
    nlohmann::json j{
        {"run_id", request.run_id},
        {"turn", request.turn},
        {"budget", request.budget},
        {"identity", request.identity.to_base58()},
        {"freshness_token", request.freshness_token},
        {"feedback", nullptr}};
    if (request.previous.has_value()) {
        j["feedback"] = {
            {"message", request.previous->message},
            {"fields", request.previous->fields}};
    }
    return j;
}

std::string extract_code_block(std::string_view const reply)
{
    constexpr std::string_view FENCE = "```";
    auto const open = reply.find(FENCE);
    if (open == std::string_view::npos) {
        return std::string{reply};
    }
    // skip the language tag
    auto const body = reply.find('\n', open);
    if (body == std::string_view::npos) {
        return std::string{reply};
    }
    auto const close = reply.find(FENCE, body + 1);
    if (close == std::string_view::npos) {
        return std::string{reply.substr(body + 1)};
    }
    return std::string{reply.substr(body + 1, close - body - 1)};
}

CommandGenerator::CommandGenerator(CommandGeneratorConfig config)
    : config_{std::move(config)}
{
    CHAINBENCH_ASSERT(!config_.command.empty());
}

CodeUnit CommandGenerator::generate(
    GenerationRequest const &request, std::stop_token stop)
{
    ProcessSpec spec;
    spec.argv = config_.command;
    spec.timeout = config_.timeout;
    spec.stdin_data = to_json(request).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);

    auto const process = run_process(spec, std::move(stop));
    CodeUnit unit{.extension = config_.extension};
    if (!process.exited_cleanly()) {
        LOG_WARNING(
            "{} turn {}: generator failed (exit code {}, timed out {}): {}",
            request.run_id,
            request.turn,
            process.exit_code,
            process.timed_out,
            process.spawned() ? process.stderr_text : process.error_message);
        return unit;
    }
    unit.source = extract_code_block(process.stdout_text);
    return unit;
}

CHAINBENCH_NAMESPACE_END
