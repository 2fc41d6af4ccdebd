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

#include <chainbench/bridge/bridge_error.hpp>
#include <chainbench/bridge/replica_process.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/core/result.hpp>
#include <chainbench/process/background_process.hpp>

#include <quill/Quill.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

ReplicaProcess::ReplicaProcess(ReplicaConfig config)
    : config_{std::move(config)}
{
}

ReplicaProcess::~ReplicaProcess()
{
    if (process_.running()) {
        LOG_INFO("stopping replica [{}]", process_.pid());
    }
    process_.terminate(config_.shutdown_grace);
    LOG_INFO("replica shut down");
}

std::vector<std::string> ReplicaProcess::command_line() const
{
    return {config_.command, "start", "--no-tui", "-u", config_.upstream_url};
}

Result<std::unique_ptr<ReplicaProcess>>
ReplicaProcess::launch(ReplicaConfig config)
{
    // private constructor, see RpcValidatorBridge::create
    std::unique_ptr<ReplicaProcess> replica{
        new ReplicaProcess{std::move(config)}};

    // keep terminal crates out of raw mode, keep panics readable
    if (auto const err = replica->process_.start(
            replica->command_line(),
            {"RUST_BACKTRACE=1", "CROSSTERM_DISABLE_RAW_MODE=1"});
        !err.empty()) {
        LOG_ERROR("cannot launch replica: {}", err);
        return BridgeError::ReplicaFailed;
    }
    LOG_INFO("replica [{}] launched", replica->process_.pid());

    auto const log_line = [](std::string_view const line) {
        LOG_DEBUG("[replica] {}", line);
    };
    if (!replica->process_.wait_for_output(
            replica->config_.ready_banner,
            replica->config_.startup_timeout,
            log_line)) {
        LOG_ERROR("replica did not become ready");
        return BridgeError::ReplicaFailed;
    }
    replica->process_.drain(log_line);
    LOG_INFO("replica ready");
    return replica;
}

CHAINBENCH_NAMESPACE_END
