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

#include <chainbench/bridge/validator_bridge.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/metrics/metrics_recorder.hpp>
#include <chainbench/orchestrator/code_generator.hpp>
#include <chainbench/orchestrator/orchestrator.hpp>
#include <chainbench/orchestrator/run_state.hpp>
#include <chainbench/runtime/gateway.hpp>

#include <memory>
#include <stop_token>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

// Everything one run owns. The recorder may be shared between runs.
struct RunComponents
{
    OrchestratorConfig config{};
    std::unique_ptr<CodeGenerator> generator{};
    std::unique_ptr<RuntimeGateway> gateway{};
    std::unique_ptr<ValidatorBridge> bridge{};
    std::shared_ptr<MetricsRecorder> recorder{};
};

// Runs every entry on its own thread; summaries are returned in input
// order. Stopping the token cancels all runs.
std::vector<RunSummary> run_batch(std::vector<RunComponents>, std::stop_token);

CHAINBENCH_NAMESPACE_END
