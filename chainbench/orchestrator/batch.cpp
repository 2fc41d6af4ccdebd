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
#include <chainbench/orchestrator/batch.hpp>
#include <chainbench/orchestrator/orchestrator.hpp>
#include <chainbench/orchestrator/run_state.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

std::vector<RunSummary>
run_batch(std::vector<RunComponents> runs, std::stop_token stop)
{
    std::vector<RunSummary> summaries(runs.size());
    {
        std::vector<std::jthread> threads;
        threads.reserve(runs.size());
        for (size_t i = 0; i < runs.size(); ++i) {
            auto &components = runs[i];
            CHAINBENCH_ASSERT(
                components.generator && components.gateway &&
                components.bridge && components.recorder);
            threads.emplace_back([&components, &summary = summaries[i], stop] {
                Orchestrator orchestrator{
                    components.config,
                    *components.generator,
                    *components.gateway,
                    *components.bridge,
                    *components.recorder};
                summary = orchestrator.run(stop);
            });
        }
    }
    LOG_INFO("batch of {} runs finished", summaries.size());
    return summaries;
}

CHAINBENCH_NAMESPACE_END
