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

#include <chainbench/metrics/metrics_recorder.hpp>
#include <chainbench/orchestrator/run_state.hpp>
#include <chainbench/orchestrator/turn_state.hpp>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace chainbench;

TEST(metrics_recorder, appends_json_lines)
{
    auto const path = std::filesystem::temp_directory_path() /
                      "chainbench_metrics_recorder_test.jsonl";
    std::filesystem::remove(path);
    {
        JsonlMetricsRecorder recorder{path};
        ASSERT_TRUE(recorder.is_open());
        recorder.record_turn(
            "r1",
            TurnRecord{
                .index = 1,
                .timestamp = {},
                .duration = {},
                .reward_delta = 2,
                .cumulative_reward = 2,
                .new_keys = {},
                .error = ErrorKind::Timeout});
        recorder.record_summary(RunSummary{
            .run_id = "r1",
            .model = "m",
            .turns_completed = 1,
            .budget = 1,
            .cumulative_reward = 2,
            .distinct_keys = 2,
            .termination_reason = TerminationReason::BudgetExhausted,
            .fatal_error = std::nullopt});
    }
    {
        // reopening appends
        JsonlMetricsRecorder recorder{path};
        std::vector<std::jthread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&recorder, i] {
                recorder.record_turn(
                    "r" + std::to_string(i + 2), TurnRecord{.index = 1});
            });
        }
    }

    std::ifstream in{path};
    std::vector<nlohmann::json> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(lines.size(), 6);
    EXPECT_EQ(lines[0]["record"], "turn");
    EXPECT_EQ(lines[0]["run_id"], "r1");
    EXPECT_EQ(lines[0]["outcome"], "Timeout");
    EXPECT_EQ(lines[0]["reward"], 2);
    EXPECT_EQ(lines[1]["record"], "summary");
    EXPECT_EQ(lines[1]["termination_reason"], "BudgetExhausted");
    for (size_t i = 2; i < lines.size(); ++i) {
        EXPECT_EQ(lines[i]["record"], "turn");
    }
    std::filesystem::remove(path);
}
