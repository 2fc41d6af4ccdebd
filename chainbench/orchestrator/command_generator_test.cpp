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

#include <chainbench/orchestrator/code_generator.hpp>
#include <chainbench/orchestrator/command_generator.hpp>
#include <chainbench/orchestrator/feedback.hpp>
#include <chainbench/runtime/code_unit.hpp>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <stop_token>
#include <string>

using namespace chainbench;
using namespace std::chrono_literals;

TEST(command_generator, extract_code_block)
{
    EXPECT_EQ(
        extract_code_block("Here you go:\n```typescript\nconst x = 1;\n```\n"),
        "const x = 1;\n");
    EXPECT_EQ(extract_code_block("```\na\n```\n```\nb\n```"), "a\n");
    EXPECT_EQ(extract_code_block("plain source"), "plain source");
    EXPECT_EQ(extract_code_block("```ts\nunterminated"), "unterminated");
}

TEST(command_generator, request_json)
{
    GenerationRequest request{
        .run_id = "r",
        .turn = 2,
        .budget = 4,
        .identity = {},
        .freshness_token = "hash",
        .previous = std::nullopt};
    auto j = to_json(request);
    EXPECT_EQ(j["identity"], "11111111111111111111111111111111");
    EXPECT_TRUE(j["feedback"].is_null());

    request.previous =
        TurnFeedback{.message = "ok", .fields = {{"turn", 1}}};
    j = to_json(request);
    EXPECT_EQ(j["feedback"]["message"], "ok");
    EXPECT_EQ(j["feedback"]["fields"]["turn"], 1);
}

TEST(command_generator, runs_command_with_request_on_stdin)
{
    // echoes the turn number from the request into a fenced block
    CommandGenerator generator{CommandGeneratorConfig{
        .command =
            {"/bin/sh",
             "-c",
             "read line; printf 'reply\\n```ts\\n%s\\n```\\n' \"$line\""},
        .timeout = 10s,
        .extension = ".ts"}};
    GenerationRequest const request{
        .run_id = "r",
        .turn = 3,
        .budget = 4,
        .identity = {},
        .freshness_token = "hash",
        .previous = std::nullopt};
    auto const unit = generator.generate(request, std::stop_token{});
    EXPECT_EQ(unit.extension, ".ts");
    auto const j = nlohmann::json::parse(unit.source);
    EXPECT_EQ(j["turn"], 3);
    EXPECT_EQ(j["freshness_token"], "hash");
}

TEST(command_generator, failure_yields_empty_unit)
{
    CommandGenerator generator{CommandGeneratorConfig{
        .command = {"/bin/sh", "-c", "echo oops >&2; exit 3"},
        .timeout = 10s,
        .extension = ".ts"}};
    auto const unit =
        generator.generate(GenerationRequest{}, std::stop_token{});
    EXPECT_TRUE(unit.source.empty());
}
