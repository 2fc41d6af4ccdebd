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

#include <chainbench/core/byte_string.hpp>
#include <chainbench/runtime/artifact.hpp>
#include <chainbench/runtime/artifact_error.hpp>
#include <chainbench/runtime/code_unit.hpp>
#include <chainbench/runtime/error_record.hpp>
#include <chainbench/runtime/gateway.hpp>
#include <chainbench/runtime/process_gateway.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

using namespace chainbench;
using namespace std::chrono_literals;

namespace
{
    // The code unit is itself a shell script; the runner executes it with
    // the remaining invocation arguments.
    struct ProcessGatewayTest : public ::testing::Test
    {
        std::filesystem::path root;
        ProcessGateway gateway;
        ExecutionContext context;

        ProcessGatewayTest()
            : root{std::filesystem::temp_directory_path() /
                   ("chainbench_process_" + std::to_string(::getpid()))}
            , gateway{ProcessGatewayConfig{
                  .runner = {"/bin/sh"},
                  .artifact_root = root,
                  .startup_grace = 0ms}}
            , context{"run", 2, solana::PublicKey{}, "token"}
        {
        }

        ~ProcessGatewayTest() override
        {
            std::filesystem::remove_all(root);
        }

        ExecutionResult run(
            std::string script, std::chrono::milliseconds const timeout = 5s)
        {
            return gateway.execute(
                CodeUnit{.source = std::move(script), .extension = ".sh"},
                timeout,
                context,
                {});
        }
    };
}

TEST_F(ProcessGatewayTest, passes_invocation_arguments)
{
    auto const result = run(
        "[ \"$1\" = 2000 ] && [ \"$2\" = 11111111111111111111111111111111 ] "
        "&& [ \"$3\" = token ] || exit 5\n"
        "echo '{\"serialized_tx\": \"AQID\"}'\n",
        2s);
    ASSERT_TRUE(result.has_transaction());
    EXPECT_EQ(result.transaction(), (byte_string{1, 2, 3}));

    std::ifstream in{root / "run" / "turn_0002.sh"};
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("serialized_tx"), std::string::npos);
}

TEST_F(ProcessGatewayTest, reported_failure)
{
    auto const result = run(
        "echo '{\"serialized_tx\": null, \"error\": \"Unexpected token\", "
        "\"type\": \"SyntaxError\"}'\nexit 1\n");
    ASSERT_FALSE(result.has_transaction());
    EXPECT_EQ(result.error().kind(), ErrorKind::CompileError);
}

TEST_F(ProcessGatewayTest, killed_after_timeout)
{
    auto const begin = std::chrono::steady_clock::now();
    auto const result = run(
        "echo '{\"serialized_tx\": \"AQID\"}'\nexec sleep 30\n", 200ms);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    ASSERT_FALSE(result.has_transaction());
    EXPECT_EQ(result.error().kind(), ErrorKind::Timeout);
}

TEST_F(ProcessGatewayTest, empty_code_unit)
{
    auto const result = run("");
    ASSERT_FALSE(result.has_transaction());
    EXPECT_EQ(result.error().kind(), ErrorKind::InterfaceError);
}

TEST_F(ProcessGatewayTest, same_turn_of_two_runs)
{
    auto const first = run("echo '{\"serialized_tx\": \"AQID\"}'\n");
    context.run_id = "other";
    auto const second = run("echo '{\"serialized_tx\": \"BAUG\"}'\n");
    ASSERT_TRUE(first.has_transaction());
    ASSERT_TRUE(second.has_transaction());
    EXPECT_TRUE(std::filesystem::exists(root / "run" / "turn_0002.sh"));
    EXPECT_TRUE(std::filesystem::exists(root / "other" / "turn_0002.sh"));

    std::ifstream in{root / "run" / "turn_0002.sh"};
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("AQID"), std::string::npos);
}

TEST_F(ProcessGatewayTest, unwritable_artifact)
{
    std::filesystem::create_directories(root);
    std::ofstream{root / "run"} << "not a directory";
    auto const result = run("echo '{\"serialized_tx\": \"AQID\"}'\n");
    ASSERT_FALSE(result.has_transaction());
    EXPECT_EQ(result.error().kind(), ErrorKind::RuntimeError);
    EXPECT_EQ(result.error().message, "cannot write code artifact");

    auto const written =
        write_artifact(root / "run" / "turn_0001.sh", "echo");
    ASSERT_TRUE(written.has_error());
    EXPECT_EQ(written.error(), ArtifactError::CreateDirectoryFailed);
}
