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

#include <chainbench/runtime/code_unit.hpp>
#include <chainbench/runtime/error_record.hpp>
#include <chainbench/runtime/fork_gateway.hpp>
#include <chainbench/runtime/gateway.hpp>
#include <chainbench/runtime/skill_context.hpp>
#include <chainbench/solana/transaction.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include <unistd.h>

using namespace chainbench;
using namespace std::chrono_literals;

namespace
{
    solana::PublicKey key(uint8_t const fill)
    {
        solana::PublicKey k;
        k.bytes.fill(fill);
        return k;
    }

    struct ForkGatewayTest : public ::testing::Test
    {
        std::filesystem::path root;
        ExecutionContext context;

        ForkGatewayTest()
            : root{std::filesystem::temp_directory_path() /
                   ("chainbench_fork_" + std::to_string(::getpid()))}
            , context{"run", 1, key(1), "11111111111111111111111111111111"}
        {
        }

        ~ForkGatewayTest() override
        {
            std::filesystem::remove_all(root);
        }

        ExecutionResult run(
            SkillEntry entry, std::chrono::milliseconds const timeout = 5s)
        {
            ForkGateway gateway{ForkGatewayConfig{.artifact_root = root}};
            return gateway.execute(
                CodeUnit{.source = "// native", .entry = std::move(entry)},
                timeout,
                context,
                {});
        }
    };
}

TEST_F(ForkGatewayTest, returns_transaction)
{
    auto const result = run([](SkillContext &ctx, std::string_view token) {
        if (token != "11111111111111111111111111111111") {
            throw std::runtime_error{"unexpected token"};
        }
        return ctx.build_transaction(
            {solana::system_transfer(ctx.identity(), key(2), 5)});
    });
    ASSERT_TRUE(result.has_transaction());
    auto const tx = solana::decode_transaction(result.transaction());
    ASSERT_TRUE(tx.has_value());
    EXPECT_EQ(tx.value().message.account_keys.front(), key(1));
    EXPECT_TRUE(std::filesystem::exists(root / "run" / "turn_0001.cpp"));
}

TEST_F(ForkGatewayTest, runtime_error)
{
    auto const result = run([](SkillContext &, std::string_view) -> std::string {
        throw std::runtime_error{"insufficient funds"};
    });
    ASSERT_FALSE(result.has_transaction());
    EXPECT_EQ(result.error().kind(), ErrorKind::RuntimeError);
    EXPECT_EQ(result.error().message, "insufficient funds");
}

TEST_F(ForkGatewayTest, policy_violation)
{
    auto const result = run([](SkillContext &ctx, std::string_view) {
        auto const first = ctx.build_transaction(
            {solana::system_transfer(ctx.identity(), key(2), 1)});
        return first + ctx.build_transaction(
                           {solana::system_transfer(ctx.identity(), key(3), 1)});
    });
    ASSERT_FALSE(result.has_transaction());
    EXPECT_EQ(result.error().kind(), ErrorKind::PolicyViolation);
}

TEST_F(ForkGatewayTest, caught_policy_violation)
{
    auto const result = run([](SkillContext &ctx, std::string_view) {
        auto first = ctx.build_transaction(
            {solana::system_transfer(ctx.identity(), key(2), 1)});
        try {
            ctx.build_transaction(
                {solana::system_transfer(ctx.identity(), key(3), 1)});
        }
        catch (PolicyViolationError const &) {
        }
        return first;
    });
    ASSERT_FALSE(result.has_transaction());
    EXPECT_EQ(result.error().kind(), ErrorKind::PolicyViolation);
}

TEST_F(ForkGatewayTest, timeout_never_yields_transaction)
{
    auto const begin = std::chrono::steady_clock::now();
    auto const result = run(
        [](SkillContext &ctx, std::string_view) {
            auto tx = ctx.build_transaction(
                {solana::system_transfer(ctx.identity(), key(2), 1)});
            for (;;) {
                ::pause();
            }
            return tx;
        },
        200ms);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    ASSERT_FALSE(result.has_transaction());
    EXPECT_EQ(result.error().kind(), ErrorKind::Timeout);
}

TEST_F(ForkGatewayTest, missing_entry)
{
    auto const result = run({});
    ASSERT_FALSE(result.has_transaction());
    EXPECT_EQ(result.error().kind(), ErrorKind::InterfaceError);
}
