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

#include <chainbench/core/base64.hpp>
#include <chainbench/runtime/skill_context.hpp>
#include <chainbench/runtime/skill_host.hpp>
#include <chainbench/solana/public_key.hpp>
#include <chainbench/solana/transaction.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace chainbench;

namespace
{
    constexpr char const *BLOCKHASH = "11111111111111111111111111111111";

    solana::PublicKey key(uint8_t const fill)
    {
        solana::PublicKey k;
        k.bytes.fill(fill);
        return k;
    }
}

TEST(skill_context, builds_unsigned_transaction)
{
    SkillContext ctx{key(1), BLOCKHASH};
    auto const b64 =
        ctx.build_transaction({solana::system_transfer(key(1), key(2), 10)});
    EXPECT_EQ(ctx.builds(), 1);

    auto const bytes = base64_decode(b64);
    ASSERT_TRUE(bytes.has_value());
    auto const tx = solana::decode_transaction(*bytes);
    ASSERT_TRUE(tx.has_value());
    EXPECT_EQ(tx.value().message.account_keys.front(), key(1));
    EXPECT_EQ(tx.value().message.recent_blockhash, solana::Hash{});
}

TEST(skill_context, second_build_violates_policy)
{
    SkillContext ctx{key(1), BLOCKHASH};
    ctx.build_transaction({solana::system_transfer(key(1), key(2), 10)});
    try {
        ctx.build_transaction({solana::system_transfer(key(1), key(3), 10)});
        FAIL() << "expected a policy violation";
    }
    catch (PolicyViolationError const &e) {
        EXPECT_EQ(e.attempts(), 2);
        EXPECT_EQ(e.limit(), TRANSACTIONS_PER_TURN);
        EXPECT_NE(std::string{e.what()}.find("per turn"), std::string::npos);
    }
}

TEST(skill_context, invalid_token)
{
    SkillContext ctx{key(1), "not-a-blockhash"};
    EXPECT_THROW(
        ctx.build_transaction({solana::system_transfer(key(1), key(2), 1)}),
        std::invalid_argument);
}

TEST(skill_host, reports)
{
    SkillContext ctx{key(1), BLOCKHASH};

    auto const missing = host_skill({}, ctx);
    EXPECT_EQ(missing.exit_code, 1);
    EXPECT_EQ(missing.body["type"], "InterfaceError");

    auto const ok = host_skill(
        [](SkillContext &c, std::string_view) {
            return c.build_transaction(
                {solana::system_transfer(key(1), key(2), 1)});
        },
        ctx);
    EXPECT_EQ(ok.exit_code, 0);
    EXPECT_TRUE(ok.body["serialized_tx"].is_string());

    auto const again = host_skill(
        [](SkillContext &c, std::string_view) {
            return c.build_transaction(
                {solana::system_transfer(key(1), key(2), 1)});
        },
        ctx);
    EXPECT_EQ(again.exit_code, 1);
    EXPECT_EQ(again.body["type"], "PolicyViolation");
    EXPECT_EQ(again.body["attempts"], 2);

    SkillContext fresh{key(1), BLOCKHASH};
    auto const thrown = host_skill(
        [](SkillContext &, std::string_view) -> std::string {
            throw std::runtime_error{"account not found"};
        },
        fresh);
    EXPECT_EQ(thrown.exit_code, 1);
    EXPECT_EQ(thrown.body["type"], "RuntimeError");
    EXPECT_EQ(thrown.body["error"], "account not found");
    EXPECT_TRUE(thrown.body["serialized_tx"].is_null());
}

TEST(skill_host, swallowed_violation_still_fails)
{
    SkillContext ctx{key(1), BLOCKHASH};
    auto const report = host_skill(
        [](SkillContext &c, std::string_view) {
            auto first = c.build_transaction(
                {solana::system_transfer(key(1), key(2), 1)});
            try {
                c.build_transaction(
                    {solana::system_transfer(key(1), key(3), 1)});
            }
            catch (PolicyViolationError const &) {
            }
            return first;
        },
        ctx);
    EXPECT_TRUE(ctx.violated());
    EXPECT_EQ(report.exit_code, 1);
    EXPECT_EQ(report.body["type"], "PolicyViolation");
    EXPECT_TRUE(report.body["serialized_tx"].is_null());
    EXPECT_EQ(report.body["attempts"], 2);
    EXPECT_EQ(report.body["limit"], TRANSACTIONS_PER_TURN);

    auto const rethrown = host_skill(
        [](SkillContext &, std::string_view) -> std::string {
            throw std::runtime_error{"gave up"};
        },
        ctx);
    EXPECT_EQ(rethrown.body["type"], "PolicyViolation");
}
