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
#include <chainbench/core/byte_string.hpp>

#include <gtest/gtest.h>

using namespace chainbench;

TEST(base64, encode)
{
    EXPECT_EQ(base64_encode({}), "");
    EXPECT_EQ(base64_encode(to_byte_string_view("hi")), "aGk=");
    EXPECT_EQ(base64_encode(to_byte_string_view("hello")), "aGVsbG8=");
    EXPECT_EQ(base64_encode(to_byte_string_view("abc")), "YWJj");
}

TEST(base64, decode_strips_padding)
{
    auto const one = base64_decode("aGk=");
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(to_string_view(*one), "hi");

    auto const two = base64_decode("YQ==");
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ(to_string_view(*two), "a");

    auto const none = base64_decode("YWJj\n");
    ASSERT_TRUE(none.has_value());
    EXPECT_EQ(to_string_view(*none), "abc");
}

TEST(base64, decode_rejects_malformed_input)
{
    EXPECT_FALSE(base64_decode("aGk").has_value());
    EXPECT_FALSE(base64_decode("a!b?").has_value());
}
