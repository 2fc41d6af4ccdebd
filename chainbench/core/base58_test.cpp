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

#include <chainbench/core/base58.hpp>
#include <chainbench/core/byte_string.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace chainbench;

TEST(base58, encode)
{
    EXPECT_EQ(base58_encode({}), "");
    EXPECT_EQ(
        base58_encode(to_byte_string_view("Hello World!")),
        "2NEpo7TZRRrLZSi2U");
    EXPECT_EQ(base58_encode(byte_string(3, 0)), "111");
    EXPECT_EQ(
        base58_encode(byte_string(32, 0)), "11111111111111111111111111111111");
    byte_string const bytes{0x00, 0x00, 0x00, 0x28, 0x7f, 0xb4, 0xcd};
    EXPECT_EQ(base58_encode(bytes), "111233QC4");
}

TEST(base58, decode)
{
    auto const hello = base58_decode("2NEpo7TZRRrLZSi2U");
    ASSERT_TRUE(hello.has_value());
    EXPECT_EQ(to_string_view(*hello), "Hello World!");

    auto const zeros = base58_decode("111");
    ASSERT_TRUE(zeros.has_value());
    EXPECT_EQ(*zeros, byte_string(3, 0));

    auto const mixed = base58_decode("111233QC4");
    ASSERT_TRUE(mixed.has_value());
    EXPECT_EQ(
        *mixed, (byte_string{0x00, 0x00, 0x00, 0x28, 0x7f, 0xb4, 0xcd}));
}

TEST(base58, rejects_characters_outside_alphabet)
{
    EXPECT_FALSE(base58_decode("0OIl").has_value());
    EXPECT_FALSE(base58_decode("abc+").has_value());
}
