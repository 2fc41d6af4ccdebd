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
#include <chainbench/solana/short_vec.hpp>
#include <chainbench/solana/transaction_error.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace chainbench;
using namespace chainbench::solana;

namespace
{
    byte_string encoded(uint16_t const value)
    {
        byte_string out;
        encode_short_vec(out, value);
        return out;
    }
}

TEST(short_vec, encode)
{
    EXPECT_EQ(encoded(0), (byte_string{0x00}));
    EXPECT_EQ(encoded(0x7f), (byte_string{0x7f}));
    EXPECT_EQ(encoded(0x80), (byte_string{0x80, 0x01}));
    EXPECT_EQ(encoded(0x3fff), (byte_string{0xff, 0x7f}));
    EXPECT_EQ(encoded(0x4000), (byte_string{0x80, 0x80, 0x01}));
    EXPECT_EQ(encoded(0xffff), (byte_string{0xff, 0xff, 0x03}));
}

TEST(short_vec, decode_consumes_prefix)
{
    byte_string const bytes{0x80, 0x01, 0xaa};
    byte_string_view in{bytes};
    auto const value = decode_short_vec(in);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 0x80);
    EXPECT_EQ(in.size(), 1);
    EXPECT_EQ(in.front(), 0xaa);
}

TEST(short_vec, decode_errors)
{
    byte_string const truncated{0x80};
    byte_string_view in{truncated};
    auto const short_input = decode_short_vec(in);
    ASSERT_TRUE(short_input.has_error());
    EXPECT_EQ(short_input.error(), TransactionError::InputTooShort);

    byte_string const overflow{0xff, 0xff, 0x04};
    in = overflow;
    auto const too_large = decode_short_vec(in);
    ASSERT_TRUE(too_large.has_error());
    EXPECT_EQ(too_large.error(), TransactionError::ShortVecOverflow);

    byte_string const too_long{0x80, 0x80, 0x80, 0x01};
    in = too_long;
    EXPECT_TRUE(decode_short_vec(in).has_error());
}
