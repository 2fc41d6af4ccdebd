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
#include <chainbench/core/config.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

constexpr char ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int alphabet_index(char const c)
{
    for (int i = 0; i < 58; ++i) {
        if (ALPHABET[i] == c) {
            return i;
        }
    }
    return -1;
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

std::string base58_encode(byte_string_view const in)
{
    size_t zeros = 0;
    while (zeros < in.size() && in[zeros] == 0) {
        ++zeros;
    }

    // log(256) / log(58), rounded up
    std::vector<uint8_t> digits((in.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < in.size(); ++i) {
        unsigned carry = in[i];
        size_t j = 0;
        for (auto it = digits.rbegin();
             (carry != 0 || j < length) && it != digits.rend();
             ++it, ++j) {
            carry += 256u * *it;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string out(zeros, '1');
    out.reserve(zeros + static_cast<size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) {
        out.push_back(ALPHABET[*it]);
    }
    return out;
}

std::optional<byte_string> base58_decode(std::string_view const in)
{
    size_t zeros = 0;
    while (zeros < in.size() && in[zeros] == '1') {
        ++zeros;
    }

    // log(58) / log(256), rounded up
    std::vector<uint8_t> bytes((in.size() - zeros) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < in.size(); ++i) {
        int const value = alphabet_index(in[i]);
        if (value < 0) {
            return std::nullopt;
        }
        unsigned carry = static_cast<unsigned>(value);
        size_t j = 0;
        for (auto it = bytes.rbegin();
             (carry != 0 || j < length) && it != bytes.rend();
             ++it, ++j) {
            carry += 58u * *it;
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    byte_string out(zeros, 0);
    out.append(it, bytes.end());
    return out;
}

CHAINBENCH_NAMESPACE_END
