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
#include <chainbench/core/config.hpp>

#include <openssl/evp.h>

#include <optional>
#include <string>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

std::string base64_encode(byte_string_view const in)
{
    if (in.empty()) {
        return {};
    }
    std::string out(4 * ((in.size() + 2) / 3), '\0');
    int const n = EVP_EncodeBlock(
        reinterpret_cast<unsigned char *>(out.data()),
        in.data(),
        static_cast<int>(in.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

std::optional<byte_string> base64_decode(std::string_view in)
{
    while (!in.empty() &&
           (in.back() == '\n' || in.back() == '\r' || in.back() == ' ')) {
        in.remove_suffix(1);
    }
    if (in.empty()) {
        return byte_string{};
    }
    if (in.size() % 4 != 0) {
        return std::nullopt;
    }

    byte_string out(3 * in.size() / 4, 0);
    int const n = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<unsigned char const *>(in.data()),
        static_cast<int>(in.size()));
    if (n < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock does not strip the bytes produced by padding
    size_t padding = 0;
    if (in.back() == '=') {
        ++padding;
        if (in[in.size() - 2] == '=') {
            ++padding;
        }
    }
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

CHAINBENCH_NAMESPACE_END
