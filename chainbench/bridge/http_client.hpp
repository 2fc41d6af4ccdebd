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

#pragma once

#include <chainbench/core/config.hpp>
#include <chainbench/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

struct HttpUrl
{
    std::string host{};
    uint16_t port{80};
    std::string path{"/"};
};

// Plain http only; the replica listens on loopback
std::optional<HttpUrl> parse_http_url(std::string_view);

struct HttpResponse
{
    int status{0};
    // lower case names
    std::map<std::string, std::string> headers{};
    std::string body{};
};

// One request per connection. The timeout bounds connect, send and the
// whole response.
Result<HttpResponse> http_post(
    HttpUrl const &, std::string const &body,
    std::chrono::milliseconds timeout);

// Parses a complete HTTP/1.1 response, decoding chunked bodies
Result<HttpResponse> parse_http_response(std::string_view);

CHAINBENCH_NAMESPACE_END
