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

#include <chainbench/bridge/http_client.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

struct RpcFailure
{
    int64_t code{0};
    std::string message{};
    nlohmann::json data{};
};

// An answered call. Transport and framing problems are reported through
// the Result error channel instead.
struct RpcResponse
{
    nlohmann::json result{};
    std::optional<RpcFailure> error{};
};

class JsonRpcClient
{
    HttpUrl url_;
    std::chrono::milliseconds timeout_;
    uint64_t next_id_{1};

public:
    JsonRpcClient(HttpUrl, std::chrono::milliseconds timeout);

    Result<RpcResponse> call(std::string_view method, nlohmann::json params);
};

CHAINBENCH_NAMESPACE_END
