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

#include <chainbench/bridge/bridge_error.hpp>
#include <chainbench/bridge/http_client.hpp>
#include <chainbench/bridge/json_rpc.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/core/likely.h>
#include <chainbench/core/result.hpp>

#include <boost/outcome/try.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

CHAINBENCH_NAMESPACE_BEGIN

JsonRpcClient::JsonRpcClient(
    HttpUrl url, std::chrono::milliseconds const timeout)
    : url_{std::move(url)}
    , timeout_{timeout}
{
}

Result<RpcResponse>
JsonRpcClient::call(std::string_view const method, nlohmann::json params)
{
    nlohmann::json const request{
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", std::string{method}},
        {"params", std::move(params)}};

    auto const http =
        BOOST_OUTCOME_TRYX(http_post(url_, request.dump(), timeout_));

    auto body = nlohmann::json::parse(http.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        if (http.status != 200) {
            LOG_WARNING("{} returned http status {}", method, http.status);
            return BridgeError::HttpError;
        }
        LOG_WARNING("{} returned a malformed body", method);
        return BridgeError::ProtocolError;
    }

    RpcResponse response;
    if (auto const it = body.find("error"); it != body.end() && !it->is_null()) {
        RpcFailure failure;
        if (it->is_object()) {
            if (auto const code = it->find("code");
                code != it->end() && code->is_number_integer()) {
                failure.code = code->get<int64_t>();
            }
            if (auto const message = it->find("message");
                message != it->end() && message->is_string()) {
                failure.message = message->get<std::string>();
            }
            if (auto const data = it->find("data"); data != it->end()) {
                failure.data = *data;
            }
        }
        else {
            failure.message = it->dump();
        }
        response.error = std::move(failure);
        return response;
    }
    if (CHAINBENCH_UNLIKELY(!body.contains("result"))) {
        if (http.status != 200) {
            return BridgeError::HttpError;
        }
        return BridgeError::ProtocolError;
    }
    response.result = std::move(body["result"]);
    return response;
}

CHAINBENCH_NAMESPACE_END
