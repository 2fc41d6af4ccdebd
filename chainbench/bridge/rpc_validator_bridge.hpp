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

#include <chainbench/bridge/json_rpc.hpp>
#include <chainbench/bridge/validator_bridge.hpp>
#include <chainbench/core/byte_string.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

inline constexpr uint64_t LAMPORTS_PER_SOL = 1'000'000'000;

struct RpcBridgeConfig
{
    std::string rpc_url{"http://127.0.0.1:8899"};
    std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};
    std::chrono::milliseconds confirmation_timeout{std::chrono::seconds{30}};
    std::chrono::milliseconds poll_interval{250};
    uint64_t starting_lamports{2 * LAMPORTS_PER_SOL};
    std::string commitment{"confirmed"};
};

// Solana JSON-RPC implementation of the bridge. Transactions are sent
// without preflight so that failing programs still produce a receipt.
class RpcValidatorBridge final : public ValidatorBridge
{
    RpcBridgeConfig config_;
    JsonRpcClient rpc_;

    RpcValidatorBridge(RpcBridgeConfig, HttpUrl);

    // Polls getSignatureStatuses until the configured commitment is reached.
    // Returns the status object, or nullopt if the confirmation timeout
    // passed first.
    Result<std::optional<nlohmann::json>>
    wait_for_confirmation(std::string const &signature);

    Result<std::optional<nlohmann::json>>
    fetch_transaction(std::string const &signature);

public:
    static Result<std::unique_ptr<RpcValidatorBridge>> create(RpcBridgeConfig);

    Result<FundedIdentity> reset_identity(std::string_view run_id) override;
    Result<std::string> latest_reference() override;
    Result<SubmitOutcome> submit(byte_string_view signed_tx) override;
};

CHAINBENCH_NAMESPACE_END
