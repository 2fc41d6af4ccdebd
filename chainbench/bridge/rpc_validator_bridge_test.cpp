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
#include <chainbench/bridge/rpc_validator_bridge.hpp>
#include <chainbench/bridge/validator_bridge.hpp>
#include <chainbench/core/byte_string.hpp>
#include <chainbench/decode/receipt.hpp>
#include <chainbench/test/fake_rpc_server.hpp>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <variant>
#include <vector>

using namespace chainbench;
using namespace chainbench::test;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace
{
    json const BLOCKHASH = "4uQeVj5tqViQh7yWWGStvkEG1Zmhx6uasJtWCJziofM";

    json result(json value)
    {
        return json{{"result", std::move(value)}};
    }

    json failure(int const code, std::string const &message)
    {
        return json{{"error", {{"code", code}, {"message", message}}}};
    }

    json statuses(json status)
    {
        return result(
            {{"context", {{"slot", 5}}},
             {"value", json::array({std::move(status)})}});
    }

    json confirmed()
    {
        return {
            {"slot", 5},
            {"confirmations", 0},
            {"err", nullptr},
            {"confirmationStatus", "confirmed"}};
    }

    json receipt()
    {
        return json::parse(R"({
            "slot": 5,
            "meta": {"err": null, "logMessages": ["Program A success"]},
            "transaction": {
                "signatures": [],
                "message": {
                    "accountKeys": ["Payer", "A"],
                    "instructions": [
                        {"programIdIndex": 1, "accounts": [0], "data": "2"}
                    ]
                }
            }
        })");
    }

    RpcBridgeConfig config_for(FakeRpcServer const &server)
    {
        RpcBridgeConfig config;
        config.rpc_url = server.url();
        config.request_timeout = 2s;
        config.confirmation_timeout = 300ms;
        config.poll_interval = 10ms;
        config.starting_lamports = 5;
        return config;
    }
}

TEST(rpc_validator_bridge, invalid_url)
{
    RpcBridgeConfig config;
    config.rpc_url = "https://localhost:8899";
    auto const bridge = RpcValidatorBridge::create(config);
    ASSERT_TRUE(bridge.has_error());
    EXPECT_EQ(bridge.error(), BridgeError::InvalidUrl);
}

TEST(rpc_validator_bridge, latest_reference)
{
    FakeRpcServer server{[](std::string const &method, json const &) {
        EXPECT_EQ(method, "getLatestBlockhash");
        return result(
            {{"context", {{"slot", 5}}},
             {"value",
              {{"blockhash", BLOCKHASH}, {"lastValidBlockHeight", 150}}}});
    }};
    auto bridge = RpcValidatorBridge::create(config_for(server));
    ASSERT_TRUE(bridge.has_value());
    auto const reference = bridge.value()->latest_reference();
    ASSERT_TRUE(reference.has_value());
    EXPECT_EQ(reference.value(), BLOCKHASH.get<std::string>());
}

TEST(rpc_validator_bridge, latest_reference_malformed)
{
    FakeRpcServer server{[](std::string const &, json const &) {
        return result({{"value", nullptr}});
    }};
    auto bridge = RpcValidatorBridge::create(config_for(server));
    ASSERT_TRUE(bridge.has_value());
    auto const reference = bridge.value()->latest_reference();
    ASSERT_TRUE(reference.has_error());
    EXPECT_EQ(reference.error(), BridgeError::ProtocolError);
}

TEST(rpc_validator_bridge, reset_identity)
{
    std::atomic<int> polls{0};
    FakeRpcServer server{
        [&polls](std::string const &method, json const &params) {
            if (method == "requestAirdrop") {
                EXPECT_EQ(params.at(1), 5);
                return result("airdropsig");
            }
            EXPECT_EQ(method, "getSignatureStatuses");
            EXPECT_EQ(params.at(0).at(0), "airdropsig");
            // unknown on the first poll, confirmed afterwards
            if (polls++ == 0) {
                return statuses(nullptr);
            }
            return statuses(confirmed());
        }};
    auto bridge = RpcValidatorBridge::create(config_for(server));
    ASSERT_TRUE(bridge.has_value());
    auto const identity = bridge.value()->reset_identity("run");
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity.value().lamports, 5);
    EXPECT_GE(polls.load(), 2);
    EXPECT_EQ(server.methods().front(), "requestAirdrop");
}

TEST(rpc_validator_bridge, reset_identity_airdrop_refused)
{
    FakeRpcServer server{[](std::string const &, json const &) {
        return failure(-32600, "airdrop limit reached");
    }};
    auto bridge = RpcValidatorBridge::create(config_for(server));
    ASSERT_TRUE(bridge.has_value());
    auto const identity = bridge.value()->reset_identity("run");
    ASSERT_TRUE(identity.has_error());
    EXPECT_EQ(identity.error(), BridgeError::AirdropFailed);
}

TEST(rpc_validator_bridge, reset_identity_never_confirmed)
{
    FakeRpcServer server{[](std::string const &method, json const &) {
        if (method == "requestAirdrop") {
            return result("airdropsig");
        }
        return statuses(nullptr);
    }};
    auto bridge = RpcValidatorBridge::create(config_for(server));
    ASSERT_TRUE(bridge.has_value());
    auto const identity = bridge.value()->reset_identity("run");
    ASSERT_TRUE(identity.has_error());
    EXPECT_EQ(identity.error(), BridgeError::AirdropFailed);
}

TEST(rpc_validator_bridge, submit_rejected)
{
    FakeRpcServer server{[](std::string const &method, json const &) {
        EXPECT_EQ(method, "sendTransaction");
        return failure(-32002, "Blockhash not found");
    }};
    auto bridge = RpcValidatorBridge::create(config_for(server));
    ASSERT_TRUE(bridge.has_value());
    auto const outcome = bridge.value()->submit(byte_string{0x01, 0x02});
    ASSERT_TRUE(outcome.has_value());
    auto const *const rejection = std::get_if<Rejection>(&outcome.value());
    ASSERT_NE(rejection, nullptr);
    EXPECT_EQ(rejection->message, "Blockhash not found");
}

TEST(rpc_validator_bridge, submit_executed)
{
    FakeRpcServer server{[](std::string const &method, json const &params) {
        if (method == "sendTransaction") {
            // base64 of 01 02
            EXPECT_EQ(params.at(0), "AQI=");
            EXPECT_EQ(params.at(1).at("skipPreflight"), true);
            return result("txsig");
        }
        if (method == "getSignatureStatuses") {
            return statuses(confirmed());
        }
        EXPECT_EQ(method, "getTransaction");
        EXPECT_EQ(params.at(0), "txsig");
        return result(receipt());
    }};
    auto bridge = RpcValidatorBridge::create(config_for(server));
    ASSERT_TRUE(bridge.has_value());
    auto const outcome = bridge.value()->submit(byte_string{0x01, 0x02});
    ASSERT_TRUE(outcome.has_value());
    auto const *const executed =
        std::get_if<TransactionReceipt>(&outcome.value());
    ASSERT_NE(executed, nullptr);
    EXPECT_TRUE(executed->success);
    EXPECT_EQ(executed->signature, "txsig");
    ASSERT_EQ(executed->instructions.size(), 1);
    EXPECT_EQ(
        server.methods(),
        (std::vector<std::string>{
            "sendTransaction", "getSignatureStatuses", "getTransaction"}));
}

TEST(rpc_validator_bridge, submit_not_confirmed)
{
    FakeRpcServer server{[](std::string const &method, json const &) {
        if (method == "sendTransaction") {
            return result("txsig");
        }
        return statuses(nullptr);
    }};
    auto bridge = RpcValidatorBridge::create(config_for(server));
    ASSERT_TRUE(bridge.has_value());
    auto const outcome = bridge.value()->submit(byte_string{0x01});
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(std::holds_alternative<Rejection>(outcome.value()));
}

TEST(rpc_validator_bridge, unreachable)
{
    RpcBridgeConfig config;
    config.rpc_url = "http://127.0.0.1:1";
    config.request_timeout = 500ms;
    auto bridge = RpcValidatorBridge::create(config);
    ASSERT_TRUE(bridge.has_value());
    EXPECT_TRUE(bridge.value()->latest_reference().has_error());
}
