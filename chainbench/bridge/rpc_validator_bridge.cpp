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
#include <chainbench/bridge/rpc_validator_bridge.hpp>
#include <chainbench/bridge/validator_bridge.hpp>
#include <chainbench/core/base64.hpp>
#include <chainbench/core/byte_string.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/core/result.hpp>
#include <chainbench/decode/receipt_json.hpp>
#include <chainbench/solana/keypair.hpp>

#include <boost/outcome/try.hpp>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

bool reaches_commitment(
    nlohmann::json const &status, std::string const &commitment)
{
    auto const it = status.find("confirmationStatus");
    if (it == status.end() || !it->is_string()) {
        // nodes that predate confirmationStatus report confirmations only
        auto const confirmations = status.find("confirmations");
        return confirmations != status.end() && confirmations->is_null();
    }
    auto const level = it->get<std::string>();
    if (level == "finalized") {
        return true;
    }
    if (level == "confirmed") {
        return commitment != "finalized";
    }
    return commitment == "processed";
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

RpcValidatorBridge::RpcValidatorBridge(RpcBridgeConfig config, HttpUrl url)
    : config_{std::move(config)}
    , rpc_{std::move(url), config_.request_timeout}
{
}

Result<std::unique_ptr<RpcValidatorBridge>>
RpcValidatorBridge::create(RpcBridgeConfig config)
{
    auto url = parse_http_url(config.rpc_url);
    if (!url.has_value()) {
        LOG_ERROR("unsupported rpc url '{}'", config.rpc_url);
        return BridgeError::InvalidUrl;
    }
    // the constructor is private, so std::make_unique cannot reach it
    return std::unique_ptr<RpcValidatorBridge>{
        new RpcValidatorBridge{std::move(config), std::move(*url)}};
}

Result<std::optional<nlohmann::json>>
RpcValidatorBridge::wait_for_confirmation(std::string const &signature)
{
    auto const deadline =
        std::chrono::steady_clock::now() + config_.confirmation_timeout;
    for (;;) {
        auto const response = BOOST_OUTCOME_TRYX(rpc_.call(
            "getSignatureStatuses",
            nlohmann::json::array(
                {nlohmann::json::array({signature}),
                 nlohmann::json{{"searchTransactionHistory", true}}})));
        if (response.error.has_value()) {
            LOG_ERROR(
                "getSignatureStatuses failed: {}", response.error->message);
            return BridgeError::RpcError;
        }
        auto const value = response.result.find("value");
        if (value == response.result.end() || !value->is_array()) {
            return BridgeError::ProtocolError;
        }
        if (!value->empty() && value->front().is_object() &&
            reaches_commitment(value->front(), config_.commitment)) {
            return std::optional<nlohmann::json>{value->front()};
        }
        if (std::chrono::steady_clock::now() + config_.poll_interval >
            deadline) {
            return std::optional<nlohmann::json>{};
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
}

Result<std::optional<nlohmann::json>>
RpcValidatorBridge::fetch_transaction(std::string const &signature)
{
    auto const deadline =
        std::chrono::steady_clock::now() + config_.confirmation_timeout;
    for (;;) {
        auto response = BOOST_OUTCOME_TRYX(rpc_.call(
            "getTransaction",
            nlohmann::json::array(
                {signature,
                 nlohmann::json{
                     {"encoding", "json"},
                     {"commitment", config_.commitment},
                     {"maxSupportedTransactionVersion", 0}}})));
        if (response.error.has_value()) {
            LOG_ERROR("getTransaction failed: {}", response.error->message);
            return BridgeError::RpcError;
        }
        if (!response.result.is_null()) {
            return std::optional<nlohmann::json>{std::move(response.result)};
        }
        if (std::chrono::steady_clock::now() + config_.poll_interval >
            deadline) {
            return std::optional<nlohmann::json>{};
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
}

Result<FundedIdentity>
RpcValidatorBridge::reset_identity(std::string_view const run_id)
{
    auto keypair = solana::Keypair::generate();
    if (!keypair) {
        return BridgeError::IdentityFailed;
    }
    auto const address = keypair.value().public_key().to_base58();
    LOG_INFO(
        "{}: airdropping {} lamports to {}",
        run_id,
        config_.starting_lamports,
        address);

    auto const response = BOOST_OUTCOME_TRYX(rpc_.call(
        "requestAirdrop",
        nlohmann::json::array(
            {address,
             config_.starting_lamports,
             nlohmann::json{{"commitment", config_.commitment}}})));
    if (response.error.has_value() || !response.result.is_string()) {
        LOG_ERROR(
            "{}: airdrop request failed: {}",
            run_id,
            response.error.has_value() ? response.error->message
                                       : response.result.dump());
        return BridgeError::AirdropFailed;
    }

    auto const status = BOOST_OUTCOME_TRYX(
        wait_for_confirmation(response.result.get<std::string>()));
    if (!status.has_value()) {
        LOG_ERROR("{}: airdrop was not confirmed in time", run_id);
        return BridgeError::AirdropFailed;
    }
    if (auto const err = status->find("err");
        err != status->end() && !err->is_null()) {
        LOG_ERROR("{}: airdrop failed: {}", run_id, err->dump());
        return BridgeError::AirdropFailed;
    }
    LOG_INFO("{}: airdrop confirmed", run_id);
    return FundedIdentity{
        .keypair = std::move(keypair).value(),
        .lamports = config_.starting_lamports};
}

Result<std::string> RpcValidatorBridge::latest_reference()
{
    auto const response = BOOST_OUTCOME_TRYX(rpc_.call(
        "getLatestBlockhash",
        nlohmann::json::array(
            {nlohmann::json{{"commitment", config_.commitment}}})));
    if (response.error.has_value()) {
        LOG_ERROR("getLatestBlockhash failed: {}", response.error->message);
        return BridgeError::RpcError;
    }
    auto const value = response.result.find("value");
    if (value == response.result.end() || !value->is_object()) {
        return BridgeError::ProtocolError;
    }
    auto const blockhash = value->find("blockhash");
    if (blockhash == value->end() || !blockhash->is_string()) {
        return BridgeError::ProtocolError;
    }
    return blockhash->get<std::string>();
}

Result<SubmitOutcome>
RpcValidatorBridge::submit(byte_string_view const signed_tx)
{
    auto const sent = BOOST_OUTCOME_TRYX(rpc_.call(
        "sendTransaction",
        nlohmann::json::array(
            {base64_encode(signed_tx),
             nlohmann::json{
                 {"encoding", "base64"},
                 {"skipPreflight", true},
                 {"preflightCommitment", config_.commitment}}})));
    if (sent.error.has_value()) {
        LOG_INFO("transaction rejected: {}", sent.error->message);
        return SubmitOutcome{Rejection{sent.error->message}};
    }
    if (!sent.result.is_string()) {
        return BridgeError::ProtocolError;
    }
    auto const signature = sent.result.get<std::string>();

    auto const status = BOOST_OUTCOME_TRYX(wait_for_confirmation(signature));
    if (!status.has_value()) {
        return SubmitOutcome{Rejection{fmt::format(
            "transaction {} was not confirmed within {} ms",
            signature,
            config_.confirmation_timeout.count())}};
    }

    auto const tx = BOOST_OUTCOME_TRYX(fetch_transaction(signature));
    if (!tx.has_value()) {
        return SubmitOutcome{Rejection{fmt::format(
            "transaction {} was confirmed but could not be fetched",
            signature)}};
    }
    auto receipt = parse_receipt(*tx);
    if (!receipt) {
        LOG_ERROR(
            "cannot parse receipt of {}: {}",
            signature,
            receipt.error().message().c_str());
        return BridgeError::ProtocolError;
    }
    if (receipt.value().signature.empty()) {
        receipt.value().signature = signature;
    }
    return SubmitOutcome{std::move(receipt).value()};
}

CHAINBENCH_NAMESPACE_END
