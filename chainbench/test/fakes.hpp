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

#include <chainbench/bridge/bridge_error.hpp>
#include <chainbench/bridge/validator_bridge.hpp>
#include <chainbench/core/byte_string.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/core/result.hpp>
#include <chainbench/decode/receipt.hpp>
#include <chainbench/metrics/metrics_recorder.hpp>
#include <chainbench/orchestrator/code_generator.hpp>
#include <chainbench/orchestrator/run_state.hpp>
#include <chainbench/runtime/code_unit.hpp>
#include <chainbench/runtime/error_record.hpp>
#include <chainbench/runtime/execution_result.hpp>
#include <chainbench/runtime/gateway.hpp>
#include <chainbench/solana/keypair.hpp>
#include <chainbench/solana/public_key.hpp>
#include <chainbench/solana/transaction.hpp>

#include <boost/outcome/try.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

namespace test
{
    // Receipt of a successful transaction whose instructions invoke the
    // given (program, discriminator) pairs in order
    inline TransactionReceipt make_receipt(
        std::vector<std::pair<std::string, std::optional<uint8_t>>> const
            &calls)
    {
        TransactionReceipt receipt;
        receipt.success = true;
        receipt.signature = "sig";
        receipt.account_keys.push_back("Payer");
        for (auto const &[program, discriminator] : calls) {
            receipt.account_keys.push_back(program);
            ReceiptInstruction ix;
            ix.program_id_index =
                static_cast<uint32_t>(receipt.account_keys.size() - 1);
            if (discriminator.has_value()) {
                ix.data.push_back(*discriminator);
            }
            receipt.instructions.push_back(std::move(ix));
        }
        receipt.logs.push_back("Program log: ok");
        return receipt;
    }

    // Records every request and hands out "turn <n>" as source
    class ScriptedGenerator final : public CodeGenerator
    {
        std::function<void(GenerationRequest const &)> hook_;

    public:
        std::vector<GenerationRequest> requests;

        ScriptedGenerator() = default;

        explicit ScriptedGenerator(
            std::function<void(GenerationRequest const &)> hook)
            : hook_{std::move(hook)}
        {
        }

        CodeUnit generate(GenerationRequest const &request, std::stop_token)
            override
        {
            requests.push_back(request);
            if (hook_) {
                hook_(request);
            }
            return CodeUnit{.source = "turn " + std::to_string(request.turn)};
        }
    };

    // Turns listed in `failures` return that error record, every other
    // turn returns a transfer from the run identity
    class ScriptedGateway final : public RuntimeGateway
    {
    public:
        std::vector<std::pair<uint64_t, ErrorRecord>> failures;
        std::vector<ExecutionContext> contexts;

        ExecutionResult execute(
            CodeUnit const &, std::chrono::milliseconds,
            ExecutionContext const &context, std::stop_token) override
        {
            contexts.push_back(context);
            for (auto const &[turn, error] : failures) {
                if (turn == context.turn) {
                    return ExecutionResult::failure(error);
                }
            }
            auto const blockhash =
                solana::Hash::from_base58(context.freshness_token);
            if (!blockhash.has_value()) {
                throw std::invalid_argument{"freshness token"};
            }
            solana::PublicKey destination;
            destination.bytes.fill(7);
            auto const message = solana::compile_message(
                context.identity,
                {solana::system_transfer(context.identity, destination, 1)},
                *blockhash);
            if (!message) {
                throw std::runtime_error{"compile_message"};
            }
            return ExecutionResult::success(
                solana::make_unsigned_transaction(message.value()));
        }
    };

    // In memory replica. Submissions are answered by `on_submit`, called
    // with the 1-based submission count.
    class FakeBridge final : public ValidatorBridge
    {
    public:
        std::function<Result<SubmitOutcome>(uint64_t)> on_submit;
        bool fail_reset{false};
        std::optional<solana::PublicKey> identity{};
        std::vector<byte_string> submitted{};
        std::string blockhash{};

        FakeBridge()
        {
            solana::Hash hash;
            hash.bytes.fill(3);
            blockhash = hash.to_base58();
        }

        Result<FundedIdentity> reset_identity(std::string_view) override
        {
            if (fail_reset) {
                return BridgeError::AirdropFailed;
            }
            auto keypair = BOOST_OUTCOME_TRYX(solana::Keypair::generate());
            identity = keypair.public_key();
            return FundedIdentity{
                .keypair = std::move(keypair), .lamports = 1'000};
        }

        Result<std::string> latest_reference() override
        {
            return blockhash;
        }

        Result<SubmitOutcome> submit(byte_string_view const signed_tx) override
        {
            submitted.emplace_back(signed_tx);
            if (!on_submit) {
                return SubmitOutcome{make_receipt({})};
            }
            return on_submit(submitted.size());
        }
    };

    class MemoryRecorder final : public MetricsRecorder
    {
        std::mutex mutex_;

    public:
        std::vector<std::pair<std::string, TurnRecord>> turns;
        std::vector<RunSummary> summaries;

        void record_turn(
            std::string_view const run_id, TurnRecord const &record) override
        {
            std::scoped_lock const lock{mutex_};
            turns.emplace_back(std::string{run_id}, record);
        }

        void record_summary(RunSummary const &summary) override
        {
            std::scoped_lock const lock{mutex_};
            summaries.push_back(summary);
        }
    };
}

CHAINBENCH_NAMESPACE_END
