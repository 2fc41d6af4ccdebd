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

#include <chainbench/bridge/validator_bridge.hpp>
#include <chainbench/core/assert.h>
#include <chainbench/core/config.hpp>
#include <chainbench/decode/instruction_key.hpp>
#include <chainbench/decode/receipt.hpp>
#include <chainbench/ledger/discovery_ledger.hpp>
#include <chainbench/metrics/metrics_recorder.hpp>
#include <chainbench/orchestrator/code_generator.hpp>
#include <chainbench/orchestrator/feedback.hpp>
#include <chainbench/orchestrator/orchestrator.hpp>
#include <chainbench/orchestrator/run_state.hpp>
#include <chainbench/orchestrator/transcript.hpp>
#include <chainbench/orchestrator/turn_state.hpp>
#include <chainbench/runtime/error_record.hpp>
#include <chainbench/runtime/gateway.hpp>
#include <chainbench/solana/keypair.hpp>

#include <fmt/format.h>

#include <quill/Quill.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <variant>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

Orchestrator::Orchestrator(
    OrchestratorConfig config, CodeGenerator &generator,
    RuntimeGateway &gateway, ValidatorBridge &bridge,
    MetricsRecorder &recorder)
    : config_{std::move(config)}
    , generator_{generator}
    , gateway_{gateway}
    , bridge_{bridge}
    , recorder_{recorder}
{
    run_.run_id = config_.run_id;
    run_.model = config_.model;
    run_.budget = config_.budget;
}

void Orchestrator::transition(TurnState const to)
{
    CHAINBENCH_ASSERT(is_valid_transition(run_.state, to));
    LOG_DEBUG(
        "{} turn {}: {} -> {}", run_.run_id, run_.turn_index + 1, run_.state, to);
    run_.state = to;
}

void Orchestrator::terminate(
    TerminationReason const reason, std::optional<std::string> fatal)
{
    transition(TurnState::Terminated);
    run_.termination = reason;
    run_.fatal_error = std::move(fatal);
    if (run_.fatal_error.has_value()) {
        LOG_ERROR(
            "{} terminated after {} turns: {}",
            run_.run_id,
            run_.turn_index,
            *run_.fatal_error);
    }
    else {
        LOG_INFO(
            "{} terminated after {} turns ({}), reward {}",
            run_.run_id,
            run_.turn_index,
            reason,
            run_.cumulative_reward);
    }
}

void Orchestrator::persist() const
{
    if (!config_.output_dir.has_value()) {
        return;
    }
    auto const path = transcript_path(*config_.output_dir, run_.run_id);
    auto const written = write_transcript(path, transcript_json(run_));
    if (written.has_error()) {
        LOG_WARNING(
            "{}: transcript not written: {}",
            run_.run_id,
            written.error().message().c_str());
    }
}

void Orchestrator::complete_turn(
    std::chrono::steady_clock::time_point const started,
    std::chrono::system_clock::time_point const timestamp, uint64_t const delta,
    std::vector<InstructionKey> new_keys, ErrorRecord const *const error,
    std::vector<std::string> const &logs)
{
    transition(TurnState::Feedback);
    ++run_.turn_index;
    run_.cumulative_reward += delta;

    TurnRecord record{
        .index = run_.turn_index,
        .timestamp = timestamp,
        .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started),
        .reward_delta = delta,
        .cumulative_reward = run_.cumulative_reward,
        .new_keys = std::move(new_keys),
        .error = std::nullopt};
    if (error != nullptr) {
        record.error = error->kind();
        run_.errors.push_back(
            TurnError{.turn = record.index, .error = to_json(*error)});
        LOG_INFO(
            "{} turn {}/{}: {}: {}",
            run_.run_id,
            record.index,
            run_.budget,
            error->kind(),
            error->message);
    }
    else {
        LOG_INFO(
            "{} turn {}/{}: reward {} total {}",
            run_.run_id,
            record.index,
            run_.budget,
            delta,
            run_.cumulative_reward);
    }

    feedback_ = make_feedback(record, run_.budget, error, logs);
    run_.transcript.push_back(record);
    recorder_.record_turn(run_.run_id, record);
    persist();

    if (run_.turn_index < run_.budget) {
        transition(TurnState::AwaitingCode);
    }
    else {
        terminate(TerminationReason::BudgetExhausted);
    }
}

void Orchestrator::play_turn(std::stop_token const &stop)
{
    auto const started = std::chrono::steady_clock::now();
    auto const timestamp = std::chrono::system_clock::now();
    uint64_t const turn = run_.turn_index + 1;

    auto const reference = bridge_.latest_reference();
    if (reference.has_error()) {
        terminate(
            TerminationReason::FatalBridgeError,
            fmt::format(
                "latest reference: {}", reference.error().message().c_str()));
        return;
    }

    GenerationRequest const request{
        .run_id = run_.run_id,
        .turn = turn,
        .budget = run_.budget,
        .identity = identity_->public_key(),
        .freshness_token = reference.value(),
        .previous = feedback_};
    auto const unit = generator_.generate(request, stop);
    if (stop.stop_requested()) {
        terminate(TerminationReason::Cancelled);
        return;
    }

    transition(TurnState::Executing);
    ExecutionContext const context{
        .run_id = run_.run_id,
        .turn = turn,
        .identity = identity_->public_key(),
        .freshness_token = reference.value()};
    auto const executed =
        gateway_.execute(unit, config_.execution_timeout, context, stop);
    if (stop.stop_requested()) {
        terminate(TerminationReason::Cancelled);
        return;
    }
    if (!executed.has_transaction()) {
        complete_turn(started, timestamp, 0, {}, &executed.error(), {});
        return;
    }

    transition(TurnState::Submitting);
    auto const signed_tx =
        solana::sign_transaction(executed.transaction(), *identity_);
    if (signed_tx.has_error()) {
        auto const error = ErrorRecord::submission_rejected(fmt::format(
            "cannot sign transaction: {}",
            signed_tx.error().message().c_str()));
        complete_turn(started, timestamp, 0, {}, &error, {});
        return;
    }
    auto const outcome = bridge_.submit(signed_tx.value());
    if (outcome.has_error()) {
        terminate(
            TerminationReason::FatalBridgeError,
            fmt::format("submit: {}", outcome.error().message().c_str()));
        return;
    }
    if (stop.stop_requested()) {
        terminate(TerminationReason::Cancelled);
        return;
    }
    if (auto const *const rejection = std::get_if<Rejection>(&outcome.value())) {
        auto const error = ErrorRecord::submission_rejected(rejection->message);
        complete_turn(started, timestamp, 0, {}, &error, {});
        return;
    }

    auto const &receipt = std::get<TransactionReceipt>(outcome.value());
    transition(TurnState::Scoring);
    auto scored = score_receipt(run_.ledger, receipt, turn);
    if (scored.has_error()) {
        terminate(
            TerminationReason::FatalBridgeError,
            fmt::format(
                "receipt {}: {}",
                receipt.signature,
                scored.error().message().c_str()));
        return;
    }
    if (!receipt.success) {
        auto const error = ErrorRecord::on_chain_failure(
            receipt.error.value_or("unknown error"), receipt.logs);
        complete_turn(started, timestamp, 0, {}, &error, receipt.logs);
        return;
    }
    complete_turn(
        started,
        timestamp,
        scored.value().delta,
        std::move(scored.value().new_keys),
        nullptr,
        receipt.logs);
}

RunSummary Orchestrator::run(std::stop_token stop)
{
    CHAINBENCH_ASSERT(run_.state == TurnState::AwaitingCode);
    LOG_INFO(
        "{} starting: model {}, {} turns",
        run_.run_id,
        run_.model,
        run_.budget);

    if (stop.stop_requested()) {
        terminate(TerminationReason::Cancelled);
    }
    else if (run_.budget == 0) {
        terminate(TerminationReason::BudgetExhausted);
    }
    else {
        auto funded = bridge_.reset_identity(run_.run_id);
        if (funded.has_error()) {
            terminate(
                TerminationReason::FatalBridgeError,
                fmt::format(
                    "identity: {}", funded.error().message().c_str()));
        }
        else {
            identity_.emplace(std::move(funded.value().keypair));
            LOG_INFO(
                "{} identity {} funded with {} lamports",
                run_.run_id,
                identity_->public_key(),
                funded.value().lamports);
        }
    }

    while (run_.state != TurnState::Terminated) {
        if (stop.stop_requested()) {
            terminate(TerminationReason::Cancelled);
            break;
        }
        play_turn(stop);
    }

    auto const summary = run_.summary();
    recorder_.record_summary(summary);
    persist();
    return summary;
}

CHAINBENCH_NAMESPACE_END
