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

#include <chainbench/bridge/validator_bridge.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/metrics/metrics_recorder.hpp>
#include <chainbench/orchestrator/code_generator.hpp>
#include <chainbench/orchestrator/feedback.hpp>
#include <chainbench/orchestrator/run_state.hpp>
#include <chainbench/orchestrator/turn_state.hpp>
#include <chainbench/runtime/error_record.hpp>
#include <chainbench/runtime/gateway.hpp>
#include <chainbench/solana/keypair.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

struct OrchestratorConfig
{
    std::string run_id{};
    std::string model{};
    uint64_t budget{0};
    std::chrono::milliseconds execution_timeout{std::chrono::seconds{60}};
    // transcript is persisted only when set
    std::optional<std::filesystem::path> output_dir{};
};

// Drives one run: turns are strictly sequential and every completed turn
// appends exactly one TurnRecord. The collaborators are borrowed and must
// outlive the orchestrator; none of them is shared with another run except
// the recorder.
class Orchestrator
{
    OrchestratorConfig config_;
    CodeGenerator &generator_;
    RuntimeGateway &gateway_;
    ValidatorBridge &bridge_;
    MetricsRecorder &recorder_;

    RunState run_;
    std::optional<solana::Keypair> identity_{};
    std::optional<TurnFeedback> feedback_{};

    void transition(TurnState);
    void terminate(TerminationReason, std::optional<std::string> fatal = {});
    void complete_turn(
        std::chrono::steady_clock::time_point started,
        std::chrono::system_clock::time_point timestamp, uint64_t delta,
        std::vector<InstructionKey> new_keys, ErrorRecord const *,
        std::vector<std::string> const &logs);
    void play_turn(std::stop_token const &);
    void persist() const;

public:
    Orchestrator(
        OrchestratorConfig, CodeGenerator &, RuntimeGateway &,
        ValidatorBridge &, MetricsRecorder &);

    RunSummary run(std::stop_token);

    RunState const &state() const
    {
        return run_;
    }

    // feedback of the most recent completed turn
    std::optional<TurnFeedback> const &feedback() const
    {
        return feedback_;
    }
};

CHAINBENCH_NAMESPACE_END
