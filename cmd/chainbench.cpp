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

#include <chainbench/bridge/replica_process.hpp>
#include <chainbench/bridge/rpc_validator_bridge.hpp>
#include <chainbench/config/environment_config.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/core/log_level_map.hpp>
#include <chainbench/core/logging.hpp>
#include <chainbench/metrics/metrics_recorder.hpp>
#include <chainbench/orchestrator/batch.hpp>
#include <chainbench/orchestrator/command_generator.hpp>
#include <chainbench/orchestrator/orchestrator.hpp>
#include <chainbench/orchestrator/turn_state.hpp>
#include <chainbench/runtime/fork_gateway.hpp>
#include <chainbench/runtime/gateway.hpp>
#include <chainbench/runtime/native_skill.hpp>
#include <chainbench/runtime/process_gateway.hpp>

#include <CLI/CLI.hpp>

#include <fmt/format.h>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

sig_atomic_t volatile stop;

void signal_handler(int)
{
    stop = 1;
}

using namespace chainbench;
namespace fs = std::filesystem;

enum class GatewayKind
{
    Process,
    Fork,
};

std::map<std::string, GatewayKind> const gateway_map = {
    {"process", GatewayKind::Process}, {"fork", GatewayKind::Fork}};

int main(int const argc, char const *argv[])
{
    CLI::App cli{"chainbench"};
    cli.option_defaults()->always_capture_default();

    std::vector<std::string> runner;
    auto gateway_kind = GatewayKind::Process;
    std::string extension = ".cpp";
    uint64_t startup_grace_ms = 60'000;
    NativeSkillConfig native;
    std::vector<std::string> generator;
    std::string rpc_url = "http://127.0.0.1:8899";
    std::string model = "unknown";
    std::string run_prefix;
    std::optional<uint64_t> turns;
    std::optional<uint64_t> timeout_ms;
    unsigned runs = 1;
    fs::path artifact_dir = "code";
    fs::path output_dir = "output";
    std::optional<fs::path> environment_file;
    std::optional<fs::path> log_file;
    bool launch_replica = false;
    ReplicaConfig replica_config;
    auto log_level = quill::LogLevel::Info;

    cli.add_option(
           "--gateway",
           gateway_kind,
           "process: external runner, fork: build and run in a forked child")
        ->transform(CLI::CheckedTransformer(gateway_map, CLI::ignore_case));
    cli.add_option("--runner", runner, "runner command executing a code unit")
        ->delimiter(' ');
    cli.add_option(
        "--startup_grace_ms",
        startup_grace_ms,
        "runner allowance beyond the timeout, including its build step");
    cli.add_option("--extension", extension, "code unit file extension");
    cli.add_option(
        "--compiler", native.compiler, "C++ compiler for the fork gateway");
    cli.add_option(
           "--generator",
           generator,
           "command producing the code unit of each turn")
        ->required()
        ->delimiter(' ');
    cli.add_option("--rpc_url", rpc_url, "replica JSON-RPC endpoint");
    cli.add_option("--model", model, "label of the agent under evaluation");
    cli.add_option("--run_id", run_prefix, "run identifier prefix");
    cli.add_option("--turns", turns, "turn budget per run");
    cli.add_option("--timeout_ms", timeout_ms, "execution timeout per turn");
    cli.add_option("--runs", runs, "number of parallel runs")
        ->check(CLI::PositiveNumber);
    cli.add_option("--artifact_dir", artifact_dir, "code unit artifacts");
    cli.add_option("--output_dir", output_dir, "transcripts and metrics");
    cli.add_option("--environment", environment_file, "environment JSON file")
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_option("--log_file", log_file, "also log to this file");
    cli.add_flag("--replica", launch_replica, "launch a local replica");
    cli.add_option(
        "--replica_command", replica_config.command, "replica executable");
    cli.add_option(
        "--upstream", replica_config.upstream_url, "replica upstream RPC");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    init_logging(log_level, log_file);

    if (gateway_kind == GatewayKind::Process && runner.empty()) {
        LOG_ERROR("--runner is required with the process gateway");
        return 1;
    }

    EnvironmentConfig environment;
    if (environment_file.has_value()) {
        auto loaded = load_environment_config(*environment_file);
        if (!loaded.has_value()) {
            return 1;
        }
        environment = std::move(*loaded);
    }
    uint64_t const budget = turns.value_or(environment.max_turns);
    std::chrono::milliseconds const execution_timeout{
        timeout_ms.value_or(environment.timeout_ms)};
    if (run_prefix.empty()) {
        run_prefix = model;
        std::ranges::replace(run_prefix, '/', '_');
        run_prefix += fmt::format(
            "_{}",
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count());
    }
    LOG_INFO(
        "environment {}: {} runs of {} turns, timeout {}ms",
        environment.name,
        runs,
        budget,
        execution_timeout.count());

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::unique_ptr<ReplicaProcess> replica;
    if (launch_replica) {
        auto launched = ReplicaProcess::launch(replica_config);
        if (launched.has_error()) {
            LOG_ERROR(
                "replica failed to start: {}",
                launched.error().message().c_str());
            return 1;
        }
        replica = std::move(launched).value();
    }

    auto const recorder = std::make_shared<JsonlMetricsRecorder>(
        output_dir / fmt::format("{}_metrics.jsonl", run_prefix));
    if (!recorder->is_open()) {
        return 1;
    }

    auto const make_gateway = [&]() -> std::unique_ptr<RuntimeGateway> {
        if (gateway_kind == GatewayKind::Fork) {
            return std::make_unique<ForkGateway>(ForkGatewayConfig{
                .artifact_root = artifact_dir, .native = native});
        }
        return std::make_unique<ProcessGateway>(ProcessGatewayConfig{
            .runner = runner,
            .artifact_root = artifact_dir,
            .startup_grace = std::chrono::milliseconds{startup_grace_ms}});
    };

    std::vector<RunComponents> components;
    for (unsigned i = 0; i < runs; ++i) {
        auto const run_id =
            runs == 1 ? run_prefix : fmt::format("{}_{}", run_prefix, i);

        auto bridge = RpcValidatorBridge::create(RpcBridgeConfig{
            .rpc_url = rpc_url,
            .starting_lamports = environment.starting_lamports});
        if (bridge.has_error()) {
            LOG_ERROR(
                "invalid rpc url {}: {}",
                rpc_url,
                bridge.error().message().c_str());
            return 1;
        }

        components.push_back(RunComponents{
            .config =
                OrchestratorConfig{
                    .run_id = run_id,
                    .model = model,
                    .budget = budget,
                    .execution_timeout = execution_timeout,
                    .output_dir = output_dir},
            .generator = std::make_unique<CommandGenerator>(
                CommandGeneratorConfig{
                    .command = generator, .extension = extension}),
            .gateway = make_gateway(),
            .bridge = std::move(bridge).value(),
            .recorder = recorder});
    }

    std::stop_source stop_source;
    std::jthread watcher{[&stop_source](std::stop_token const token) {
        while (!token.stop_requested()) {
            if (stop) {
                LOG_WARNING("interrupted, cancelling runs");
                stop_source.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
    }};

    auto const summaries =
        run_batch(std::move(components), stop_source.get_token());
    watcher.request_stop();

    int exit_code = 0;
    for (auto const &summary : summaries) {
        LOG_INFO(
            "{}: {} turns, reward {}, {} distinct instructions ({})",
            summary.run_id,
            summary.turns_completed,
            summary.cumulative_reward,
            summary.distinct_keys,
            summary.termination_reason);
        if (summary.termination_reason != TerminationReason::BudgetExhausted) {
            exit_code = 1;
        }
    }
    return exit_code;
}
