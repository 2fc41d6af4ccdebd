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

#include <chainbench/core/config.hpp>
#include <chainbench/process/subprocess.hpp>
#include <chainbench/runtime/native_skill.hpp>
#include <chainbench/runtime/runner_output.hpp>
#include <chainbench/runtime/skill_context.hpp>
#include <chainbench/runtime/skill_host.hpp>
#include <chainbench/solana/public_key.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace chainbench;
namespace fs = std::filesystem;

namespace
{
    int report(nlohmann::json const &body, int const exit_code)
    {
        std::cout << body.dump(
                         -1, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return exit_code;
    }
}

// Builds a C++ code unit into a module, or takes a prebuilt one, runs its
// entry point and prints exactly one JSON report line.
// Usage: chainbench-skill-runner [options] <artifact> <timeout_ms> [identity]
//        [token]
int main(int const argc, char const *argv[])
{
    CLI::App cli{"chainbench-skill-runner"};

    fs::path artifact;
    uint64_t timeout_ms = 30'000;
    std::string identity_b58;
    std::string token;
    NativeSkillConfig native;
    std::vector<fs::path> include_dirs;
    uint64_t build_timeout_ms = 60'000;

    cli.add_option(
           "artifact", artifact, "C++ source or shared object of the skill")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("timeout_ms", timeout_ms, "execution timeout")->required();
    cli.add_option("identity", identity_b58, "agent public key (base58)");
    cli.add_option("token", token, "freshness token");
    cli.add_option("--compiler", native.compiler, "C++ compiler");
    cli.add_option(
        "--include_dir", include_dirs, "additional skill header search path");
    cli.add_option(
        "--build_timeout_ms", build_timeout_ms, "compilation timeout");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }
    native.include_dirs.insert(
        native.include_dirs.end(), include_dirs.begin(), include_dirs.end());
    native.build_timeout = std::chrono::milliseconds{build_timeout_ms};

    solana::PublicKey identity{};
    if (!identity_b58.empty()) {
        auto const key = solana::PublicKey::from_base58(identity_b58);
        if (!key.has_value()) {
            return report(
                make_failure_report(
                    "InterfaceError", "invalid identity", identity_b58),
                1);
        }
        identity = *key;
    }

    fs::path module = artifact;
    if (is_native_source(artifact)) {
        auto const build = build_native_skill(native, artifact);
        if (!build.succeeded) {
            return report(make_compile_report(build), 1);
        }
        module = build.module;
    }

    auto const result = run_native_skill_forked(
        module,
        identity,
        token,
        std::chrono::milliseconds{timeout_ms},
        TRANSACTIONS_PER_TURN,
        1 << 20);
    if (!result.stderr_text.empty()) {
        std::cerr << result.stderr_text;
    }
    if (result.timed_out) {
        return report(
            {{"serialized_tx", nullptr},
             {"error", RUNNER_TIMEOUT_MESSAGE},
             {"type", "Timeout"}},
            1);
    }
    if (!result.stdout_text.empty()) {
        std::cout << result.stdout_text << std::flush;
        return result.exited_cleanly() ? 0 : 1;
    }
    return report(
        make_failure_report(
            "RuntimeError",
            "Skill execution failed",
            result.spawned() ? result.stderr_text : result.error_message),
        1);
}
