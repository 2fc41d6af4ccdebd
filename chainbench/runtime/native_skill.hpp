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

#include <chainbench/core/config.hpp>
#include <chainbench/process/subprocess.hpp>
#include <chainbench/runtime/error_record.hpp>
#include <chainbench/runtime/skill_context.hpp>
#include <chainbench/runtime/skill_host.hpp>
#include <chainbench/solana/public_key.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

// The compiler and source tree chainbench itself was built with
std::string default_skill_compiler();
std::filesystem::path default_skill_include_dir();

// Compiler invocation turning a C++ code unit into a loadable module
struct NativeSkillConfig
{
    std::string compiler{default_skill_compiler()};
    std::vector<std::string> flags{
        "-std=c++23",
        "-O1",
        "-shared",
        "-fPIC",
        "-fdiagnostics-color=never"};
    std::vector<std::filesystem::path> include_dirs{
        default_skill_include_dir()};
    std::chrono::milliseconds build_timeout{std::chrono::seconds{60}};
    size_t max_log_bytes{1 << 20};
};

struct SkillBuild
{
    bool succeeded{false};
    std::filesystem::path module{};
    std::vector<Diagnostic> diagnostics{};
    // compiler stderr
    std::string log{};
};

bool is_native_source(std::filesystem::path const &);

// <source stem>.so beside the source
std::filesystem::path native_module_path(std::filesystem::path const &source);

// Extracts every "file:line:column: error: message" line. Notes, warnings
// and context lines are skipped; line and column are optional.
std::vector<Diagnostic> parse_compiler_diagnostics(std::string_view log);

SkillBuild build_native_skill(
    NativeSkillConfig const &, std::filesystem::path const &source,
    std::stop_token = {});

ErrorRecord to_error_record(SkillBuild const &);

// Runner report for a failed build, with one "errors" entry per diagnostic
nlohmann::json make_compile_report(SkillBuild const &);

// Loads the module, resolves SKILL_ENTRY_SYMBOL and hosts it. The module
// stays loaded until the entry returns.
SkillReport
host_native_skill(std::filesystem::path const &module, SkillContext &);

ProcessResult run_native_skill_forked(
    std::filesystem::path const &module, solana::PublicKey const &identity,
    std::string const &freshness_token, std::chrono::milliseconds timeout,
    uint64_t transactions_per_turn, size_t max_output_bytes,
    std::stop_token = {});

CHAINBENCH_NAMESPACE_END
