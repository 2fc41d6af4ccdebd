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

#include <chainbench/core/base64.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/process/subprocess.hpp>
#include <chainbench/runtime/error_record.hpp>
#include <chainbench/runtime/execution_result.hpp>
#include <chainbench/runtime/runner_output.hpp>
#include <chainbench/runtime/skill_context.hpp>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

using namespace chainbench;
using json = nlohmann::json;

constexpr std::array<std::string_view, 5> COMPILE_ERROR_TYPES = {
    "AggregateError",
    "SyntaxError",
    "BuildMessage",
    "ResolveMessage",
    "CompileError"};

// reported by the TypeScript runner when the module has no entry point
constexpr char const *ENTRY_NOT_FOUND_MESSAGE =
    "executeSkill function not found";

std::optional<json> last_json_line(std::string_view out)
{
    while (!out.empty()) {
        auto const pos = out.find_last_of('\n', out.size() - 1);
        std::string_view line =
            pos == std::string_view::npos ? out : out.substr(pos + 1);
        out = pos == std::string_view::npos ? std::string_view{}
                                            : out.substr(0, pos);
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.remove_suffix(1);
        }
        if (line.empty() || line.front() != '{') {
            continue;
        }
        auto parsed = json::parse(line, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::string string_field(json const &j, char const *const name)
{
    auto const it = j.find(name);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::optional<uint64_t> unsigned_field(json const &j, char const *const name)
{
    auto const it = j.find(name);
    if (it == j.end() || !it->is_number_unsigned()) {
        return std::nullopt;
    }
    return it->get<uint64_t>();
}

std::vector<Diagnostic> diagnostics_of(json const &report)
{
    std::vector<Diagnostic> out;
    auto const it = report.find("errors");
    if (it == report.end() || !it->is_array()) {
        return out;
    }
    for (auto const &e : *it) {
        Diagnostic d;
        if (e.is_object()) {
            d.message = string_field(e, "message");
            if (auto const file = string_field(e, "file"); !file.empty()) {
                d.file = file;
            }
            d.line = unsigned_field(e, "line");
            d.column = unsigned_field(e, "column");
        }
        else if (e.is_string()) {
            d.message = e.get<std::string>();
        }
        else {
            d.message = e.dump();
        }
        out.push_back(std::move(d));
    }
    return out;
}

bool is_compile_error_type(std::string_view const type)
{
    for (auto const t : COMPILE_ERROR_TYPES) {
        if (t == type) {
            return true;
        }
    }
    return false;
}

ExecutionResult classify_failure(
    json const &report, ProcessResult const &process,
    std::chrono::milliseconds const timeout)
{
    auto const type = string_field(report, "type");
    auto message = string_field(report, "error");
    if (message.empty()) {
        message = "An unknown error occurred.";
    }
    auto details = string_field(report, "details");

    if (type == "Timeout" || message == RUNNER_TIMEOUT_MESSAGE) {
        return ExecutionResult::failure(ErrorRecord::timeout(timeout));
    }
    if (type == "PolicyViolation") {
        uint64_t const limit =
            unsigned_field(report, "limit").value_or(TRANSACTIONS_PER_TURN);
        uint64_t const attempts =
            unsigned_field(report, "attempts").value_or(limit + 1);
        return ExecutionResult::failure(
            ErrorRecord::policy_violation(message, attempts, limit));
    }
    if (type == "InterfaceError" ||
        message.find(ENTRY_NOT_FOUND_MESSAGE) != std::string::npos) {
        return ExecutionResult::failure(ErrorRecord::interface_error(message));
    }

    auto diagnostics = diagnostics_of(report);
    if (is_compile_error_type(type) || !diagnostics.empty()) {
        if (diagnostics.empty()) {
            diagnostics.push_back(Diagnostic{.message = message});
        }
        return ExecutionResult::failure(
            ErrorRecord::compile_error(message, std::move(diagnostics)));
    }

    if (details.empty()) {
        details = process.stderr_text;
    }
    return ExecutionResult::failure(
        ErrorRecord::runtime_error(message, std::move(details)));
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

ExecutionResult interpret_runner_output(
    ProcessResult const &process, std::chrono::milliseconds const timeout)
{
    if (!process.spawned()) {
        return ExecutionResult::failure(ErrorRecord::runtime_error(
            "failed to start skill runner", process.error_message));
    }
    if (process.timed_out) {
        return ExecutionResult::failure(ErrorRecord::timeout(timeout));
    }
    if (process.cancelled) {
        return ExecutionResult::failure(ErrorRecord::runtime_error(
            "skill execution cancelled", process.stderr_text));
    }

    auto const report = last_json_line(process.stdout_text);
    if (!report.has_value()) {
        if (process.signaled) {
            return ExecutionResult::failure(ErrorRecord::runtime_error(
                fmt::format(
                    "skill runner terminated by signal {}",
                    process.term_signal),
                process.stderr_text));
        }
        return ExecutionResult::failure(ErrorRecord::runtime_error(
            fmt::format(
                "skill runner exited with code {} without a result",
                process.exit_code),
            process.stderr_text));
    }

    auto const tx = report->find("serialized_tx");
    if (tx != report->end() && tx->is_string()) {
        if (process.exit_code != 0) {
            return ExecutionResult::failure(ErrorRecord::runtime_error(
                fmt::format(
                    "skill runner exited with code {}", process.exit_code),
                process.stderr_text));
        }
        auto decoded = base64_decode(tx->get<std::string>());
        if (!decoded.has_value()) {
            return ExecutionResult::failure(ErrorRecord::interface_error(
                "serialized_tx is not valid base64"));
        }
        if (decoded->empty()) {
            return ExecutionResult::failure(
                ErrorRecord::interface_error("serialized_tx is empty"));
        }
        return ExecutionResult::success(std::move(*decoded));
    }

    bool const reports_error =
        report->contains("error") || report->contains("type");
    if (process.exit_code == 0 && !reports_error) {
        return ExecutionResult::failure(ErrorRecord::interface_error(
            "skill did not return a serialized transaction string"));
    }
    return classify_failure(*report, process, timeout);
}

CHAINBENCH_NAMESPACE_END
