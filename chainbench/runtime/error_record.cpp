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
#include <chainbench/runtime/error_record.hpp>

#include <boost/describe/enum_from_string.hpp>
#include <boost/describe/enum_to_string.hpp>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

std::string_view to_string(ErrorKind const kind)
{
    return boost::describe::enum_to_string(kind, "UnknownError");
}

std::optional<ErrorKind> error_kind_from_string(std::string_view const s)
{
    ErrorKind kind{};
    if (!boost::describe::enum_from_string(std::string{s}.c_str(), kind)) {
        return std::nullopt;
    }
    return kind;
}

ErrorKind ErrorRecord::kind() const
{
    return std::visit(
        [](auto const &p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, CompileFailure>) {
                return ErrorKind::CompileError;
            }
            else if constexpr (std::is_same_v<T, InterfaceFailure>) {
                return ErrorKind::InterfaceError;
            }
            else if constexpr (std::is_same_v<T, RuntimeFailure>) {
                return ErrorKind::RuntimeError;
            }
            else if constexpr (std::is_same_v<T, PolicyFailure>) {
                return ErrorKind::PolicyViolation;
            }
            else if constexpr (std::is_same_v<T, TimeoutFailure>) {
                return ErrorKind::Timeout;
            }
            else if constexpr (std::is_same_v<T, SubmissionFailure>) {
                return ErrorKind::SubmissionRejected;
            }
            else {
                static_assert(std::is_same_v<T, OnChainFailure>);
                return ErrorKind::OnChainFailure;
            }
        },
        payload);
}

ErrorRecord ErrorRecord::interface_error(std::string message)
{
    return ErrorRecord{
        .message = std::move(message), .payload = InterfaceFailure{}};
}

ErrorRecord ErrorRecord::compile_error(
    std::string message, std::vector<Diagnostic> diagnostics,
    std::vector<std::string> details)
{
    if (details.empty()) {
        for (auto const &d : diagnostics) {
            details.push_back(d.message);
        }
    }
    return ErrorRecord{
        .message = std::move(message),
        .details = std::move(details),
        .payload = CompileFailure{std::move(diagnostics)}};
}

ErrorRecord ErrorRecord::runtime_error(std::string message, std::string trace)
{
    std::vector<std::string> details;
    if (!trace.empty()) {
        details.push_back(trace);
    }
    return ErrorRecord{
        .message = std::move(message),
        .details = std::move(details),
        .payload = RuntimeFailure{std::move(trace)}};
}

ErrorRecord ErrorRecord::policy_violation(
    std::string message, uint64_t const attempts, uint64_t const limit)
{
    return ErrorRecord{
        .message = std::move(message),
        .payload = PolicyFailure{attempts, limit}};
}

ErrorRecord ErrorRecord::timeout(std::chrono::milliseconds const limit)
{
    return ErrorRecord{
        .message = fmt::format(
            "Skill execution timed out after {} ms.", limit.count()),
        .payload = TimeoutFailure{limit}};
}

ErrorRecord ErrorRecord::submission_rejected(std::string reason)
{
    return ErrorRecord{
        .message = fmt::format("Transaction rejected: {}", reason),
        .payload = SubmissionFailure{std::move(reason)}};
}

ErrorRecord
ErrorRecord::on_chain_failure(std::string error, std::vector<std::string> logs)
{
    return ErrorRecord{
        .message = fmt::format("Transaction failed on chain: {}", error),
        .details = logs,
        .payload = OnChainFailure{std::move(error), std::move(logs)}};
}

nlohmann::json to_json(Diagnostic const &d)
{
    nlohmann::json j{{"message", d.message}};
    j["file"] = d.file.has_value() ? nlohmann::json(*d.file) : nullptr;
    j["line"] = d.line.has_value() ? nlohmann::json(*d.line) : nullptr;
    j["column"] = d.column.has_value() ? nlohmann::json(*d.column) : nullptr;
    return j;
}

nlohmann::json to_json(ErrorRecord const &e)
{
    nlohmann::json j{
        {"kind", std::string{to_string(e.kind())}},
        {"message", e.message},
        {"details", e.details}};
    std::visit(
        [&j](auto const &p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, CompileFailure>) {
                auto &diagnostics = j["diagnostics"] = nlohmann::json::array();
                for (auto const &d : p.diagnostics) {
                    diagnostics.push_back(to_json(d));
                }
            }
            else if constexpr (std::is_same_v<T, RuntimeFailure>) {
                j["trace"] = p.trace;
            }
            else if constexpr (std::is_same_v<T, PolicyFailure>) {
                j["attempts"] = p.attempts;
                j["limit"] = p.limit;
            }
            else if constexpr (std::is_same_v<T, TimeoutFailure>) {
                j["limit_ms"] = p.limit.count();
            }
            else if constexpr (std::is_same_v<T, SubmissionFailure>) {
                j["reason"] = p.reason;
            }
            else if constexpr (std::is_same_v<T, OnChainFailure>) {
                j["error"] = p.error;
                j["logs"] = p.logs;
            }
        },
        e.payload);
    return j;
}

CHAINBENCH_NAMESPACE_END
