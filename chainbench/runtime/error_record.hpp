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
#include <chainbench/core/fmt.hpp>

#include <boost/describe/enum.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

enum class ErrorKind
{
    InterfaceError,
    CompileError,
    RuntimeError,
    PolicyViolation,
    Timeout,
    SubmissionRejected,
    OnChainFailure,
    FatalBridgeError,
};

BOOST_DESCRIBE_ENUM(
    ErrorKind, InterfaceError, CompileError, RuntimeError, PolicyViolation,
    Timeout, SubmissionRejected, OnChainFailure, FatalBridgeError)

std::string_view to_string(ErrorKind);
std::optional<ErrorKind> error_kind_from_string(std::string_view);

// Only FatalBridgeError ends a run, every other kind costs one turn
constexpr bool is_run_scoped(ErrorKind const kind)
{
    return kind == ErrorKind::FatalBridgeError;
}

struct Diagnostic
{
    std::string message{};
    std::optional<std::string> file{};
    std::optional<uint64_t> line{};
    std::optional<uint64_t> column{};
};

struct CompileFailure
{
    std::vector<Diagnostic> diagnostics{};
};

struct InterfaceFailure
{
};

struct RuntimeFailure
{
    std::string trace{};
};

struct PolicyFailure
{
    uint64_t attempts{0};
    uint64_t limit{0};
};

struct TimeoutFailure
{
    std::chrono::milliseconds limit{0};
};

struct SubmissionFailure
{
    std::string reason{};
};

struct OnChainFailure
{
    std::string error{};
    std::vector<std::string> logs{};
};

using ErrorPayload = std::variant<
    CompileFailure, InterfaceFailure, RuntimeFailure, PolicyFailure,
    TimeoutFailure, SubmissionFailure, OnChainFailure>;

struct ErrorRecord
{
    std::string message{};
    std::vector<std::string> details{};
    ErrorPayload payload{InterfaceFailure{}};

    ErrorKind kind() const;

    static ErrorRecord interface_error(std::string message);
    static ErrorRecord compile_error(
        std::string message, std::vector<Diagnostic>,
        std::vector<std::string> details = {});
    static ErrorRecord runtime_error(std::string message, std::string trace);
    static ErrorRecord
    policy_violation(std::string message, uint64_t attempts, uint64_t limit);
    static ErrorRecord timeout(std::chrono::milliseconds limit);
    static ErrorRecord submission_rejected(std::string reason);
    static ErrorRecord
    on_chain_failure(std::string error, std::vector<std::string> logs);
};

nlohmann::json to_json(Diagnostic const &);
nlohmann::json to_json(ErrorRecord const &);

CHAINBENCH_NAMESPACE_END
