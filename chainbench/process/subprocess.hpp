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

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

inline constexpr int TIMEOUT_EXIT_CODE = 124;

struct ProcessSpec
{
    // argv[0] is resolved through PATH
    std::vector<std::string> argv;
    std::chrono::milliseconds timeout{std::chrono::seconds{30}};
    size_t max_output_bytes{1 << 20};
    std::filesystem::path cwd{};
    std::string stdin_data{};
};

struct ProcessResult
{
    int exit_code{-1};
    bool timed_out{false};
    bool cancelled{false};
    bool signaled{false};
    int term_signal{0};
    std::string stdout_text{};
    std::string stderr_text{};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::chrono::milliseconds duration{0};
    // non-empty only when the child could not be started
    std::string error_message{};

    bool spawned() const
    {
        return error_message.empty();
    }

    bool exited_cleanly() const
    {
        return spawned() && !timed_out && !cancelled && !signaled &&
               exit_code == 0;
    }
};

// Forks and execs spec.argv in its own session. On deadline expiry or a stop
// request the whole process group is killed with SIGKILL.
ProcessResult run_process(ProcessSpec const &, std::stop_token = {});

// The callable runs in a forked child. Its report file descriptor is captured
// as stdout_text, whatever the child writes to stdout or stderr is captured
// as stderr_text, and its return value becomes the exit code. The child must
// not log or touch state owned by other threads of the parent.
using ForkedMain = std::function<int(int report_fd)>;

ProcessResult run_forked(
    ForkedMain const &, std::chrono::milliseconds timeout,
    size_t max_output_bytes, std::stop_token = {});

CHAINBENCH_NAMESPACE_END
