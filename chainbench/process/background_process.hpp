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
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/types.h>

CHAINBENCH_NAMESPACE_BEGIN

// A long running child in its own session with stdout and stderr merged
// into one pipe. The destructor terminates the whole process group.
class BackgroundProcess
{
    pid_t pid_{-1};
    int out_fd_{-1};
    std::string pending_{};
    std::jthread drainer_{};

    void close_output();

public:
    using LineHandler = std::function<void(std::string_view)>;

    BackgroundProcess() = default;
    BackgroundProcess(BackgroundProcess const &) = delete;
    BackgroundProcess &operator=(BackgroundProcess const &) = delete;
    ~BackgroundProcess();

    // extra_env entries are "NAME=value" and extend the inherited environment.
    // Returns an empty string on success, otherwise the reason.
    std::string start(
        std::vector<std::string> const &argv,
        std::vector<std::string> const &extra_env = {});

    // Reads output line by line until a line contains token. Returns false
    // when the child closed its output or the timeout passed first.
    bool wait_for_output(
        std::string_view token, std::chrono::milliseconds timeout,
        LineHandler const & = {});

    // Keeps consuming output on a background thread so the child never
    // blocks on a full pipe
    void drain(LineHandler);

    bool running();

    pid_t pid() const
    {
        return pid_;
    }

    // SIGTERM to the group, SIGKILL once grace expires
    void terminate(std::chrono::milliseconds grace);
};

CHAINBENCH_NAMESPACE_END
