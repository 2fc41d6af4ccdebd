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

#include <chainbench/process/subprocess.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <stop_token>
#include <string>
#include <thread>

#include <unistd.h>

using namespace chainbench;
using namespace std::chrono_literals;

namespace
{
    ProcessSpec shell(std::string const &script)
    {
        ProcessSpec spec;
        spec.argv = {"/bin/sh", "-c", script};
        spec.timeout = 5s;
        return spec;
    }
}

TEST(subprocess, captures_output_and_exit_code)
{
    auto const result =
        run_process(shell("echo out; echo err >&2; exit 3"));
    ASSERT_TRUE(result.spawned());
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.exited_cleanly());
}

TEST(subprocess, feeds_stdin)
{
    auto spec = shell("cat");
    spec.stdin_data = "{\"turn\": 1}";
    auto const result = run_process(spec);
    EXPECT_TRUE(result.exited_cleanly());
    EXPECT_EQ(result.stdout_text, "{\"turn\": 1}");
}

TEST(subprocess, kills_process_group_on_timeout)
{
    auto spec = shell("sleep 10 & sleep 10; echo late");
    spec.timeout = 200ms;
    auto const begin = std::chrono::steady_clock::now();
    auto const result = run_process(spec);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, TIMEOUT_EXIT_CODE);
    EXPECT_EQ(result.stdout_text, "");
}

TEST(subprocess, truncates_output)
{
    auto spec = shell("printf '0123456789'");
    spec.max_output_bytes = 4;
    auto const result = run_process(spec);
    EXPECT_EQ(result.stdout_text, "0123");
    EXPECT_TRUE(result.stdout_truncated);
}

TEST(subprocess, reports_signal)
{
    auto const result = run_process(shell("kill -KILL $$"));
    EXPECT_TRUE(result.signaled);
    EXPECT_EQ(result.term_signal, SIGKILL);
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
}

TEST(subprocess, missing_executable)
{
    ProcessSpec spec;
    spec.argv = {"/nonexistent/chainbench-runner"};
    auto const result = run_process(spec);
    EXPECT_EQ(result.exit_code, 127);

    EXPECT_FALSE(run_process(ProcessSpec{}).spawned());
}

TEST(subprocess, stop_token_cancels)
{
    std::stop_source source;
    std::jthread canceller{[&source] {
        std::this_thread::sleep_for(100ms);
        source.request_stop();
    }};
    auto spec = shell("sleep 10");
    spec.timeout = 10s;
    auto const result = run_process(spec, source.get_token());
    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(result.duration, 5s);
}

TEST(subprocess, forked_report_channel)
{
    auto const result = run_forked(
        [](int const fd) {
            std::string const line = "report\n";
            if (::write(fd, line.data(), line.size()) < 0) {
                return 2;
            }
            std::printf("noise\n");
            return 0;
        },
        5s,
        1 << 16);
    EXPECT_TRUE(result.exited_cleanly());
    EXPECT_EQ(result.stdout_text, "report\n");
    EXPECT_EQ(result.stderr_text, "noise\n");
}

TEST(subprocess, forked_timeout)
{
    auto const result = run_forked(
        [](int) {
            for (;;) {
                ::pause();
            }
            return 0;
        },
        200ms,
        1 << 16);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.stdout_text, "");
}
