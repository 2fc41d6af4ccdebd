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
#include <chainbench/process/background_process.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::chrono::milliseconds DEFAULT_GRACE{8000};
constexpr int POLL_INTERVAL_MS = 50;

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

BackgroundProcess::~BackgroundProcess()
{
    terminate(DEFAULT_GRACE);
}

void BackgroundProcess::close_output()
{
    if (out_fd_ >= 0) {
        ::close(out_fd_);
        out_fd_ = -1;
    }
}

std::string BackgroundProcess::start(
    std::vector<std::string> const &argv_in,
    std::vector<std::string> const &extra_env)
{
    if (argv_in.empty()) {
        return "empty command";
    }
    if (pid_ > 0) {
        return "already started";
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return fmt::format("pipe failed: {}", std::strerror(errno));
    }

    std::vector<std::string> args = argv_in;
    std::vector<char *> argv;
    for (auto &arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char **e = environ; e && *e; ++e) {
        env_storage.emplace_back(*e);
    }
    env_storage.insert(env_storage.end(), extra_env.begin(), extra_env.end());
    std::vector<char *> envp;
    for (auto &e : env_storage) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    pid_t const pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        return fmt::format("fork failed: {}", std::strerror(errno));
    }
    if (pid == 0) {
        ::setsid();
        int const devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());
        ::_exit(127);
    }

    ::close(fds[1]);
    pid_ = pid;
    out_fd_ = fds[0];
    return {};
}

bool BackgroundProcess::wait_for_output(
    std::string_view const token, std::chrono::milliseconds const timeout,
    LineHandler const &on_line)
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buf;
    while (out_fd_ >= 0) {
        for (auto nl = pending_.find('\n'); nl != std::string::npos;
             nl = pending_.find('\n')) {
            std::string const line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            if (on_line) {
                on_line(line);
            }
            if (line.find(token) != std::string::npos) {
                return true;
            }
        }

        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - now);
        pollfd pfd{out_fd_, POLLIN, 0};
        int const ready = ::poll(
            &pfd,
            1,
            static_cast<int>(std::min<long long>(
                remaining.count(), static_cast<long long>(POLL_INTERVAL_MS))));
        if (ready <= 0) {
            continue;
        }
        ssize_t const n = ::read(out_fd_, buf.data(), buf.size());
        if (n > 0) {
            pending_.append(buf.data(), static_cast<size_t>(n));
        }
        else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
            // a final unterminated line may still hold the token
            if (!pending_.empty() && pending_.find(token) != std::string::npos) {
                return true;
            }
            close_output();
        }
    }
    return false;
}

void BackgroundProcess::drain(LineHandler on_line)
{
    if (out_fd_ < 0 || drainer_.joinable()) {
        return;
    }
    int const fd = out_fd_;
    out_fd_ = -1;
    drainer_ = std::jthread{[fd, on_line = std::move(on_line)](
                                std::stop_token const stop) {
        std::array<char, 4096> buf;
        std::string pending;
        while (!stop.stop_requested()) {
            pollfd pfd{fd, POLLIN, 0};
            if (::poll(&pfd, 1, POLL_INTERVAL_MS) <= 0) {
                continue;
            }
            ssize_t const n = ::read(fd, buf.data(), buf.size());
            if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN)) {
                break;
            }
            if (n < 0) {
                continue;
            }
            pending.append(buf.data(), static_cast<size_t>(n));
            for (auto nl = pending.find('\n'); nl != std::string::npos;
                 nl = pending.find('\n')) {
                if (on_line) {
                    on_line(std::string_view{pending}.substr(0, nl));
                }
                pending.erase(0, nl + 1);
            }
        }
        ::close(fd);
    }};
}

bool BackgroundProcess::running()
{
    if (pid_ <= 0) {
        return false;
    }
    int status = 0;
    pid_t const w = ::waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
        pid_ = -1;
        return false;
    }
    return true;
}

void BackgroundProcess::terminate(std::chrono::milliseconds const grace)
{
    if (running()) {
        ::kill(-pid_, SIGTERM);
        auto const deadline = std::chrono::steady_clock::now() + grace;
        while (running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(
                std::chrono::milliseconds{POLL_INTERVAL_MS});
        }
        if (pid_ > 0) {
            ::kill(-pid_, SIGKILL);
            ::waitpid(pid_, nullptr, 0);
            pid_ = -1;
        }
    }
    if (drainer_.joinable()) {
        drainer_.request_stop();
        drainer_.join();
    }
    close_output();
}

CHAINBENCH_NAMESPACE_END
