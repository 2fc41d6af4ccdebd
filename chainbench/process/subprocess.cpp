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
#include <chainbench/core/likely.h>
#include <chainbench/process/subprocess.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <exception>
#include <iostream>
#include <stop_token>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/mman.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

using namespace chainbench;

constexpr int POLL_INTERVAL_MS = 10;

void append_limited(
    std::string &dst, char const *const src, size_t const n,
    size_t const limit, bool &truncated)
{
    size_t const avail = dst.size() < limit ? limit - dst.size() : 0;
    size_t const take = std::min(n, avail);
    dst.append(src, take);
    if (take < n) {
        truncated = true;
    }
}

class Pipe
{
    int fds_[2]{-1, -1};

public:
    Pipe() = default;
    Pipe(Pipe const &) = delete;
    Pipe &operator=(Pipe const &) = delete;

    ~Pipe()
    {
        close_read();
        close_write();
    }

    bool open()
    {
        return ::pipe2(fds_, O_CLOEXEC) == 0;
    }

    int read_end() const
    {
        return fds_[0];
    }

    int write_end() const
    {
        return fds_[1];
    }

    void close_read()
    {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void close_write()
    {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }
};

struct Stream
{
    int fd;
    std::string &text;
    bool &truncated;
    bool eof{false};
};

// returns false once the stream reached end of file
bool drain(Stream &s, size_t const limit)
{
    std::array<char, 4096> buf;
    for (;;) {
        ssize_t const n = ::read(s.fd, buf.data(), buf.size());
        if (n > 0) {
            append_limited(
                s.text, buf.data(), static_cast<size_t>(n), limit, s.truncated);
            continue;
        }
        if (n == 0) {
            s.eof = true;
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            s.eof = true;
            return false;
        }
        return true;
    }
}

void kill_group(pid_t const pid)
{
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

// Collects output from a started child until it exits, the deadline passes
// or a stop is requested. Owns the reaping of pid.
void supervise(
    pid_t const pid, int const out_fd, int const err_fd,
    std::chrono::milliseconds const timeout, size_t const limit,
    std::stop_token const &stop, ProcessResult &result)
{
    auto const begin = std::chrono::steady_clock::now();
    auto const deadline = begin + timeout;

    ::fcntl(out_fd, F_SETFL, O_NONBLOCK);
    ::fcntl(err_fd, F_SETFL, O_NONBLOCK);

    Stream out{out_fd, result.stdout_text, result.stdout_truncated};
    Stream err{err_fd, result.stderr_text, result.stderr_truncated};

    int status = 0;
    bool reaped = false;
    while (!reaped) {
        std::array<pollfd, 2> pfds{};
        nfds_t nfds = 0;
        if (!out.eof) {
            pfds[nfds++] = pollfd{out.fd, POLLIN, 0};
        }
        if (!err.eof) {
            pfds[nfds++] = pollfd{err.fd, POLLIN, 0};
        }
        if (nfds > 0) {
            ::poll(pfds.data(), nfds, POLL_INTERVAL_MS);
            if (!out.eof) {
                drain(out, limit);
            }
            if (!err.eof) {
                drain(err, limit);
            }
        }
        else {
            ::usleep(POLL_INTERVAL_MS * 1000);
        }

        pid_t const w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (CHAINBENCH_UNLIKELY(stop.stop_requested())) {
            kill_group(pid);
            ::waitpid(pid, &status, 0);
            result.cancelled = true;
            reaped = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill_group(pid);
            ::waitpid(pid, &status, 0);
            result.timed_out = true;
            reaped = true;
            break;
        }
    }

    // descendants that outlived the child may still hold the pipes open
    ::kill(-pid, SIGKILL);
    if (!out.eof) {
        drain(out, limit);
    }
    if (!err.eof) {
        drain(err, limit);
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);
    if (result.timed_out) {
        result.exit_code = TIMEOUT_EXIT_CODE;
    }
    else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
}

// stdin is served from an anonymous memory file so that the parent never
// blocks on, or receives SIGPIPE from, a child that ignores its input
int make_stdin_fd(std::string const &data)
{
    int const fd = ::memfd_create("chainbench-stdin", MFD_CLOEXEC);
    if (fd < 0) {
        return -1;
    }
    size_t written = 0;
    while (written < data.size()) {
        ssize_t const n =
            ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::close(fd);
            return -1;
        }
        written += static_cast<size_t>(n);
    }
    ::lseek(fd, 0, SEEK_SET);
    return fd;
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

ProcessResult run_process(ProcessSpec const &spec, std::stop_token stop)
{
    ProcessResult result;
    if (spec.argv.empty()) {
        result.error_message = "empty command";
        return result;
    }

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe.open() || !err_pipe.open()) {
        result.error_message =
            fmt::format("pipe failed: {}", std::strerror(errno));
        return result;
    }
    int const stdin_fd = make_stdin_fd(spec.stdin_data);
    if (stdin_fd < 0) {
        result.error_message =
            fmt::format("stdin setup failed: {}", std::strerror(errno));
        return result;
    }

    // everything the child needs is prepared before fork
    std::vector<std::string> args = spec.argv;
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (auto &arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    std::string const cwd = spec.cwd.string();

    pid_t const pid = ::fork();
    if (pid < 0) {
        ::close(stdin_fd);
        result.error_message =
            fmt::format("fork failed: {}", std::strerror(errno));
        return result;
    }

    if (pid == 0) {
        ::setsid();
        ::dup2(stdin_fd, STDIN_FILENO);
        ::dup2(out_pipe.write_end(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end(), STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(stdin_fd);
    out_pipe.close_write();
    err_pipe.close_write();
    supervise(
        pid,
        out_pipe.read_end(),
        err_pipe.read_end(),
        spec.timeout,
        spec.max_output_bytes,
        stop,
        result);
    return result;
}

ProcessResult run_forked(
    ForkedMain const &child_main, std::chrono::milliseconds const timeout,
    size_t const max_output_bytes, std::stop_token stop)
{
    ProcessResult result;

    Pipe report_pipe;
    Pipe err_pipe;
    if (!report_pipe.open() || !err_pipe.open()) {
        result.error_message =
            fmt::format("pipe failed: {}", std::strerror(errno));
        return result;
    }

    std::fflush(nullptr);
    pid_t const pid = ::fork();
    if (pid < 0) {
        result.error_message =
            fmt::format("fork failed: {}", std::strerror(errno));
        return result;
    }

    if (pid == 0) {
        ::setsid();
        int const devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(err_pipe.write_end(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end(), STDERR_FILENO);
        report_pipe.close_read();
        int code = 1;
        try {
            code = child_main(report_pipe.write_end());
        }
        catch (std::exception const &e) {
            std::fprintf(stderr, "uncaught exception: %s\n", e.what());
        }
        std::cout.flush();
        std::cerr.flush();
        std::fflush(nullptr);
        // skip atexit handlers and static destructors owned by the parent
        ::_exit(code);
    }

    report_pipe.close_write();
    err_pipe.close_write();
    supervise(
        pid,
        report_pipe.read_end(),
        err_pipe.read_end(),
        timeout,
        max_output_bytes,
        stop,
        result);
    return result;
}

CHAINBENCH_NAMESPACE_END
