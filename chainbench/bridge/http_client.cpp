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

#include <chainbench/bridge/bridge_error.hpp>
#include <chainbench/bridge/http_client.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/core/likely.h>
#include <chainbench/core/result.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

using namespace chainbench;

std::string lower(std::string_view const s)
{
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                          s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

class Socket
{
    int fd_{-1};

public:
    Socket() = default;
    Socket(Socket const &) = delete;
    Socket &operator=(Socket const &) = delete;

    ~Socket()
    {
        reset();
    }

    void reset(int const fd = -1)
    {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    int get() const
    {
        return fd_;
    }
};

bool set_timeout(int const fd, std::chrono::milliseconds const timeout)
{
    auto const ms = std::max<long long>(timeout.count(), 1);
    timeval tv;
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
           ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

std::optional<std::string> decode_chunked(std::string_view in)
{
    std::string out;
    for (;;) {
        auto const eol = in.find("\r\n");
        if (eol == std::string_view::npos) {
            return std::nullopt;
        }
        auto size_text = in.substr(0, eol);
        if (auto const ext = size_text.find(';');
            ext != std::string_view::npos) {
            size_text = size_text.substr(0, ext);
        }
        size_text = trim(size_text);
        size_t size = 0;
        auto const [ptr, ec] = std::from_chars(
            size_text.data(), size_text.data() + size_text.size(), size, 16);
        if (ec != std::errc{} || ptr != size_text.data() + size_text.size()) {
            return std::nullopt;
        }
        in.remove_prefix(eol + 2);
        if (size == 0) {
            return out;
        }
        if (in.size() < size + 2) {
            return std::nullopt;
        }
        out.append(in.substr(0, size));
        in.remove_prefix(size + 2);
    }
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

std::optional<HttpUrl> parse_http_url(std::string_view url)
{
    constexpr std::string_view SCHEME = "http://";
    if (url.substr(0, SCHEME.size()) != SCHEME) {
        return std::nullopt;
    }
    url.remove_prefix(SCHEME.size());

    HttpUrl out;
    auto const slash = url.find('/');
    auto authority = url.substr(0, slash);
    if (slash != std::string_view::npos) {
        out.path = std::string{url.substr(slash)};
    }
    if (auto const colon = authority.rfind(':');
        colon != std::string_view::npos) {
        auto const port_text = authority.substr(colon + 1);
        unsigned port = 0;
        auto const [ptr, ec] = std::from_chars(
            port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
            port == 0 || port > 0xffff) {
            return std::nullopt;
        }
        out.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    out.host = std::string{authority};
    return out;
}

Result<HttpResponse> parse_http_response(std::string_view const raw)
{
    auto const header_end = raw.find("\r\n\r\n");
    if (CHAINBENCH_UNLIKELY(header_end == std::string_view::npos)) {
        return BridgeError::ProtocolError;
    }
    auto head = raw.substr(0, header_end);
    auto body = raw.substr(header_end + 4);

    auto const status_end = head.find("\r\n");
    auto const status_line = head.substr(0, status_end);
    if (CHAINBENCH_UNLIKELY(status_line.substr(0, 5) != "HTTP/")) {
        return BridgeError::ProtocolError;
    }
    auto const sp = status_line.find(' ');
    if (CHAINBENCH_UNLIKELY(sp == std::string_view::npos)) {
        return BridgeError::ProtocolError;
    }
    HttpResponse response;
    auto const code_text = status_line.substr(sp + 1, 3);
    auto const [ptr, ec] = std::from_chars(
        code_text.data(), code_text.data() + code_text.size(), response.status);
    if (CHAINBENCH_UNLIKELY(ec != std::errc{})) {
        return BridgeError::ProtocolError;
    }

    head = status_end == std::string_view::npos
               ? std::string_view{}
               : head.substr(status_end + 2);
    while (!head.empty()) {
        auto const eol = head.find("\r\n");
        auto const line = head.substr(0, eol);
        head = eol == std::string_view::npos ? std::string_view{}
                                             : head.substr(eol + 2);
        auto const colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        response.headers[lower(trim(line.substr(0, colon)))] =
            std::string{trim(line.substr(colon + 1))};
    }

    if (auto const it = response.headers.find("transfer-encoding");
        it != response.headers.end() &&
        lower(it->second).find("chunked") != std::string::npos) {
        auto decoded = decode_chunked(body);
        if (CHAINBENCH_UNLIKELY(!decoded.has_value())) {
            return BridgeError::ProtocolError;
        }
        response.body = std::move(*decoded);
    }
    else if (auto const it = response.headers.find("content-length");
             it != response.headers.end()) {
        size_t length = 0;
        auto const &text = it->second;
        auto const [p, e] =
            std::from_chars(text.data(), text.data() + text.size(), length);
        if (CHAINBENCH_UNLIKELY(e != std::errc{} || body.size() < length)) {
            return BridgeError::ProtocolError;
        }
        response.body = std::string{body.substr(0, length)};
    }
    else {
        response.body = std::string{body};
    }
    return response;
}

Result<HttpResponse> http_post(
    HttpUrl const &url, std::string const &body,
    std::chrono::milliseconds const timeout)
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    auto const port = std::to_string(url.port);
    if (::getaddrinfo(url.host.c_str(), port.c_str(), &hints, &res) != 0) {
        return BridgeError::Unreachable;
    }

    Socket sock;
    bool timed_out = false;
    for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
        sock.reset(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (sock.get() < 0) {
            continue;
        }
        if (!set_timeout(sock.get(), timeout)) {
            sock.reset();
            continue;
        }
        if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        timed_out |= errno == EINPROGRESS || errno == EAGAIN;
        sock.reset();
    }
    ::freeaddrinfo(res);
    if (sock.get() < 0) {
        return timed_out ? BridgeError::Timeout : BridgeError::Unreachable;
    }

    std::string const request = fmt::format(
        "POST {} HTTP/1.1\r\n"
        "Host: {}:{}\r\n"
        "Content-Type: application/json\r\n"
        "Accept: application/json\r\n"
        "Content-Length: {}\r\n"
        "Connection: close\r\n\r\n"
        "{}",
        url.path,
        url.host,
        url.port,
        body.size(),
        body);

    std::string_view pending{request};
    while (!pending.empty()) {
        ssize_t const n =
            ::send(sock.get(), pending.data(), pending.size(), MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) {
                continue;
            }
            return (errno == EAGAIN || errno == EWOULDBLOCK)
                       ? BridgeError::Timeout
                       : BridgeError::Unreachable;
        }
        pending.remove_prefix(static_cast<size_t>(n));
    }

    std::string raw;
    std::array<char, 8192> buf;
    for (;;) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return BridgeError::Timeout;
        }
        ssize_t const n = ::recv(sock.get(), buf.data(), buf.size(), 0);
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return BridgeError::Timeout;
            }
            return BridgeError::Unreachable;
        }
        raw.append(buf.data(), static_cast<size_t>(n));
    }
    return parse_http_response(raw);
}

CHAINBENCH_NAMESPACE_END
