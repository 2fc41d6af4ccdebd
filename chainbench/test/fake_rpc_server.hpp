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

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

CHAINBENCH_NAMESPACE_BEGIN

namespace test
{
    // Minimal JSON-RPC over HTTP/1.1 server on loopback. The handler gets
    // the method and params and returns either {"result": ...} or
    // {"error": {...}}; id and jsonrpc are filled in.
    class FakeRpcServer
    {
    public:
        using Handler = std::function<nlohmann::json(
            std::string const &method, nlohmann::json const &params)>;

    private:
        int fd_{-1};
        uint16_t port_{0};
        Handler handler_;
        std::mutex mutex_;
        std::vector<std::string> methods_;
        std::jthread thread_;

        static std::string read_request(int const fd)
        {
            std::string raw;
            char buf[4096];
            for (;;) {
                if (auto const end = raw.find("\r\n\r\n");
                    end != std::string::npos) {
                    size_t length = 0;
                    auto const pos = raw.find("Content-Length:");
                    if (pos != std::string::npos && pos < end) {
                        length = std::strtoul(
                            raw.c_str() + pos + 15, nullptr, 10);
                    }
                    if (raw.size() >= end + 4 + length) {
                        return raw.substr(end + 4, length);
                    }
                }
                ssize_t const n = ::recv(fd, buf, sizeof(buf), 0);
                if (n <= 0) {
                    return {};
                }
                raw.append(buf, static_cast<size_t>(n));
            }
        }

        void serve(int const client)
        {
            auto const request =
                nlohmann::json::parse(read_request(client), nullptr, false);
            nlohmann::json response;
            if (request.is_object() && request.contains("method")) {
                auto const method = request["method"].get<std::string>();
                {
                    std::scoped_lock const lock{mutex_};
                    methods_.push_back(method);
                }
                response = handler_(method, request["params"]);
                response["jsonrpc"] = "2.0";
                response["id"] = request["id"];
            }
            std::string const body = response.dump();
            std::string const reply =
                "HTTP/1.1 200 OK\r\n"
                "Content-Type: application/json\r\n"
                "Content-Length: " +
                std::to_string(body.size()) +
                "\r\n"
                "Connection: close\r\n\r\n" +
                body;
            size_t sent = 0;
            while (sent < reply.size()) {
                ssize_t const n = ::send(
                    client,
                    reply.data() + sent,
                    reply.size() - sent,
                    MSG_NOSIGNAL);
                if (n <= 0) {
                    break;
                }
                sent += static_cast<size_t>(n);
            }
            ::close(client);
        }

    public:
        explicit FakeRpcServer(Handler handler)
            : handler_{std::move(handler)}
        {
            fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd_ < 0) {
                throw std::runtime_error{"socket"};
            }
            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            socklen_t len = sizeof(addr);
            if (::bind(fd_, reinterpret_cast<sockaddr *>(&addr), len) != 0 ||
                ::listen(fd_, 16) != 0 ||
                ::getsockname(
                    fd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
                ::close(fd_);
                throw std::runtime_error{"bind"};
            }
            port_ = ntohs(addr.sin_port);
            thread_ = std::jthread{[this](std::stop_token const stop) {
                while (!stop.stop_requested()) {
                    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
                    if (::poll(&pfd, 1, 20) <= 0) {
                        continue;
                    }
                    int const client = ::accept(fd_, nullptr, nullptr);
                    if (client >= 0) {
                        serve(client);
                    }
                }
            }};
        }

        ~FakeRpcServer()
        {
            thread_.request_stop();
            thread_.join();
            ::close(fd_);
        }

        FakeRpcServer(FakeRpcServer const &) = delete;
        FakeRpcServer &operator=(FakeRpcServer const &) = delete;

        std::string url() const
        {
            return "http://127.0.0.1:" + std::to_string(port_);
        }

        std::vector<std::string> methods()
        {
            std::scoped_lock const lock{mutex_};
            return methods_;
        }
    };
}

CHAINBENCH_NAMESPACE_END
