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
#include <chainbench/process/subprocess.hpp>
#include <chainbench/runtime/code_unit.hpp>
#include <chainbench/runtime/skill_context.hpp>
#include <chainbench/runtime/skill_host.hpp>
#include <chainbench/solana/public_key.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include <unistd.h>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

bool write_all(int const fd, std::string_view data)
{
    while (!data.empty()) {
        ssize_t const n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

// attempts counts every build, including ones the code unit swallowed
chainbench::SkillReport
policy_violation_report(chainbench::PolicyViolationError const &e)
{
    using chainbench::make_failure_report;

    auto body = make_failure_report("PolicyViolation", e.what(), e.what());
    body["attempts"] = e.attempts();
    body["limit"] = e.limit();
    return {1, std::move(body)};
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

nlohmann::json make_failure_report(
    std::string const &type, std::string const &error,
    std::string const &details)
{
    return {
        {"serialized_tx", nullptr},
        {"error", error},
        {"details", details},
        {"type", type}};
}

SkillReport host_skill(SkillEntry const &entry, SkillContext &ctx)
{
    if (!entry) {
        return {
            1,
            make_failure_report(
                "InterfaceError",
                "skill entry point not found in the provided module.",
                "")};
    }
    try {
        std::string serialized_tx = entry(ctx, ctx.freshness_token());
        if (ctx.violated()) {
            return policy_violation_report(
                PolicyViolationError{ctx.builds(), ctx.limit()});
        }
        return {0, {{"serialized_tx", std::move(serialized_tx)}}};
    }
    catch (PolicyViolationError const &e) {
        return policy_violation_report(e);
    }
    catch (std::exception const &e) {
        if (ctx.violated()) {
            return policy_violation_report(
                PolicyViolationError{ctx.builds(), ctx.limit()});
        }
        return {1, make_failure_report("RuntimeError", e.what(), e.what())};
    }
}

ProcessResult run_hosted_forked(
    SkillHost const &host, solana::PublicKey const &identity,
    std::string const &freshness_token,
    std::chrono::milliseconds const timeout,
    uint64_t const transactions_per_turn, size_t const max_output_bytes,
    std::stop_token stop)
{
    return run_forked(
        [&](int const report_fd) {
            SkillContext ctx{identity, freshness_token, transactions_per_turn};
            auto const report = host(ctx);
            auto const line =
                report.body.dump(
                    -1, ' ', false, nlohmann::json::error_handler_t::replace) +
                "\n";
            if (!write_all(report_fd, line)) {
                return 2;
            }
            return report.exit_code;
        },
        timeout,
        max_output_bytes,
        std::move(stop));
}

ProcessResult run_skill_forked(
    SkillEntry const &entry, solana::PublicKey const &identity,
    std::string const &freshness_token,
    std::chrono::milliseconds const timeout,
    uint64_t const transactions_per_turn, size_t const max_output_bytes,
    std::stop_token stop)
{
    return run_hosted_forked(
        [&entry](SkillContext &ctx) { return host_skill(entry, ctx); },
        identity,
        freshness_token,
        timeout,
        transactions_per_turn,
        max_output_bytes,
        std::move(stop));
}

CHAINBENCH_NAMESPACE_END
