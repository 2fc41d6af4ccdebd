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
#include <chainbench/runtime/error_record.hpp>
#include <chainbench/runtime/native_skill.hpp>
#include <chainbench/runtime/skill_context.hpp>
#include <chainbench/runtime/skill_host.hpp>
#include <chainbench/solana/public_key.hpp>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <array>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <dlfcn.h>

#ifndef CHAINBENCH_SKILL_COMPILER
    #define CHAINBENCH_SKILL_COMPILER "c++"
#endif

#ifndef CHAINBENCH_SKILL_INCLUDE_DIR
    #define CHAINBENCH_SKILL_INCLUDE_DIR "."
#endif

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

using namespace chainbench;

constexpr std::array<std::string_view, 3> NATIVE_EXTENSIONS = {
    ".cpp", ".cc", ".cxx"};

enum class Severity
{
    Error,
    Other,
};

struct Marker
{
    std::string_view text;
    Severity severity;
};

constexpr std::array<Marker, 5> MARKERS = {
    Marker{": error: ", Severity::Error},
    Marker{": fatal error: ", Severity::Error},
    Marker{": warning: ", Severity::Other},
    Marker{": note: ", Severity::Other},
    Marker{": remark: ", Severity::Other}};

struct DlCloser
{
    void operator()(void *const handle) const
    {
        ::dlclose(handle);
    }
};

std::optional<uint64_t> parse_number(std::string_view const s)
{
    if (s.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto const [end, ec] =
        std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || end != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// Removes a trailing ":<number>" from location
std::optional<uint64_t> strip_number(std::string_view &location)
{
    auto const colon = location.rfind(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    auto const n = parse_number(location.substr(colon + 1));
    if (n.has_value()) {
        location = location.substr(0, colon);
    }
    return n;
}

std::optional<Diagnostic> parse_diagnostic(std::string_view line)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.remove_suffix(1);
    }
    // the earliest marker is the severity; later ones are message text
    Marker const *found = nullptr;
    size_t pos = std::string_view::npos;
    for (auto const &marker : MARKERS) {
        auto const p = line.find(marker.text);
        if (p < pos) {
            pos = p;
            found = &marker;
        }
    }
    if (found == nullptr || found->severity != Severity::Error) {
        return std::nullopt;
    }

    Diagnostic d{
        .message = std::string{line.substr(pos + found->text.size())}};
    auto location = line.substr(0, pos);
    auto const last = strip_number(location);
    auto const before =
        last.has_value() ? strip_number(location) : std::nullopt;
    if (before.has_value()) {
        d.line = before;
        d.column = last;
    }
    else {
        d.line = last;
    }
    if (d.line.has_value() && !location.empty()) {
        d.file = std::string{location};
    }
    return d;
}

std::string build_failure_message(size_t const errors)
{
    return fmt::format(
        "Build failed with {} error{}", errors, errors == 1 ? "" : "s");
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

std::string default_skill_compiler()
{
    return CHAINBENCH_SKILL_COMPILER;
}

std::filesystem::path default_skill_include_dir()
{
    return CHAINBENCH_SKILL_INCLUDE_DIR;
}

bool is_native_source(std::filesystem::path const &path)
{
    auto const extension = path.extension().string();
    for (auto const e : NATIVE_EXTENSIONS) {
        if (e == extension) {
            return true;
        }
    }
    return false;
}

std::filesystem::path native_module_path(std::filesystem::path const &source)
{
    auto module = source;
    module.replace_extension(".so");
    return module;
}

std::vector<Diagnostic> parse_compiler_diagnostics(std::string_view log)
{
    std::vector<Diagnostic> out;
    while (!log.empty()) {
        auto const eol = log.find('\n');
        auto const line = log.substr(0, eol);
        log = eol == std::string_view::npos ? std::string_view{}
                                            : log.substr(eol + 1);
        if (auto d = parse_diagnostic(line); d.has_value()) {
            out.push_back(std::move(*d));
        }
    }
    return out;
}

SkillBuild build_native_skill(
    NativeSkillConfig const &config, std::filesystem::path const &source,
    std::stop_token stop)
{
    SkillBuild build;
    build.module = native_module_path(source);

    ProcessSpec spec;
    spec.argv.push_back(config.compiler);
    spec.argv.insert(spec.argv.end(), config.flags.begin(), config.flags.end());
    for (auto const &dir : config.include_dirs) {
        spec.argv.push_back("-I" + dir.string());
    }
    spec.argv.push_back("-o");
    spec.argv.push_back(build.module.string());
    spec.argv.push_back(source.string());
    spec.timeout = config.build_timeout;
    spec.max_output_bytes = config.max_log_bytes;

    auto const process = run_process(spec, std::move(stop));
    build.log = process.stderr_text;
    if (!process.spawned()) {
        LOG_ERROR(
            "cannot start compiler {}: {}",
            config.compiler,
            process.error_message);
        build.diagnostics.push_back(Diagnostic{
            .message = fmt::format(
                "cannot start compiler {}: {}",
                config.compiler,
                process.error_message)});
        return build;
    }
    if (process.timed_out) {
        build.diagnostics.push_back(Diagnostic{
            .message = fmt::format(
                "build did not finish within {} ms",
                config.build_timeout.count())});
        return build;
    }
    if (process.cancelled) {
        build.diagnostics.push_back(Diagnostic{.message = "build cancelled"});
        return build;
    }
    if (process.exited_cleanly()) {
        LOG_DEBUG(
            "built {} in {} ms",
            build.module.string(),
            process.duration.count());
        build.succeeded = true;
        return build;
    }

    build.diagnostics = parse_compiler_diagnostics(process.stderr_text);
    if (build.diagnostics.empty()) {
        build.diagnostics.push_back(Diagnostic{
            .message = fmt::format(
                "compiler exited with code {}", process.exit_code)});
    }
    return build;
}

ErrorRecord to_error_record(SkillBuild const &build)
{
    return ErrorRecord::compile_error(
        build_failure_message(build.diagnostics.size()), build.diagnostics);
}

nlohmann::json make_compile_report(SkillBuild const &build)
{
    auto body = make_failure_report(
        "CompileError",
        build_failure_message(build.diagnostics.size()),
        build.log);
    auto &errors = body["errors"] = nlohmann::json::array();
    for (auto const &d : build.diagnostics) {
        errors.push_back(to_json(d));
    }
    return body;
}

SkillReport
host_native_skill(std::filesystem::path const &module, SkillContext &ctx)
{
    std::unique_ptr<void, DlCloser> const handle{::dlopen(
        std::filesystem::absolute(module).c_str(), RTLD_NOW | RTLD_LOCAL)};
    if (!handle) {
        char const *const error = ::dlerror();
        return {
            1,
            make_failure_report(
                "CompileError",
                "failed to load skill module",
                error != nullptr ? error : module.string())};
    }
    void *const symbol = ::dlsym(handle.get(), SKILL_ENTRY_SYMBOL);
    if (symbol == nullptr) {
        return {
            1,
            make_failure_report(
                "InterfaceError",
                "skill entry point not found in the provided module.",
                SKILL_ENTRY_SYMBOL)};
    }
    return host_skill(
        SkillEntry{reinterpret_cast<SkillEntryFn *>(symbol)}, ctx);
}

ProcessResult run_native_skill_forked(
    std::filesystem::path const &module, solana::PublicKey const &identity,
    std::string const &freshness_token,
    std::chrono::milliseconds const timeout,
    uint64_t const transactions_per_turn, size_t const max_output_bytes,
    std::stop_token stop)
{
    return run_hosted_forked(
        [&module](SkillContext &ctx) { return host_native_skill(module, ctx); },
        identity,
        freshness_token,
        timeout,
        transactions_per_turn,
        max_output_bytes,
        std::move(stop));
}

CHAINBENCH_NAMESPACE_END
