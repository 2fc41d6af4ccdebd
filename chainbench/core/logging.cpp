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
#include <chainbench/core/logging.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/handlers/FileHandler.h>

#include <filesystem>
#include <optional>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

constexpr char const *LOG_PATTERN =
    "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
    "%(message)";
constexpr char const *LOG_TIME_FORMAT = "%Y-%m-%d %H:%M:%S.%Qns";

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

void init_logging(
    quill::LogLevel const level,
    std::optional<std::filesystem::path> const &log_file)
{
    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        LOG_PATTERN, LOG_TIME_FORMAT, quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    if (log_file.has_value()) {
        quill::FileHandlerConfig handler_cfg;
        handler_cfg.set_pattern(
            LOG_PATTERN, LOG_TIME_FORMAT, quill::Timezone::GmtTime);
        cfg.default_handlers.emplace_back(
            quill::file_handler(log_file->string(), handler_cfg));
    }
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(level);
}

CHAINBENCH_NAMESPACE_END
