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

#include <quill/LogLevel.h>

#include <filesystem>
#include <optional>

CHAINBENCH_NAMESPACE_BEGIN

// Configures the root logger with a stdout handler and, when a path is
// given, a second file handler using the same pattern. Must be called once,
// before any thread logs.
void init_logging(
    quill::LogLevel, std::optional<std::filesystem::path> const &log_file);

CHAINBENCH_NAMESPACE_END
