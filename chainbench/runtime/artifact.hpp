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
#include <chainbench/core/result.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

// <root>/<run_id>/turn_<NNNN><extension>
std::filesystem::path artifact_path(
    std::filesystem::path const &root, std::string_view run_id, uint64_t turn,
    std::string_view extension);

// Creates missing parent directories. Failures are logged with the path and
// the OS reason.
Result<void>
write_artifact(std::filesystem::path const &, std::string_view contents);

CHAINBENCH_NAMESPACE_END
