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
#include <chainbench/core/result.hpp>
#include <chainbench/runtime/artifact.hpp>
#include <chainbench/runtime/artifact_error.hpp>

#include <fmt/format.h>

#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <system_error>

CHAINBENCH_NAMESPACE_BEGIN

std::filesystem::path artifact_path(
    std::filesystem::path const &root, std::string_view const run_id,
    uint64_t const turn, std::string_view const extension)
{
    return root / std::string{run_id} /
           fmt::format("turn_{:04d}{}", turn, extension);
}

Result<void> write_artifact(
    std::filesystem::path const &path, std::string_view const contents)
{
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        LOG_ERROR(
            "cannot create {}: {}", path.parent_path().string(), ec.message());
        return ArtifactError::CreateDirectoryFailed;
    }
    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    if (!out) {
        LOG_ERROR("cannot open {}", path.string());
        return ArtifactError::OpenFailed;
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.close();
    if (!out) {
        LOG_ERROR("cannot write {}", path.string());
        return ArtifactError::WriteFailed;
    }
    return success();
}

CHAINBENCH_NAMESPACE_END
