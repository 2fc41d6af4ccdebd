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

#include <chainbench/config/environment_config.hpp>
#include <chainbench/core/config.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

bool read_unsigned(
    nlohmann::json const &object, char const *const key, uint64_t &out)
{
    auto const it = object.find(key);
    if (it == object.end()) {
        return true;
    }
    if (!it->is_number_unsigned()) {
        return false;
    }
    out = it->get<uint64_t>();
    return true;
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

std::optional<EnvironmentConfig>
parse_environment_config(nlohmann::json const &j)
{
    if (!j.is_object()) {
        return std::nullopt;
    }
    EnvironmentConfig config;
    if (auto const it = j.find("name"); it != j.end()) {
        if (!it->is_string()) {
            return std::nullopt;
        }
        config.name = it->get<std::string>();
    }
    if (!read_unsigned(j, "timeout_ms", config.timeout_ms) ||
        !read_unsigned(j, "starting_lamports", config.starting_lamports) ||
        !read_unsigned(j, "max_turns", config.max_turns)) {
        return std::nullopt;
    }
    return config;
}

std::optional<EnvironmentConfig>
load_environment_config(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        LOG_ERROR("cannot open environment file {}", path.string());
        return std::nullopt;
    }
    auto const j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERROR("environment file {} is not valid JSON", path.string());
        return std::nullopt;
    }
    auto config = parse_environment_config(j);
    if (!config.has_value()) {
        LOG_ERROR("environment file {} has invalid fields", path.string());
    }
    return config;
}

CHAINBENCH_NAMESPACE_END
