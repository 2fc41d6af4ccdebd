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
#include <chainbench/decode/instruction_key.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

CHAINBENCH_NAMESPACE_BEGIN

std::string InstructionKey::to_string() const
{
    if (!discriminator.has_value()) {
        return fmt::format("{}:none", program_id);
    }
    return fmt::format("{}:{}", program_id, *discriminator);
}

std::optional<InstructionKey> InstructionKey::parse(std::string_view const s)
{
    auto const pos = s.rfind(':');
    if (pos == std::string_view::npos || pos == 0) {
        return std::nullopt;
    }
    InstructionKey key{std::string{s.substr(0, pos)}, std::nullopt};
    auto const tail = s.substr(pos + 1);
    if (tail == "none") {
        return key;
    }
    unsigned value = 0;
    auto const [ptr, ec] =
        std::from_chars(tail.data(), tail.data() + tail.size(), value);
    if (ec != std::errc{} || ptr != tail.data() + tail.size() ||
        tail.empty() || value > 0xff) {
        return std::nullopt;
    }
    key.discriminator = static_cast<uint8_t>(value);
    return key;
}

CHAINBENCH_NAMESPACE_END
