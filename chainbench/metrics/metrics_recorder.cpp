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
#include <chainbench/metrics/metrics_recorder.hpp>
#include <chainbench/orchestrator/run_state.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <filesystem>
#include <ios>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>

CHAINBENCH_NAMESPACE_BEGIN

JsonlMetricsRecorder::JsonlMetricsRecorder(std::filesystem::path const &path)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    out_.open(path, std::ios::out | std::ios::app);
    if (!out_) {
        LOG_ERROR("cannot open metrics file {}", path.string());
    }
}

void JsonlMetricsRecorder::record_turn(
    std::string_view const run_id, TurnRecord const &record)
{
    auto j = to_json(record);
    j["record"] = "turn";
    j["run_id"] = std::string{run_id};
    std::scoped_lock const lock{mutex_};
    out_ << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

void JsonlMetricsRecorder::record_summary(RunSummary const &summary)
{
    auto j = to_json(summary);
    j["record"] = "summary";
    std::scoped_lock const lock{mutex_};
    out_ << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

CHAINBENCH_NAMESPACE_END
