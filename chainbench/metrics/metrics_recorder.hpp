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
#include <chainbench/orchestrator/run_state.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string_view>

CHAINBENCH_NAMESPACE_BEGIN

// Append only sink for per turn records and end of run summaries. Records
// are emitted exactly once and never rewritten.
class MetricsRecorder
{
public:
    virtual ~MetricsRecorder() = default;

    virtual void record_turn(std::string_view run_id, TurnRecord const &) = 0;
    virtual void record_summary(RunSummary const &) = 0;
};

// One JSON object per line, flushed after every record. Safe to share
// between concurrent runs.
class JsonlMetricsRecorder final : public MetricsRecorder
{
    std::mutex mutex_;
    std::ofstream out_;

public:
    explicit JsonlMetricsRecorder(std::filesystem::path const &);

    bool is_open() const
    {
        return out_.is_open();
    }

    void record_turn(std::string_view run_id, TurnRecord const &) override;
    void record_summary(RunSummary const &) override;
};

CHAINBENCH_NAMESPACE_END
