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

#include <chainbench/orchestrator/transcript_error.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<chainbench::TranscriptError>::mapping> const &
quick_status_code_from_enum<chainbench::TranscriptError>::value_mappings()
{
    using chainbench::TranscriptError;

    static std::initializer_list<mapping> const v = {
        {TranscriptError::Success, "success", {errc::success}},
        {TranscriptError::Malformed, "malformed transcript", {}},
        {TranscriptError::NonConsecutiveIndex,
         "turn indices are not consecutive",
         {}},
        {TranscriptError::RewardMismatch,
         "rewards do not match the discovered instructions",
         {}},
        {TranscriptError::LedgerMismatch,
         "discovered programs do not match the turns",
         {}},
        {TranscriptError::CreateDirectoryFailed,
         "cannot create transcript directory",
         {}},
        {TranscriptError::OpenFailed, "cannot open transcript file", {}},
        {TranscriptError::WriteFailed, "cannot write transcript file", {}},
        {TranscriptError::RenameFailed,
         "cannot move transcript into place",
         {}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
