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

CHAINBENCH_NAMESPACE_BEGIN

// Every value is fatal for the run that observes it
enum class BridgeError
{
    Success = 0,
    InvalidUrl,
    Unreachable,
    Timeout,
    HttpError,
    ProtocolError,
    RpcError,
    IdentityFailed,
    AirdropFailed,
    ReplicaFailed,
};

CHAINBENCH_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<chainbench::BridgeError>
    : quick_status_code_from_enum_defaults<chainbench::BridgeError>
{
    static constexpr auto const domain_name = "Validator Bridge Error";
    static constexpr auto const domain_uuid =
        "a7d3e2c1-84b6-4f09-9e5d-3c2b1a0f8e47";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
