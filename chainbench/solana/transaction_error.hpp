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

#include <chainbench/core/result.hpp>
#include <chainbench/solana/config.hpp>

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

CHAINBENCH_SOLANA_NAMESPACE_BEGIN

enum class TransactionError
{
    Success = 0,
    InputTooShort,
    ShortVecOverflow,
    TrailingBytes,
    UnsupportedVersion,
    InvalidHeader,
    AccountIndexOutOfRange,
    TooManyAccounts,
    SignatureCountMismatch,
    SignerNotFound,
    InvalidKey,
    SigningFailed,
};

CHAINBENCH_SOLANA_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<chainbench::solana::TransactionError>
    : quick_status_code_from_enum_defaults<
          chainbench::solana::TransactionError>
{
    static constexpr auto const domain_name = "Solana Transaction Error";
    static constexpr auto const domain_uuid =
        "5b1e0c7a-3f2d-4a86-9c41-7d0e2b9f6a13";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
