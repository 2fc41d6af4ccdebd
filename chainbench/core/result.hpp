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

#include <boost/outcome/config.hpp>
#include <boost/outcome/experimental/status_result.hpp>
#include <boost/outcome/success_failure.hpp>

CHAINBENCH_NAMESPACE_BEGIN

template <class T>
using Result = BOOST_OUTCOME_V2_NAMESPACE::experimental::status_result<T>;

using BOOST_OUTCOME_V2_NAMESPACE::success;

CHAINBENCH_NAMESPACE_END
