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

#include <fuelcall/core/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

FUELCALL_NAMESPACE_BEGIN

enum class CallError
{
    Success = 0,
    TransportFailure,
    ValidationFailure,
    ExecutionRevert,
};

// Only a failure to reach the node may succeed when submitted again
// unchanged. A rejected or reverted transaction has to be reconfigured first.
constexpr bool is_retryable(CallError const error) noexcept
{
    return error == CallError::TransportFailure;
}

FUELCALL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<fuelcall::CallError>
    : quick_status_code_from_enum_defaults<fuelcall::CallError>
{
    static constexpr auto const domain_name = "Call Error";
    static constexpr auto const domain_uuid =
        "d3a8c5f1-0b7e-4e62-9c14-8f2a6e5b3d90";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

FUELCALL_NAMESPACE_BEGIN

using CallErrorCode =
    BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::quick_status_code_from_enum_code<
        CallError>;

FUELCALL_NAMESPACE_END
