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

#include <fuelcall/core/byte_string.hpp>
#include <fuelcall/core/config.hpp>

#include <evmc/evmc.hpp>

FUELCALL_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

inline byte_string_view to_byte_string_view(bytes32_t const &b)
{
    return {b.bytes, sizeof(bytes32_t)};
}

namespace literals
{
    using ::evmc::literals::operator""_bytes32;
}

FUELCALL_NAMESPACE_END
