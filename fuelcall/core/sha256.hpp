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

FUELCALL_NAMESPACE_BEGIN

inline constexpr size_t SHA256_SIZE = 32;

using sha256_hash_t = byte_string_fixed<SHA256_SIZE>;

sha256_hash_t sha256(byte_string_view);

FUELCALL_NAMESPACE_END
