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

#include <fuelcall/abi/constants.hpp>
#include <fuelcall/abi/param_type.hpp>
#include <fuelcall/core/byte_string.hpp>
#include <fuelcall/core/config.hpp>

#include <span>
#include <string>
#include <string_view>

FUELCALL_NAMESPACE_BEGIN

using FunctionSelector = byte_string_fixed<SELECTOR_SIZE>;

// Canonical text of a type as it appears in a function signature:
// `u64`, `bool`, `byte`, `b256`, `()`, `str[23]`, `u8[3]`, `(u64,bool)`,
// `Vec<u64>`, and the declared name for structs and enums.
std::string abi_type_signature(ParamType const &);

// `name(arg,arg,...)`
std::string
abi_function_signature(std::string_view name, std::span<ParamType const>);

// First 4 bytes of sha256(signature) in the low half of a big endian word.
FunctionSelector abi_encode_selector(std::string_view signature);

inline FunctionSelector abi_encode_selector(
    std::string_view const name, std::span<ParamType const> const inputs)
{
    return abi_encode_selector(abi_function_signature(name, inputs));
}

FUELCALL_NAMESPACE_END
