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

#include <fuelcall/abi/abi_error.hpp>
#include <fuelcall/abi/big_endian.hpp>
#include <fuelcall/abi/constants.hpp>
#include <fuelcall/abi/param_type.hpp>
#include <fuelcall/abi/schema_path.hpp>
#include <fuelcall/abi/token.hpp>
#include <fuelcall/core/byte_string.hpp>
#include <fuelcall/core/config.hpp>
#include <fuelcall/core/result.hpp>

#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

FUELCALL_NAMESPACE_BEGIN

// Helpers for encoding values into the VM calling convention. Everything is
// laid out in 8 byte words, big endian, with narrower integers right aligned
// in a zeroed word.

//////////////////////////////////////////////////////////////
// Standalone functions for encoding primitive words.
//////////////////////////////////////////////////////////////
template <BigEndianType I>
byte_string_fixed<WORD_SIZE> abi_encode_word(I const &i)
{
    static_assert(sizeof(I) <= WORD_SIZE);

    constexpr size_t offset = WORD_SIZE - sizeof(I);
    byte_string_fixed<WORD_SIZE> output{};
    std::memcpy(&output[offset], &i, sizeof(I));
    return output;
}

inline byte_string_fixed<WORD_SIZE> abi_encode_bool(bool const b)
{
    return abi_encode_word(static_cast<uint8_t>(b ? 1 : 0));
}

// Encodes a sequence of tokens back to back against their schemas.
//
// A vector is a length word followed by its elements and may only appear as
// the last dynamic segment of a value (see validate()). An enum is its
// discriminant word, zero padding up to its widest variant, then the active
// payload.
class AbiEncoder
{
    byte_string buffer_;
    SchemaPath path_;

    void add_word(uint64_t);
    void add_padding(size_t);
    AbiError fail(AbiError, ParamType const &) const;

    Result<void> encode_value(ParamType const &, Token const &);
    Result<void>
    encode_components(ParamType const &, std::vector<Token> const &);
    Result<void>
    encode_elements(ParamType const &, std::vector<Token> const &);
    Result<void> encode_enum(ParamType const &, token::Enum const &);

public:
    // Checks the schema, then appends the encoding of `token`. On failure the
    // buffer is left as it was before the call.
    Result<void> add(ParamType const &, Token const &);

    byte_string encode_final()
    {
        return std::move(buffer_);
    }
};

Result<byte_string> abi_encode(ParamType const &, Token const &);

// Concatenated encoding of each token against the schema at the same index.
Result<byte_string>
abi_encode(std::span<ParamType const>, std::span<Token const>);

FUELCALL_NAMESPACE_END
