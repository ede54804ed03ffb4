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
#include <fuelcall/abi/param_type.hpp>
#include <fuelcall/abi/schema_path.hpp>
#include <fuelcall/abi/token.hpp>
#include <fuelcall/core/byte_string.hpp>
#include <fuelcall/core/config.hpp>
#include <fuelcall/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

FUELCALL_NAMESPACE_BEGIN

// Reads tokens off the front of a byte cursor. Each successful decode advances
// the cursor past exactly the bytes that the schema describes; on failure the
// cursor position is unspecified.
class AbiDecoder
{
    byte_string_view &enc_;
    SchemaPath path_;

    AbiError fail(AbiError, ParamType const &) const;

    Result<byte_string_view> consume(size_t, ParamType const &);
    Result<uint64_t> consume_word(ParamType const &);
    Result<uint64_t> consume_uint(uint64_t max, ParamType const &);

    Result<Token> decode_value(ParamType const &);
    Result<std::vector<Token>> decode_components(ParamType const &);
    Result<std::vector<Token>>
    decode_elements(ParamType const &element, size_t count);
    Result<Token> decode_enum(ParamType const &);

public:
    explicit AbiDecoder(byte_string_view &enc)
        : enc_{enc}
    {
    }

    Result<Token> decode(ParamType const &);
};

Result<Token> abi_decode(ParamType const &, byte_string_view &enc);

Result<std::vector<Token>>
abi_decode(std::span<ParamType const>, byte_string_view &enc);

FUELCALL_NAMESPACE_END
