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
#include <fuelcall/abi/token.hpp>
#include <fuelcall/core/byte_string.hpp>
#include <fuelcall/core/config.hpp>
#include <fuelcall/core/result.hpp>

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

FUELCALL_NAMESPACE_BEGIN

// Call data of a contract method: one head word per argument, followed by the
// payloads that did not fit in their head word.
//  * small arguments: encodings of at most one word are stored in the head,
//                     right aligned.
//  * large arguments: the head stores the address of the payload, i.e. the
//                     base address of the call data plus the payload offset,
//                     and the payload is appended after all head words.
class CallDataEncoder
{
    uint64_t base_address_;
    byte_string head_;
    byte_string tail_;
    std::vector<std::pair<size_t, size_t>> unresolved_offsets_;

    void add_static(byte_string_view);
    void add_dynamic(byte_string);

public:
    explicit CallDataEncoder(uint64_t const base_address = 0)
        : base_address_{base_address}
    {
    }

    Result<void> add(ParamType const &, Token const &);

    byte_string encode_final();
};

Result<byte_string> encode_call_arguments(
    std::span<ParamType const>, std::span<Token const>,
    uint64_t base_address = 0);

// Reverses encode_call_arguments(). The layout of each argument follows from
// its schema: fixed-size types of at most one word are inline, wider ones are
// pointers, and a dynamic type is inline only when its head word is zero.
// Every pointer must land in the tail of `data`.
Result<std::vector<Token>> decode_call_arguments(
    std::span<ParamType const>, byte_string_view data,
    uint64_t base_address = 0);

// Decodes a value stored right aligned in a single word, as in the head of
// call data or in the register of a return receipt.
Result<Token>
decode_word(ParamType const &, byte_string_fixed<WORD_SIZE> const &);

FUELCALL_NAMESPACE_END
