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

#include <fuelcall/abi/abi_decode.hpp>
#include <fuelcall/abi/abi_encode.hpp>
#include <fuelcall/abi/abi_error.hpp>
#include <fuelcall/abi/big_endian.hpp>
#include <fuelcall/abi/call_data.hpp>
#include <fuelcall/abi/function_selector.hpp>
#include <fuelcall/core/likely.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstring>

FUELCALL_NAMESPACE_BEGIN

void CallDataEncoder::add_static(byte_string_view const data)
{
    head_.append(WORD_SIZE - data.size(), 0);
    head_ += data;
}

void CallDataEncoder::add_dynamic(byte_string data)
{
    unresolved_offsets_.emplace_back(head_.size(), tail_.size());
    head_.append(WORD_SIZE, 0);
    tail_ += data;
}

Result<void> CallDataEncoder::add(ParamType const &type, Token const &token)
{
    BOOST_OUTCOME_TRY(auto encoded, abi_encode(type, token));
    if (encoded.size() <= WORD_SIZE) {
        add_static(encoded);
    }
    else {
        add_dynamic(std::move(encoded));
    }
    return outcome::success();
}

byte_string CallDataEncoder::encode_final()
{
    for (auto const [unresolved, tail_cumsum] : unresolved_offsets_) {
        u64_be const offset{base_address_ + head_.size() + tail_cumsum};
        std::memcpy(&head_[unresolved], offset.bytes, WORD_SIZE);
    }

    return std::move(head_) + std::move(tail_);
}

Result<byte_string> encode_call_arguments(
    std::span<ParamType const> const types, std::span<Token const> const tokens,
    uint64_t const base_address)
{
    if (FUELCALL_UNLIKELY(types.size() != tokens.size())) {
        LOG_ERROR(
            "call data: {} arguments for {} parameters",
            tokens.size(),
            types.size());
        return AbiError::SchemaMismatch;
    }

    CallDataEncoder encoder{base_address};
    for (size_t i = 0; i < types.size(); ++i) {
        if (auto res = encoder.add(types[i], tokens[i]);
            FUELCALL_UNLIKELY(res.has_error())) {
            LOG_ERROR(
                "call data: cannot encode argument {} of type {}",
                i,
                abi_type_signature(types[i]));
            return std::move(res).as_failure();
        }
    }
    return encoder.encode_final();
}

Result<Token>
decode_word(ParamType const &type, byte_string_fixed<WORD_SIZE> const &word)
{
    byte_string_view enc = to_byte_string_view(word);
    if (is_fixed_size(type)) {
        size_t const width = encoding_width(type);
        if (FUELCALL_UNLIKELY(width > WORD_SIZE)) {
            return AbiError::UnsupportedType;
        }
        size_t const padding = WORD_SIZE - width;
        if (FUELCALL_UNLIKELY(!std::ranges::all_of(
                enc.substr(0, padding),
                [](unsigned char const b) { return b == 0; }))) {
            LOG_ERROR(
                "decode word: non-zero padding for {}",
                abi_type_signature(type));
            return AbiError::InvalidValue;
        }
        enc.remove_prefix(padding);
    }

    BOOST_OUTCOME_TRY(auto token, abi_decode(type, enc));
    if (FUELCALL_UNLIKELY(!enc.empty())) {
        LOG_ERROR(
            "decode word: {} trailing bytes after {}",
            enc.size(),
            abi_type_signature(type));
        return AbiError::InvalidValue;
    }
    return token;
}

Result<std::vector<Token>> decode_call_arguments(
    std::span<ParamType const> const types, byte_string_view const data,
    uint64_t const base_address)
{
    size_t const head_size = types.size() * WORD_SIZE;
    if (FUELCALL_UNLIKELY(data.size() < head_size)) {
        LOG_ERROR(
            "call data: {} bytes cannot hold {} head words",
            data.size(),
            types.size());
        return AbiError::TruncatedPayload;
    }

    std::vector<Token> tokens;
    tokens.reserve(types.size());
    for (size_t i = 0; i < types.size(); ++i) {
        auto const &type = types[i];

        byte_string_fixed<WORD_SIZE> word;
        std::copy_n(data.begin() + i * WORD_SIZE, WORD_SIZE, word.begin());
        uint64_t const value = u64_be::from_bytes(word.data()).native();

        bool const fixed = is_fixed_size(type);
        bool const inline_value =
            fixed ? encoding_width(type) <= WORD_SIZE : value == 0;
        if (inline_value) {
            BOOST_OUTCOME_TRY(auto token, decode_word(type, word));
            tokens.push_back(std::move(token));
            continue;
        }

        // the address must point past the head and inside the call data
        if (FUELCALL_UNLIKELY(
                value < base_address ||
                value - base_address < head_size ||
                value - base_address >= data.size())) {
            LOG_ERROR(
                "call data: argument {} of type {} points to {}, outside of "
                "[{}, {})",
                i,
                abi_type_signature(type),
                value,
                base_address + head_size,
                base_address + data.size());
            return AbiError::MalformedLength;
        }

        byte_string_view payload =
            data.substr(static_cast<size_t>(value - base_address));
        BOOST_OUTCOME_TRY(auto token, abi_decode(type, payload));
        tokens.push_back(std::move(token));
    }
    return tokens;
}

FUELCALL_NAMESPACE_END
