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
#include <fuelcall/abi/abi_error.hpp>
#include <fuelcall/abi/big_endian.hpp>
#include <fuelcall/abi/constants.hpp>
#include <fuelcall/abi/function_selector.hpp>
#include <fuelcall/core/bytes.hpp>
#include <fuelcall/core/likely.h>
#include <fuelcall/core/math.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstring>
#include <limits>
#include <memory>
#include <string>

FUELCALL_NAMESPACE_BEGIN

AbiError AbiDecoder::fail(AbiError const error, ParamType const &type) const
{
    LOG_ERROR(
        "abi decode failed at {}: {} (expected {}, {} bytes left)",
        path_.to_string(),
        AbiErrorCode{error}.message().c_str(),
        abi_type_signature(type),
        enc_.size());
    return error;
}

Result<byte_string_view>
AbiDecoder::consume(size_t const n, ParamType const &type)
{
    if (FUELCALL_UNLIKELY(enc_.size() < n)) {
        return fail(AbiError::TruncatedPayload, type);
    }
    auto const out = enc_.substr(0, n);
    enc_.remove_prefix(n);
    return out;
}

Result<uint64_t> AbiDecoder::consume_word(ParamType const &type)
{
    BOOST_OUTCOME_TRY(auto const word, consume(WORD_SIZE, type));
    return u64_be::from_bytes(word.data()).native();
}

Result<uint64_t>
AbiDecoder::consume_uint(uint64_t const max, ParamType const &type)
{
    BOOST_OUTCOME_TRY(auto const value, consume_word(type));
    if (FUELCALL_UNLIKELY(value > max)) {
        return fail(AbiError::InvalidValue, type);
    }
    return value;
}

Result<Token> AbiDecoder::decode(ParamType const &type)
{
    if (auto const res = validate(type); FUELCALL_UNLIKELY(res.has_error())) {
        return fail(AbiError::UnsupportedType, type);
    }
    return decode_value(type);
}

Result<Token> AbiDecoder::decode_value(ParamType const &type)
{
    using Kind = ParamType::Kind;

    switch (type.kind()) {
    case Kind::Unit:
        BOOST_OUTCOME_TRY(consume(WORD_SIZE, type));
        return Token::unit();
    case Kind::Bool: {
        BOOST_OUTCOME_TRY(auto const value, consume_uint(1, type));
        return Token::boolean(value == 1);
    }
    case Kind::U8: {
        BOOST_OUTCOME_TRY(
            auto const value,
            consume_uint(std::numeric_limits<uint8_t>::max(), type));
        return Token::u8(static_cast<uint8_t>(value));
    }
    case Kind::U16: {
        BOOST_OUTCOME_TRY(
            auto const value,
            consume_uint(std::numeric_limits<uint16_t>::max(), type));
        return Token::u16(static_cast<uint16_t>(value));
    }
    case Kind::U32: {
        BOOST_OUTCOME_TRY(
            auto const value,
            consume_uint(std::numeric_limits<uint32_t>::max(), type));
        return Token::u32(static_cast<uint32_t>(value));
    }
    case Kind::U64: {
        BOOST_OUTCOME_TRY(auto const value, consume_word(type));
        return Token::u64(value);
    }
    case Kind::Byte: {
        BOOST_OUTCOME_TRY(auto const raw, consume(BYTE_SIZE, type));
        return Token::byte(raw[0]);
    }
    case Kind::B256: {
        BOOST_OUTCOME_TRY(auto const raw, consume(B256_SIZE, type));
        bytes32_t value;
        std::memcpy(value.bytes, raw.data(), B256_SIZE);
        return Token::b256(value);
    }
    case Kind::String: {
        BOOST_OUTCOME_TRY(
            auto const raw,
            consume(round_up(type.length(), WORD_SIZE), type));
        return Token::string(std::string{
            reinterpret_cast<char const *>(raw.data()), type.length()});
    }
    case Kind::Array: {
        size_t const width = encoding_width(type.element());
        if (FUELCALL_UNLIKELY(type.length() > enc_.size() / width)) {
            return fail(AbiError::MalformedLength, type);
        }
        BOOST_OUTCOME_TRY(
            auto elements, decode_elements(type.element(), type.length()));
        return Token::array(std::move(elements));
    }
    case Kind::Vector: {
        BOOST_OUTCOME_TRY(auto const length, consume_word(type));
        // reject before allocating: every element takes at least one byte
        size_t const width = encoding_width(type.element());
        if (FUELCALL_UNLIKELY(length > enc_.size() / width)) {
            return fail(AbiError::MalformedLength, type);
        }
        BOOST_OUTCOME_TRY(
            auto elements,
            decode_elements(type.element(), static_cast<size_t>(length)));
        return Token::vector(std::move(elements));
    }
    case Kind::Tuple: {
        BOOST_OUTCOME_TRY(auto elements, decode_components(type));
        return Token::tuple(std::move(elements));
    }
    case Kind::Struct: {
        BOOST_OUTCOME_TRY(auto fields, decode_components(type));
        return Token::structure(std::move(fields));
    }
    case Kind::Enum:
        return decode_enum(type);
    }
    return fail(AbiError::UnsupportedType, type);
}

Result<std::vector<Token>>
AbiDecoder::decode_components(ParamType const &type)
{
    auto const &components = type.components();
    std::vector<Token> tokens;
    tokens.reserve(components.size());
    for (size_t i = 0; i < components.size(); ++i) {
        SchemaPath::Scope const scope{
            path_,
            components[i].name.empty() ? std::to_string(i)
                                       : components[i].name};
        BOOST_OUTCOME_TRY(auto token, decode_value(components[i].type));
        tokens.push_back(std::move(token));
    }
    return tokens;
}

Result<std::vector<Token>>
AbiDecoder::decode_elements(ParamType const &element, size_t const count)
{
    std::vector<Token> tokens;
    tokens.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        SchemaPath::Scope const scope{path_, "[" + std::to_string(i) + "]"};
        BOOST_OUTCOME_TRY(auto token, decode_value(element));
        tokens.push_back(std::move(token));
    }
    return tokens;
}

Result<Token> AbiDecoder::decode_enum(ParamType const &type)
{
    auto const &variants = type.components();

    BOOST_OUTCOME_TRY(auto const discriminant, consume_word(type));
    if (FUELCALL_UNLIKELY(discriminant >= variants.size())) {
        return fail(AbiError::InvalidDiscriminant, type);
    }

    auto const &variant = variants[discriminant];
    SchemaPath::Scope const scope{path_, "<" + variant.name + ">"};

    BOOST_OUTCOME_TRY(consume(
        encoding_width(type) - ENUM_DISCRIMINANT_WIDTH -
            encoding_width(variant.type),
        type));
    BOOST_OUTCOME_TRY(auto payload, decode_value(variant.type));
    return Token::enumeration(discriminant, std::move(payload));
}

Result<Token> abi_decode(ParamType const &type, byte_string_view &enc)
{
    return AbiDecoder{enc}.decode(type);
}

Result<std::vector<Token>>
abi_decode(std::span<ParamType const> const types, byte_string_view &enc)
{
    AbiDecoder decoder{enc};
    std::vector<Token> tokens;
    tokens.reserve(types.size());
    for (auto const &type : types) {
        BOOST_OUTCOME_TRY(auto token, decoder.decode(type));
        tokens.push_back(std::move(token));
    }
    return tokens;
}

FUELCALL_NAMESPACE_END
