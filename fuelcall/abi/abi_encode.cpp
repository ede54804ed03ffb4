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

#include <fuelcall/abi/abi_encode.hpp>
#include <fuelcall/abi/abi_error.hpp>
#include <fuelcall/abi/function_selector.hpp>
#include <fuelcall/core/likely.h>
#include <fuelcall/core/math.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <string>

FUELCALL_NAMESPACE_BEGIN

void AbiEncoder::add_word(uint64_t const value)
{
    u64_be const word{value};
    buffer_.append(word.bytes, sizeof(word));
}

void AbiEncoder::add_padding(size_t const n)
{
    buffer_.append(n, 0);
}

AbiError AbiEncoder::fail(AbiError const error, ParamType const &type) const
{
    LOG_ERROR(
        "abi encode failed at {}: {} (expected {})",
        path_.to_string(),
        AbiErrorCode{error}.message().c_str(),
        abi_type_signature(type));
    return error;
}

Result<void> AbiEncoder::add(ParamType const &type, Token const &token)
{
    if (auto const res = validate(type); FUELCALL_UNLIKELY(res.has_error())) {
        return fail(AbiError::UnsupportedType, type);
    }

    size_t const size = buffer_.size();
    auto res = encode_value(type, token);
    if (FUELCALL_UNLIKELY(res.has_error())) {
        buffer_.resize(size);
    }
    return res;
}

Result<void>
AbiEncoder::encode_value(ParamType const &type, Token const &token)
{
    using Kind = ParamType::Kind;

    switch (type.kind()) {
    case Kind::Unit:
        if (FUELCALL_UNLIKELY(!token.holds<token::Unit>())) {
            break;
        }
        add_padding(WORD_SIZE);
        return outcome::success();
    case Kind::Bool:
        if (auto const *const b = token.get_if<token::Bool>()) {
            buffer_ += to_byte_string_view(abi_encode_bool(b->value));
            return outcome::success();
        }
        break;
    case Kind::U8:
        if (auto const *const i = token.get_if<token::U8>()) {
            add_word(i->value);
            return outcome::success();
        }
        break;
    case Kind::U16:
        if (auto const *const i = token.get_if<token::U16>()) {
            add_word(i->value);
            return outcome::success();
        }
        break;
    case Kind::U32:
        if (auto const *const i = token.get_if<token::U32>()) {
            add_word(i->value);
            return outcome::success();
        }
        break;
    case Kind::U64:
        if (auto const *const i = token.get_if<token::U64>()) {
            add_word(i->value);
            return outcome::success();
        }
        break;
    case Kind::Byte:
        if (auto const *const b = token.get_if<token::Byte>()) {
            buffer_.push_back(b->value);
            return outcome::success();
        }
        break;
    case Kind::B256:
        if (auto const *const b = token.get_if<token::B256>()) {
            buffer_.append(b->value.bytes, B256_SIZE);
            return outcome::success();
        }
        break;
    case Kind::String:
        if (auto const *const s = token.get_if<token::String>()) {
            if (FUELCALL_UNLIKELY(s->value.size() != type.length())) {
                break;
            }
            buffer_ += to_byte_string_view(s->value);
            add_padding(
                round_up(s->value.size(), WORD_SIZE) - s->value.size());
            return outcome::success();
        }
        break;
    case Kind::Array:
        if (auto const *const a = token.get_if<token::Array>()) {
            if (FUELCALL_UNLIKELY(a->elements.size() != type.length())) {
                break;
            }
            return encode_elements(type.element(), a->elements);
        }
        break;
    case Kind::Vector:
        if (auto const *const v = token.get_if<token::Vector>()) {
            add_word(v->elements.size());
            return encode_elements(type.element(), v->elements);
        }
        break;
    case Kind::Tuple:
        if (auto const *const t = token.get_if<token::Tuple>()) {
            return encode_components(type, t->elements);
        }
        break;
    case Kind::Struct:
        if (auto const *const s = token.get_if<token::Struct>()) {
            return encode_components(type, s->fields);
        }
        break;
    case Kind::Enum:
        if (auto const *const e = token.get_if<token::Enum>()) {
            return encode_enum(type, *e);
        }
        break;
    }
    return fail(AbiError::SchemaMismatch, type);
}

Result<void> AbiEncoder::encode_components(
    ParamType const &type, std::vector<Token> const &tokens)
{
    auto const &components = type.components();
    if (FUELCALL_UNLIKELY(components.size() != tokens.size())) {
        return fail(AbiError::SchemaMismatch, type);
    }
    for (size_t i = 0; i < components.size(); ++i) {
        SchemaPath::Scope const scope{
            path_,
            components[i].name.empty() ? std::to_string(i)
                                       : components[i].name};
        BOOST_OUTCOME_TRY(encode_value(components[i].type, tokens[i]));
    }
    return outcome::success();
}

Result<void> AbiEncoder::encode_elements(
    ParamType const &element, std::vector<Token> const &tokens)
{
    for (size_t i = 0; i < tokens.size(); ++i) {
        SchemaPath::Scope const scope{path_, "[" + std::to_string(i) + "]"};
        BOOST_OUTCOME_TRY(encode_value(element, tokens[i]));
    }
    return outcome::success();
}

Result<void>
AbiEncoder::encode_enum(ParamType const &type, token::Enum const &e)
{
    auto const &variants = type.components();
    if (FUELCALL_UNLIKELY(
            e.discriminant >= variants.size() || e.payload == nullptr)) {
        return fail(AbiError::SchemaMismatch, type);
    }

    auto const &variant = variants[e.discriminant];
    SchemaPath::Scope const scope{path_, "<" + variant.name + ">"};

    // every variant is fixed-size, the active one is left padded to the
    // widest so that the enum has a single width
    add_word(e.discriminant);
    add_padding(
        encoding_width(type) - ENUM_DISCRIMINANT_WIDTH -
        encoding_width(variant.type));
    return encode_value(variant.type, *e.payload);
}

Result<byte_string> abi_encode(ParamType const &type, Token const &token)
{
    AbiEncoder encoder;
    BOOST_OUTCOME_TRY(encoder.add(type, token));
    return encoder.encode_final();
}

Result<byte_string> abi_encode(
    std::span<ParamType const> const types, std::span<Token const> const tokens)
{
    if (FUELCALL_UNLIKELY(types.size() != tokens.size())) {
        LOG_ERROR(
            "abi encode failed: {} values for {} parameters",
            tokens.size(),
            types.size());
        return AbiError::SchemaMismatch;
    }

    AbiEncoder encoder;
    for (size_t i = 0; i < types.size(); ++i) {
        BOOST_OUTCOME_TRY(encoder.add(types[i], tokens[i]));
    }
    return encoder.encode_final();
}

FUELCALL_NAMESPACE_END
