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

#include <fuelcall/abi/token.hpp>

#include <utility>

FUELCALL_NAMESPACE_BEGIN

namespace token
{
    bool Array::operator==(Array const &other) const
    {
        return elements == other.elements;
    }

    bool Vector::operator==(Vector const &other) const
    {
        return elements == other.elements;
    }

    bool Tuple::operator==(Tuple const &other) const
    {
        return elements == other.elements;
    }

    bool Struct::operator==(Struct const &other) const
    {
        return fields == other.fields;
    }

    bool Enum::operator==(Enum const &other) const
    {
        if (discriminant != other.discriminant) {
            return false;
        }
        if (payload == nullptr || other.payload == nullptr) {
            return payload == other.payload;
        }
        return *payload == *other.payload;
    }
}

Token Token::unit()
{
    return Token{token::Unit{}};
}

Token Token::boolean(bool const value)
{
    return Token{token::Bool{value}};
}

Token Token::u8(uint8_t const value)
{
    return Token{token::U8{value}};
}

Token Token::u16(uint16_t const value)
{
    return Token{token::U16{value}};
}

Token Token::u32(uint32_t const value)
{
    return Token{token::U32{value}};
}

Token Token::u64(uint64_t const value)
{
    return Token{token::U64{value}};
}

Token Token::byte(uint8_t const value)
{
    return Token{token::Byte{value}};
}

Token Token::b256(bytes32_t const &value)
{
    return Token{token::B256{value}};
}

Token Token::string(std::string value)
{
    return Token{token::String{std::move(value)}};
}

Token Token::array(std::vector<Token> elements)
{
    return Token{token::Array{std::move(elements)}};
}

Token Token::vector(std::vector<Token> elements)
{
    return Token{token::Vector{std::move(elements)}};
}

Token Token::tuple(std::vector<Token> elements)
{
    return Token{token::Tuple{std::move(elements)}};
}

Token Token::structure(std::vector<Token> fields)
{
    return Token{token::Struct{std::move(fields)}};
}

Token Token::enumeration(uint64_t const discriminant, Token payload)
{
    return Token{token::Enum{
        discriminant, std::make_shared<Token const>(std::move(payload))}};
}

bool Token::operator==(Token const &other) const
{
    return value == other.value;
}

FUELCALL_NAMESPACE_END
