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

#include <fuelcall/core/bytes.hpp>
#include <fuelcall/core/config.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

FUELCALL_NAMESPACE_BEGIN

struct Token;

namespace token
{
    struct Unit
    {
        bool operator==(Unit const &) const = default;
    };

    struct Bool
    {
        bool value;
        bool operator==(Bool const &) const = default;
    };

    struct U8
    {
        uint8_t value;
        bool operator==(U8 const &) const = default;
    };

    struct U16
    {
        uint16_t value;
        bool operator==(U16 const &) const = default;
    };

    struct U32
    {
        uint32_t value;
        bool operator==(U32 const &) const = default;
    };

    struct U64
    {
        uint64_t value;
        bool operator==(U64 const &) const = default;
    };

    struct Byte
    {
        uint8_t value;
        bool operator==(Byte const &) const = default;
    };

    struct B256
    {
        bytes32_t value;
        bool operator==(B256 const &) const = default;
    };

    struct String
    {
        std::string value;
        bool operator==(String const &) const = default;
    };

    struct Array
    {
        std::vector<Token> elements;
        bool operator==(Array const &) const;
    };

    struct Vector
    {
        std::vector<Token> elements;
        bool operator==(Vector const &) const;
    };

    struct Tuple
    {
        std::vector<Token> elements;
        bool operator==(Tuple const &) const;
    };

    struct Struct
    {
        std::vector<Token> fields;
        bool operator==(Struct const &) const;
    };

    // The discriminant is carried explicitly; it cannot be recovered from the
    // payload alone.
    struct Enum
    {
        uint64_t discriminant;
        std::shared_ptr<Token const> payload;
        bool operator==(Enum const &) const;
    };
}

// Schema-tagged value exchanged with the encoder and decoder. Only meaningful
// together with the ParamType it was produced from or is encoded against.
struct Token
{
    using Value = std::variant<
        token::Unit, token::Bool, token::U8, token::U16, token::U32,
        token::U64, token::Byte, token::B256, token::String, token::Array,
        token::Vector, token::Tuple, token::Struct, token::Enum>;

    Value value;

    static Token unit();
    static Token boolean(bool);
    static Token u8(uint8_t);
    static Token u16(uint16_t);
    static Token u32(uint32_t);
    static Token u64(uint64_t);
    static Token byte(uint8_t);
    static Token b256(bytes32_t const &);
    static Token string(std::string);
    static Token array(std::vector<Token>);
    static Token vector(std::vector<Token>);
    static Token tuple(std::vector<Token>);
    static Token structure(std::vector<Token>);
    static Token enumeration(uint64_t discriminant, Token payload);

    template <typename T>
    bool holds() const noexcept
    {
        return std::holds_alternative<T>(value);
    }

    template <typename T>
    T const *get_if() const noexcept
    {
        return std::get_if<T>(&value);
    }

    bool operator==(Token const &) const;
};

FUELCALL_NAMESPACE_END
