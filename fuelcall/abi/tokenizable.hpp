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
#include <fuelcall/abi/token.hpp>
#include <fuelcall/core/bytes.hpp>
#include <fuelcall/core/config.hpp>
#include <fuelcall/core/likely.h>
#include <fuelcall/core/result.hpp>

#include <boost/outcome/try.hpp>

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

FUELCALL_NAMESPACE_BEGIN

// Maps a host type to its schema and to and from tokens. Specialize for user
// structs to pass them directly to typed calls:
//
//   template <>
//   struct Tokenizable<Cocktail>
//   {
//       static ParamType param_type();
//       static Token into_token(Cocktail const &);
//       static Result<Cocktail> from_token(Token const &);
//   };
template <typename T>
struct Tokenizable;

template <typename T>
concept TokenizableType = requires(T const &value, Token const &token) {
    { Tokenizable<T>::param_type() } -> std::same_as<ParamType>;
    { Tokenizable<T>::into_token(value) } -> std::same_as<Token>;
    { Tokenizable<T>::from_token(token) } -> std::same_as<Result<T>>;
};

template <TokenizableType T>
ParamType param_type_of()
{
    return Tokenizable<T>::param_type();
}

template <TokenizableType T>
Token to_token(T const &value)
{
    return Tokenizable<T>::into_token(value);
}

template <TokenizableType T>
Result<T> from_token(Token const &token)
{
    return Tokenizable<T>::from_token(token);
}

namespace detail
{
    template <typename T, typename Tag, ParamType (*make)()>
    struct PrimitiveTokenizable
    {
        static ParamType param_type()
        {
            return make();
        }

        static Token into_token(T const &value)
        {
            return Token{Tag{value}};
        }

        static Result<T> from_token(Token const &token)
        {
            auto const *const v = token.get_if<Tag>();
            if (FUELCALL_UNLIKELY(v == nullptr)) {
                return AbiError::SchemaMismatch;
            }
            return v->value;
        }
    };

    template <TokenizableType T>
    Result<std::vector<T>> from_tokens(std::vector<Token> const &tokens)
    {
        std::vector<T> out;
        out.reserve(tokens.size());
        for (auto const &token : tokens) {
            BOOST_OUTCOME_TRY(auto value, Tokenizable<T>::from_token(token));
            out.push_back(std::move(value));
        }
        return out;
    }
}

template <>
struct Tokenizable<bool>
    : detail::PrimitiveTokenizable<bool, token::Bool, &ParamType::boolean>
{
};

template <>
struct Tokenizable<uint8_t>
    : detail::PrimitiveTokenizable<uint8_t, token::U8, &ParamType::u8>
{
};

template <>
struct Tokenizable<uint16_t>
    : detail::PrimitiveTokenizable<uint16_t, token::U16, &ParamType::u16>
{
};

template <>
struct Tokenizable<uint32_t>
    : detail::PrimitiveTokenizable<uint32_t, token::U32, &ParamType::u32>
{
};

template <>
struct Tokenizable<uint64_t>
    : detail::PrimitiveTokenizable<uint64_t, token::U64, &ParamType::u64>
{
};

template <>
struct Tokenizable<bytes32_t>
    : detail::PrimitiveTokenizable<bytes32_t, token::B256, &ParamType::b256>
{
};

template <>
struct Tokenizable<std::monostate>
{
    static ParamType param_type()
    {
        return ParamType::unit();
    }

    static Token into_token(std::monostate const &)
    {
        return Token::unit();
    }

    static Result<std::monostate> from_token(Token const &token)
    {
        if (FUELCALL_UNLIKELY(!token.holds<token::Unit>())) {
            return AbiError::SchemaMismatch;
        }
        return std::monostate{};
    }
};

template <TokenizableType T>
struct Tokenizable<std::vector<T>>
{
    static ParamType param_type()
    {
        return ParamType::vector(Tokenizable<T>::param_type());
    }

    static Token into_token(std::vector<T> const &values)
    {
        std::vector<Token> elements;
        elements.reserve(values.size());
        for (auto const &value : values) {
            elements.push_back(Tokenizable<T>::into_token(value));
        }
        return Token::vector(std::move(elements));
    }

    static Result<std::vector<T>> from_token(Token const &token)
    {
        auto const *const v = token.get_if<token::Vector>();
        if (FUELCALL_UNLIKELY(v == nullptr)) {
            return AbiError::SchemaMismatch;
        }
        return detail::from_tokens<T>(v->elements);
    }
};

template <TokenizableType T, size_t N>
struct Tokenizable<std::array<T, N>>
{
    static ParamType param_type()
    {
        return ParamType::array(Tokenizable<T>::param_type(), N);
    }

    static Token into_token(std::array<T, N> const &values)
    {
        std::vector<Token> elements;
        elements.reserve(N);
        for (auto const &value : values) {
            elements.push_back(Tokenizable<T>::into_token(value));
        }
        return Token::array(std::move(elements));
    }

    static Result<std::array<T, N>> from_token(Token const &token)
    {
        auto const *const a = token.get_if<token::Array>();
        if (FUELCALL_UNLIKELY(a == nullptr || a->elements.size() != N)) {
            return AbiError::SchemaMismatch;
        }
        std::array<T, N> out{};
        for (size_t i = 0; i < N; ++i) {
            BOOST_OUTCOME_TRY(
                auto value, Tokenizable<T>::from_token(a->elements[i]));
            out[i] = std::move(value);
        }
        return out;
    }
};

template <TokenizableType... Ts>
struct Tokenizable<std::tuple<Ts...>>
{
    static ParamType param_type()
    {
        return ParamType::tuple({Tokenizable<Ts>::param_type()...});
    }

    static Token into_token(std::tuple<Ts...> const &values)
    {
        return std::apply(
            [](Ts const &...value) {
                return Token::tuple({Tokenizable<Ts>::into_token(value)...});
            },
            values);
    }

    static Result<std::tuple<Ts...>> from_token(Token const &token)
    {
        auto const *const t = token.get_if<token::Tuple>();
        if (FUELCALL_UNLIKELY(
                t == nullptr || t->elements.size() != sizeof...(Ts))) {
            return AbiError::SchemaMismatch;
        }
        return from_elements(t->elements, std::index_sequence_for<Ts...>{});
    }

private:
    template <size_t... I>
    static Result<std::tuple<Ts...>> from_elements(
        std::vector<Token> const &elements, std::index_sequence<I...>)
    {
        std::tuple<Result<Ts>...> results{
            Tokenizable<Ts>::from_token(elements[I])...};
        bool const ok = (std::get<I>(results).has_value() && ...);
        if (FUELCALL_UNLIKELY(!ok)) {
            return AbiError::SchemaMismatch;
        }
        return std::tuple<Ts...>{std::move(std::get<I>(results)).value()...};
    }
};

FUELCALL_NAMESPACE_END
