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

#include <fuelcall/abi/function_selector.hpp>
#include <fuelcall/abi/param_type.hpp>
#include <fuelcall/abi/token.hpp>
#include <fuelcall/core/basic_formatter.hpp>
#include <fuelcall/core/fmt/bytes_fmt.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <type_traits>
#include <variant>
#include <vector>

template <>
struct quill::copy_loggable<fuelcall::ParamType> : std::true_type
{
};

template <>
struct quill::copy_loggable<fuelcall::Token> : std::true_type
{
};

template <>
struct fmt::formatter<fuelcall::ParamType> : public fuelcall::BasicFormatter
{
    template <typename FormatContext>
    auto format(fuelcall::ParamType const &value, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "{}", fuelcall::abi_type_signature(value));
        return ctx.out();
    }
};

template <>
struct fmt::formatter<fuelcall::Token> : public fuelcall::BasicFormatter
{
    template <typename FormatContext>
    static void format_sequence(
        std::vector<fuelcall::Token> const &tokens, char const open,
        char const close, FormatContext &ctx)
    {
        fmt::format_to(ctx.out(), "{}", open);
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (i != 0) {
                fmt::format_to(ctx.out(), ", ");
            }
            format_token(tokens[i], ctx);
        }
        fmt::format_to(ctx.out(), "{}", close);
    }

    template <typename FormatContext>
    static void
    format_token(fuelcall::Token const &token, FormatContext &ctx)
    {
        namespace tk = fuelcall::token;

        std::visit(
            [&ctx](auto const &v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, tk::Unit>) {
                    fmt::format_to(ctx.out(), "()");
                }
                else if constexpr (std::is_same_v<T, tk::Byte>) {
                    fmt::format_to(ctx.out(), "0x{:02x}", v.value);
                }
                else if constexpr (std::is_same_v<T, tk::String>) {
                    fmt::format_to(ctx.out(), "\"{}\"", v.value);
                }
                else if constexpr (
                    std::is_same_v<T, tk::Array> ||
                    std::is_same_v<T, tk::Vector>) {
                    format_sequence(v.elements, '[', ']', ctx);
                }
                else if constexpr (std::is_same_v<T, tk::Tuple>) {
                    format_sequence(v.elements, '(', ')', ctx);
                }
                else if constexpr (std::is_same_v<T, tk::Struct>) {
                    format_sequence(v.fields, '{', '}', ctx);
                }
                else if constexpr (std::is_same_v<T, tk::Enum>) {
                    fmt::format_to(ctx.out(), "#{}(", v.discriminant);
                    if (v.payload) {
                        format_token(*v.payload, ctx);
                    }
                    fmt::format_to(ctx.out(), ")");
                }
                else {
                    fmt::format_to(ctx.out(), "{}", v.value);
                }
            },
            token.value);
    }

    template <typename FormatContext>
    auto format(fuelcall::Token const &value, FormatContext &ctx) const
    {
        format_token(value, ctx);
        return ctx.out();
    }
};
