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
#include <fuelcall/abi/param_type.hpp>
#include <fuelcall/abi/token.hpp>
#include <fuelcall/abi/tokenizable.hpp>
#include <fuelcall/core/bytes.hpp>
#include <fuelcall/core/likely.h>

#include <boost/outcome/try.hpp>
#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <tuple>
#include <variant>
#include <vector>

using namespace fuelcall;

namespace
{
    struct Drink
    {
        uint64_t volume;
        bool iced;
        std::array<uint8_t, 2> garnish;

        bool operator==(Drink const &) const = default;
    };
}

template <>
struct fuelcall::Tokenizable<Drink>
{
    static ParamType param_type()
    {
        return ParamType::structure(
            "Drink",
            {{"volume", param_type_of<uint64_t>()},
             {"iced", param_type_of<bool>()},
             {"garnish", param_type_of<std::array<uint8_t, 2>>()}});
    }

    static Token into_token(Drink const &drink)
    {
        return Token::structure(
            {to_token(drink.volume),
             to_token(drink.iced),
             to_token(drink.garnish)});
    }

    static Result<Drink> from_token(Token const &token)
    {
        auto const *const s = token.get_if<token::Struct>();
        if (FUELCALL_UNLIKELY(s == nullptr || s->fields.size() != 3)) {
            return AbiError::SchemaMismatch;
        }
        BOOST_OUTCOME_TRY(
            auto const volume, fuelcall::from_token<uint64_t>(s->fields[0]));
        BOOST_OUTCOME_TRY(
            auto const iced, fuelcall::from_token<bool>(s->fields[1]));
        BOOST_OUTCOME_TRY(
            auto const garnish,
            fuelcall::from_token<std::array<uint8_t, 2>>(s->fields[2]));
        return Drink{volume, iced, garnish};
    }
};

TEST(Tokenizable, primitives)
{
    EXPECT_EQ(param_type_of<uint32_t>(), ParamType::u32());
    EXPECT_EQ(to_token(uint16_t{7}), Token::u16(7));
    EXPECT_EQ(to_token(true), Token::boolean(true));
    EXPECT_EQ(to_token(std::monostate{}), Token::unit());

    auto const value = from_token<uint64_t>(Token::u64(42));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 42u);

    auto const mismatch = from_token<uint64_t>(Token::u32(42));
    ASSERT_TRUE(mismatch.has_error());
    EXPECT_EQ(mismatch.assume_error(), AbiError::SchemaMismatch);
}

TEST(Tokenizable, b256)
{
    bytes32_t const hash{0xabcdef};
    EXPECT_EQ(param_type_of<bytes32_t>(), ParamType::b256());
    EXPECT_EQ(to_token(hash), Token::b256(hash));
    EXPECT_EQ(from_token<bytes32_t>(Token::b256(hash)).value(), hash);
}

TEST(Tokenizable, containers)
{
    std::vector<uint32_t> const numbers{1, 2, 3};
    EXPECT_EQ(
        param_type_of<std::vector<uint32_t>>(),
        ParamType::vector(ParamType::u32()));
    EXPECT_EQ(
        to_token(numbers),
        Token::vector({Token::u32(1), Token::u32(2), Token::u32(3)}));
    EXPECT_EQ(
        from_token<std::vector<uint32_t>>(to_token(numbers)).value(),
        numbers);

    using Pair = std::tuple<uint8_t, bool>;
    Pair const pair{9, false};
    EXPECT_EQ(
        param_type_of<Pair>(),
        ParamType::tuple({ParamType::u8(), ParamType::boolean()}));
    EXPECT_EQ(from_token<Pair>(to_token(pair)).value(), pair);

    auto const short_array = from_token<std::array<uint8_t, 3>>(
        Token::array({Token::u8(1), Token::u8(2)}));
    ASSERT_TRUE(short_array.has_error());
    EXPECT_EQ(short_array.assume_error(), AbiError::SchemaMismatch);
}

TEST(Tokenizable, user_struct)
{
    Drink const drink{.volume = 330, .iced = true, .garnish = {4, 5}};

    auto const encoded =
        abi_encode(param_type_of<Drink>(), to_token(drink));
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded.value().size(), 32u);

    byte_string_view enc{encoded.value()};
    auto const decoded = abi_decode(param_type_of<Drink>(), enc);
    ASSERT_TRUE(decoded.has_value());

    auto const back = from_token<Drink>(decoded.value());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back.value(), drink);
}
