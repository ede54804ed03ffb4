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

#include <fuelcall/abi/abi_error.hpp>
#include <fuelcall/abi/call_data.hpp>
#include <fuelcall/abi/param_type.hpp>
#include <fuelcall/abi/token.hpp>
#include <fuelcall/core/byte_string.hpp>
#include <fuelcall/core/bytes.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <gtest/gtest.h>

#include <string_view>
#include <vector>

using namespace fuelcall;

namespace
{
    byte_string from_hex(std::string_view const hex)
    {
        return evmc::from_hex(hex).value();
    }

    ParamType cocktail()
    {
        return ParamType::structure(
            "Cocktail",
            {{"the_thing_you_mix_in",
              ParamType::enumeration(
                  "Shaker",
                  {{"Cosmopolitan", ParamType::u64()},
                   {"Mojito", ParamType::u64()}})},
             {"glass", ParamType::u64()}});
    }

    Token mojito()
    {
        return Token::structure(
            {Token::enumeration(1, Token::u64(222)), Token::u64(333)});
    }
}

TEST(CallData, inline_arguments)
{
    std::vector<ParamType> const types{ParamType::u64(), ParamType::boolean()};
    std::vector<Token> const tokens{Token::u64(42), Token::boolean(true)};

    auto const encoded = encode_call_arguments(types, tokens);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded.value(), from_hex("000000000000002a0000000000000001"));

    auto const decoded = decode_call_arguments(types, encoded.value());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), tokens);
}

TEST(CallData, small_argument_is_right_aligned)
{
    std::vector<ParamType> const types{ParamType::byte()};
    std::vector<Token> const tokens{Token::byte(0xab)};

    auto const encoded = encode_call_arguments(types, tokens);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded.value(), from_hex("00000000000000ab"));

    auto const decoded = decode_call_arguments(types, encoded.value());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), tokens);
}

TEST(CallData, large_argument_is_indirect)
{
    std::vector<ParamType> const types{ParamType::u64(), cocktail()};
    std::vector<Token> const tokens{Token::u64(1), mojito()};

    auto const encoded = encode_call_arguments(types, tokens);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(
        encoded.value(),
        from_hex("0000000000000001"
                 "0000000000000010"
                 "0000000000000001"
                 "00000000000000de"
                 "000000000000014d"));

    auto const decoded = decode_call_arguments(types, encoded.value());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), tokens);
}

TEST(CallData, pointers_include_base_address)
{
    std::vector<ParamType> const types{ParamType::u64(), cocktail()};
    std::vector<Token> const tokens{Token::u64(1), mojito()};

    auto const encoded = encode_call_arguments(types, tokens, 100);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded.value().substr(8, 8), from_hex("0000000000000074"));

    auto const decoded = decode_call_arguments(types, encoded.value(), 100);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), tokens);
}

TEST(CallData, several_indirect_arguments)
{
    std::vector<ParamType> const types{ParamType::b256(), cocktail()};
    std::vector<Token> const tokens{
        Token::b256(bytes32_t{0x2a}), mojito()};

    auto const encoded = encode_call_arguments(types, tokens);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded.value().size(), 16u + 32u + 24u);
    EXPECT_EQ(
        encoded.value().substr(0, 16),
        from_hex("00000000000000100000000000000030"));

    auto const decoded = decode_call_arguments(types, encoded.value());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), tokens);
}

TEST(CallData, vectors)
{
    std::vector<ParamType> const types{ParamType::vector(ParamType::u64())};

    std::vector<Token> const empty{Token::vector({})};
    auto const empty_encoded = encode_call_arguments(types, empty);
    ASSERT_TRUE(empty_encoded.has_value());
    EXPECT_EQ(empty_encoded.value(), from_hex("0000000000000000"));
    auto const empty_decoded =
        decode_call_arguments(types, empty_encoded.value());
    ASSERT_TRUE(empty_decoded.has_value());
    EXPECT_EQ(empty_decoded.value(), empty);

    std::vector<Token> const one{Token::vector({Token::u64(5)})};
    auto const one_encoded = encode_call_arguments(types, one);
    ASSERT_TRUE(one_encoded.has_value());
    EXPECT_EQ(
        one_encoded.value(),
        from_hex("0000000000000008"
                 "0000000000000001"
                 "0000000000000005"));
    auto const one_decoded = decode_call_arguments(types, one_encoded.value());
    ASSERT_TRUE(one_decoded.has_value());
    EXPECT_EQ(one_decoded.value(), one);
}

TEST(CallData, pointer_out_of_bounds)
{
    std::vector<ParamType> const types{ParamType::u64(), cocktail()};

    // points back into the head
    byte_string const into_head = from_hex("0000000000000001"
                                           "0000000000000008"
                                           "0000000000000001"
                                           "00000000000000de"
                                           "000000000000014d");
    auto const head = decode_call_arguments(types, into_head);
    ASSERT_TRUE(head.has_error());
    EXPECT_EQ(head.assume_error(), AbiError::MalformedLength);

    // points past the end
    byte_string const past_end = from_hex("0000000000000001"
                                          "0000000000000100");
    auto const past = decode_call_arguments(types, past_end);
    ASSERT_TRUE(past.has_error());
    EXPECT_EQ(past.assume_error(), AbiError::MalformedLength);

    // below the base address
    byte_string const below = from_hex("0000000000000001"
                                       "0000000000000010"
                                       "0000000000000001"
                                       "00000000000000de"
                                       "000000000000014d");
    auto const under = decode_call_arguments(types, below, 1000);
    ASSERT_TRUE(under.has_error());
    EXPECT_EQ(under.assume_error(), AbiError::MalformedLength);
}

TEST(CallData, truncated_head)
{
    std::vector<ParamType> const types{ParamType::u64(), ParamType::u64()};
    byte_string const data = from_hex("0000000000000001");

    auto const decoded = decode_call_arguments(types, data);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), AbiError::TruncatedPayload);
}

TEST(CallData, argument_count_mismatch)
{
    std::vector<ParamType> const types{ParamType::u64()};
    std::vector<Token> const tokens{};

    auto const encoded = encode_call_arguments(types, tokens);
    ASSERT_TRUE(encoded.has_error());
    EXPECT_EQ(encoded.assume_error(), AbiError::SchemaMismatch);
}

TEST(CallData, decode_word)
{
    byte_string_fixed<8> const byte_word{0, 0, 0, 0, 0, 0, 0, 0xab};
    auto const byte = decode_word(ParamType::byte(), byte_word);
    ASSERT_TRUE(byte.has_value());
    EXPECT_EQ(byte.value(), Token::byte(0xab));

    byte_string_fixed<8> const dirty{0, 0, 0, 0, 0, 0, 1, 0xab};
    auto const bad = decode_word(ParamType::byte(), dirty);
    ASSERT_TRUE(bad.has_error());
    EXPECT_EQ(bad.assume_error(), AbiError::InvalidValue);

    byte_string_fixed<8> const u64_word{0, 0, 0, 1, 0, 0, 0, 0};
    auto const u64 = decode_word(ParamType::u64(), u64_word);
    ASSERT_TRUE(u64.has_value());
    EXPECT_EQ(u64.value(), Token::u64(4294967296));
}
