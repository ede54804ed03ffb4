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

#include <fuelcall/abi/function_selector.hpp>
#include <fuelcall/abi/param_type.hpp>
#include <fuelcall/core/byte_string.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <gtest/gtest.h>

#include <string_view>
#include <vector>

using namespace fuelcall;

namespace
{
    byte_string selector_bytes(FunctionSelector const &selector)
    {
        return byte_string{selector.begin(), selector.end()};
    }

    byte_string from_hex(std::string_view const hex)
    {
        return evmc::from_hex(hex).value();
    }

    ParamType my_struct()
    {
        return ParamType::structure(
            "MyStruct",
            {{"foo", ParamType::u8()}, {"bar", ParamType::boolean()}});
    }

    ParamType foo()
    {
        return ParamType::structure(
            "Foo", {{"a", ParamType::u64()}, {"b", my_struct()}});
    }
}

TEST(FunctionSelector, type_signature)
{
    EXPECT_EQ(abi_type_signature(ParamType::unit()), "()");
    EXPECT_EQ(abi_type_signature(ParamType::boolean()), "bool");
    EXPECT_EQ(abi_type_signature(ParamType::byte()), "byte");
    EXPECT_EQ(abi_type_signature(ParamType::b256()), "b256");
    EXPECT_EQ(abi_type_signature(ParamType::string(23)), "str[23]");
    EXPECT_EQ(
        abi_type_signature(ParamType::array(ParamType::u8(), 3)), "u8[3]");
    EXPECT_EQ(
        abi_type_signature(ParamType::vector(ParamType::u64())), "Vec<u64>");
    EXPECT_EQ(
        abi_type_signature(
            ParamType::tuple({ParamType::u64(), ParamType::boolean()})),
        "(u64,bool)");
    EXPECT_EQ(abi_type_signature(my_struct()), "MyStruct");
}

TEST(FunctionSelector, function_signature)
{
    std::vector<ParamType> const inputs{
        foo(),
        ParamType::array(ParamType::u8(), 2),
        ParamType::b256(),
        ParamType::string(23)};
    EXPECT_EQ(
        abi_function_signature("long_function", inputs),
        "long_function(Foo,u8[2],b256,str[23])");
    EXPECT_EQ(abi_function_signature("empty", {}), "empty()");
}

TEST(FunctionSelector, known_selectors)
{
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("entry_one(u64)")),
        from_hex("000000000c36cb9c"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("entry_one(u32)")),
        from_hex("00000000b79ef743"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("takes_two(u32,u32)")),
        from_hex("00000000a707b08e"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("bool_check(bool)")),
        from_hex("00000000668fff58"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("takes_two_types(u32,bool)")),
        from_hex("00000000f540732b"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("takes_one_byte(byte)")),
        from_hex("000000002ee3ce1f"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("takes_bits256(b256)")),
        from_hex("0000000001494296"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("takes_integer_array(u8[3])")),
        from_hex("000000002c5a102e"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("takes_string(str[23])")),
        from_hex("00000000d56e7651"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("takes_my_struct(MyStruct)")),
        from_hex("00000000a81e8dd7"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("takes_my_enum(MyEnum)")),
        from_hex("00000000355ca6fa"));
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("takes_my_nested_struct(Foo)")),
        from_hex("00000000ea0afd23"));
}

TEST(FunctionSelector, from_schema)
{
    std::vector<ParamType> const inputs{
        foo(),
        ParamType::array(ParamType::u8(), 2),
        ParamType::b256(),
        ParamType::string(23)};
    EXPECT_EQ(
        selector_bytes(abi_encode_selector("long_function", inputs)),
        from_hex("000000001093b212"));

    std::vector<ParamType> const two{ParamType::u32(), ParamType::boolean()};
    EXPECT_EQ(
        abi_encode_selector("takes_two_types", two),
        abi_encode_selector("takes_two_types(u32,bool)"));
}

TEST(FunctionSelector, stable_and_distinct)
{
    std::vector<ParamType> const u64{ParamType::u64()};
    std::vector<ParamType> const u32{ParamType::u32()};

    EXPECT_EQ(
        abi_encode_selector("entry_one", u64),
        abi_encode_selector("entry_one", u64));
    EXPECT_NE(
        abi_encode_selector("entry_one", u64),
        abi_encode_selector("entry_one", u32));
    EXPECT_NE(
        abi_encode_selector("entry_one", u64),
        abi_encode_selector("entry_two", u64));
}
