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
#include <fuelcall/core/sha256.hpp>

#include <algorithm>
#include <string>

FUELCALL_NAMESPACE_BEGIN

std::string abi_type_signature(ParamType const &type)
{
    using Kind = ParamType::Kind;

    switch (type.kind()) {
    case Kind::Unit:
        return "()";
    case Kind::Bool:
        return "bool";
    case Kind::U8:
        return "u8";
    case Kind::U16:
        return "u16";
    case Kind::U32:
        return "u32";
    case Kind::U64:
        return "u64";
    case Kind::Byte:
        return "byte";
    case Kind::B256:
        return "b256";
    case Kind::String:
        return "str[" + std::to_string(type.length()) + "]";
    case Kind::Array:
        return abi_type_signature(type.element()) + "[" +
               std::to_string(type.length()) + "]";
    case Kind::Vector:
        return "Vec<" + abi_type_signature(type.element()) + ">";
    case Kind::Tuple: {
        std::string out = "(";
        auto const &elements = type.components();
        for (size_t i = 0; i < elements.size(); ++i) {
            if (i != 0) {
                out += ',';
            }
            out += abi_type_signature(elements[i].type);
        }
        out += ')';
        return out;
    }
    case Kind::Struct:
    case Kind::Enum:
        return type.name();
    }
    return {};
}

std::string abi_function_signature(
    std::string_view const name, std::span<ParamType const> const inputs)
{
    std::string out{name};
    out += '(';
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (i != 0) {
            out += ',';
        }
        out += abi_type_signature(inputs[i]);
    }
    out += ')';
    return out;
}

FunctionSelector abi_encode_selector(std::string_view const signature)
{
    auto const hash = sha256(to_byte_string_view(signature));

    FunctionSelector selector{};
    std::copy_n(
        hash.begin(),
        SELECTOR_HASH_PREFIX,
        selector.begin() + (SELECTOR_SIZE - SELECTOR_HASH_PREFIX));
    return selector;
}

FUELCALL_NAMESPACE_END
