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

#include <fuelcall/core/config.hpp>
#include <fuelcall/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

FUELCALL_NAMESPACE_BEGIN

struct Component;

// Shape of a value in the VM calling convention. A ParamType is immutable once
// built; children are shared read-only between copies so one schema can be
// reused by any number of concurrent calls.
class ParamType
{
public:
    enum class Kind : uint8_t
    {
        Unit,
        Bool,
        U8,
        U16,
        U32,
        U64,
        Byte,
        B256,
        String,
        Array,
        Vector,
        Tuple,
        Struct,
        Enum,
    };

    ParamType() = default;

    static ParamType unit();
    static ParamType boolean();
    static ParamType u8();
    static ParamType u16();
    static ParamType u32();
    static ParamType u64();
    static ParamType byte();
    static ParamType b256();
    static ParamType string(size_t length);
    static ParamType array(ParamType element, size_t length);
    static ParamType vector(ParamType element);
    static ParamType tuple(std::vector<ParamType> elements);
    static ParamType structure(std::string name, std::vector<Component> fields);
    static ParamType
    enumeration(std::string name, std::vector<Component> variants);

    Kind kind() const noexcept
    {
        return kind_;
    }

    // struct or enum name, empty otherwise
    std::string const &name() const noexcept
    {
        return name_;
    }

    // array element count or string byte length
    size_t length() const noexcept
    {
        return length_;
    }

    // element of an array or vector
    ParamType const &element() const;

    // fields, variants or tuple elements in declaration order; arrays and
    // vectors hold their element as the single component
    std::vector<Component> const &components() const;

    bool operator==(ParamType const &) const;

private:
    ParamType(
        Kind, std::string name, size_t length, std::vector<Component>);

    Kind kind_{Kind::Unit};
    size_t length_{0};
    std::string name_;
    std::shared_ptr<std::vector<Component> const> components_;
};

struct Component
{
    std::string name;
    ParamType type;

    bool operator==(Component const &) const = default;
};

// True when the encoding of every value of this type has the same length,
// i.e. there is no vector anywhere in the tree.
bool is_fixed_size(ParamType const &);

// Encoded size in bytes of a fixed-size type. Enums are sized to their
// widest variant.
size_t encoding_width(ParamType const &);

// Checks the placement rules for dynamic data: a vector may only be the last
// dynamic segment, so vector elements, array elements and enum variants must
// be fixed-size and only the last field of a struct or tuple may be dynamic.
Result<void> validate(ParamType const &);

FUELCALL_NAMESPACE_END
