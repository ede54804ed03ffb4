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
#include <fuelcall/abi/constants.hpp>
#include <fuelcall/abi/param_type.hpp>
#include <fuelcall/core/assert.h>
#include <fuelcall/core/likely.h>
#include <fuelcall/core/math.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>
#include <utility>

FUELCALL_ANONYMOUS_NAMESPACE_BEGIN

std::vector<Component> const &empty_components()
{
    static std::vector<Component> const empty;
    return empty;
}

FUELCALL_ANONYMOUS_NAMESPACE_END

FUELCALL_NAMESPACE_BEGIN

ParamType::ParamType(
    Kind const kind, std::string name, size_t const length,
    std::vector<Component> components)
    : kind_{kind}
    , length_{length}
    , name_{std::move(name)}
    , components_{
          components.empty() ? nullptr
                             : std::make_shared<std::vector<Component> const>(
                                   std::move(components))}
{
}

ParamType ParamType::unit()
{
    return ParamType{};
}

ParamType ParamType::boolean()
{
    return ParamType{Kind::Bool, {}, 0, {}};
}

ParamType ParamType::u8()
{
    return ParamType{Kind::U8, {}, 0, {}};
}

ParamType ParamType::u16()
{
    return ParamType{Kind::U16, {}, 0, {}};
}

ParamType ParamType::u32()
{
    return ParamType{Kind::U32, {}, 0, {}};
}

ParamType ParamType::u64()
{
    return ParamType{Kind::U64, {}, 0, {}};
}

ParamType ParamType::byte()
{
    return ParamType{Kind::Byte, {}, 0, {}};
}

ParamType ParamType::b256()
{
    return ParamType{Kind::B256, {}, 0, {}};
}

ParamType ParamType::string(size_t const length)
{
    return ParamType{Kind::String, {}, length, {}};
}

ParamType ParamType::array(ParamType element, size_t const length)
{
    return ParamType{
        Kind::Array, {}, length, {Component{{}, std::move(element)}}};
}

ParamType ParamType::vector(ParamType element)
{
    return ParamType{Kind::Vector, {}, 0, {Component{{}, std::move(element)}}};
}

ParamType ParamType::tuple(std::vector<ParamType> elements)
{
    std::vector<Component> components;
    components.reserve(elements.size());
    for (auto &element : elements) {
        components.push_back(Component{{}, std::move(element)});
    }
    return ParamType{Kind::Tuple, {}, 0, std::move(components)};
}

ParamType
ParamType::structure(std::string name, std::vector<Component> fields)
{
    return ParamType{Kind::Struct, std::move(name), 0, std::move(fields)};
}

ParamType
ParamType::enumeration(std::string name, std::vector<Component> variants)
{
    return ParamType{Kind::Enum, std::move(name), 0, std::move(variants)};
}

ParamType const &ParamType::element() const
{
    FUELCALL_ASSERT(kind_ == Kind::Array || kind_ == Kind::Vector);
    return components_->front().type;
}

std::vector<Component> const &ParamType::components() const
{
    return components_ ? *components_ : empty_components();
}

bool ParamType::operator==(ParamType const &other) const
{
    return kind_ == other.kind_ && length_ == other.length_ &&
           name_ == other.name_ && components() == other.components();
}

bool is_fixed_size(ParamType const &type)
{
    if (type.kind() == ParamType::Kind::Vector) {
        return false;
    }
    return std::ranges::all_of(type.components(), [](Component const &c) {
        return is_fixed_size(c.type);
    });
}

size_t encoding_width(ParamType const &type)
{
    using Kind = ParamType::Kind;

    switch (type.kind()) {
    case Kind::Unit:
    case Kind::Bool:
    case Kind::U8:
    case Kind::U16:
    case Kind::U32:
    case Kind::U64:
        return WORD_SIZE;
    case Kind::Byte:
        return BYTE_SIZE;
    case Kind::B256:
        return B256_SIZE;
    case Kind::String:
        return round_up(type.length(), WORD_SIZE);
    case Kind::Array:
        return encoding_width(type.element()) * type.length();
    case Kind::Tuple:
    case Kind::Struct: {
        size_t width = 0;
        for (auto const &field : type.components()) {
            width += encoding_width(field.type);
        }
        return width;
    }
    case Kind::Enum: {
        size_t widest = 0;
        for (auto const &variant : type.components()) {
            widest = std::max(widest, encoding_width(variant.type));
        }
        return ENUM_DISCRIMINANT_WIDTH + widest;
    }
    case Kind::Vector:
        break;
    }
    FUELCALL_ASSERT(false);
    __builtin_unreachable();
}

Result<void> validate(ParamType const &type)
{
    using Kind = ParamType::Kind;

    auto const &components = type.components();
    switch (type.kind()) {
    case Kind::Vector:
    case Kind::Array:
        if (FUELCALL_UNLIKELY(!is_fixed_size(type.element()))) {
            return AbiError::UnsupportedType;
        }
        // every element takes at least one byte of the payload
        if (FUELCALL_UNLIKELY(encoding_width(type.element()) == 0)) {
            return AbiError::UnsupportedType;
        }
        break;
    case Kind::Enum:
        if (FUELCALL_UNLIKELY(components.empty())) {
            return AbiError::UnsupportedType;
        }
        for (auto const &variant : components) {
            if (FUELCALL_UNLIKELY(!is_fixed_size(variant.type))) {
                return AbiError::UnsupportedType;
            }
        }
        break;
    case Kind::Tuple:
    case Kind::Struct:
        for (size_t i = 0; i + 1 < components.size(); ++i) {
            if (FUELCALL_UNLIKELY(!is_fixed_size(components[i].type))) {
                return AbiError::UnsupportedType;
            }
        }
        break;
    default:
        break;
    }

    for (auto const &component : components) {
        BOOST_OUTCOME_TRY(validate(component.type));
    }
    return outcome::success();
}

FUELCALL_NAMESPACE_END
