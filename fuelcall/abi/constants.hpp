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

#include <cstddef>

FUELCALL_NAMESPACE_BEGIN

// Register width of the VM. Every primitive except byte and b256 occupies
// exactly one word.
inline constexpr size_t WORD_SIZE = 8;

inline constexpr size_t ENUM_DISCRIMINANT_WIDTH = WORD_SIZE;
inline constexpr size_t VECTOR_LENGTH_WIDTH = WORD_SIZE;
inline constexpr size_t BYTE_SIZE = 1;
inline constexpr size_t B256_SIZE = 32;

// 4 byte fingerprint stored in the low half of a word
inline constexpr size_t SELECTOR_SIZE = WORD_SIZE;
inline constexpr size_t SELECTOR_HASH_PREFIX = 4;

FUELCALL_NAMESPACE_END
