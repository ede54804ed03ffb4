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

#include <cstddef>
#include <cstdint>

FUELCALL_NAMESPACE_BEGIN

using ContractId = bytes32_t;
using AssetId = bytes32_t;
using Address = bytes32_t;

// native asset of the chain
inline constexpr AssetId BASE_ASSET_ID{};

inline constexpr uint64_t DEFAULT_GAS_PRICE = 0;
inline constexpr uint64_t DEFAULT_GAS_LIMIT = 1'000'000;
inline constexpr uint64_t DEFAULT_BYTE_PRICE = 0;
inline constexpr uint32_t DEFAULT_MATURITY = 0;
inline constexpr uint64_t DEFAULT_FORWARD_AMOUNT = 0;

// contract outputs address their input with one byte
inline constexpr size_t MAX_INPUTS = 255;

struct TxParameters
{
    uint64_t gas_price{DEFAULT_GAS_PRICE};
    uint64_t gas_limit{DEFAULT_GAS_LIMIT};
    uint64_t byte_price{DEFAULT_BYTE_PRICE};
    uint32_t maturity{DEFAULT_MATURITY};

    bool operator==(TxParameters const &) const = default;
};

// Coins forwarded to the called contract along with the call.
struct CallParameters
{
    uint64_t amount{DEFAULT_FORWARD_AMOUNT};
    AssetId asset_id{BASE_ASSET_ID};

    bool operator==(CallParameters const &) const = default;
};

FUELCALL_NAMESPACE_END
