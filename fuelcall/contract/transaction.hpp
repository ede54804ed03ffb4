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

#include <fuelcall/contract/parameters.hpp>
#include <fuelcall/core/byte_string.hpp>
#include <fuelcall/core/config.hpp>

#include <cstdint>
#include <variant>
#include <vector>

FUELCALL_NAMESPACE_BEGIN

// A contract the script is allowed to touch. Every contract reached during
// execution, directly or through another contract, must be an input.
struct ContractInput
{
    ContractId contract_id;

    bool operator==(ContractInput const &) const = default;
};

// State of the contract input at `input_index` after execution.
struct ContractOutput
{
    uint8_t input_index;

    bool operator==(ContractOutput const &) const = default;
};

// Placeholder for a coin output whose recipient, amount and asset are only
// known once the script runs, e.g. a transfer from a contract to an address.
struct VariableOutput
{
    bool operator==(VariableOutput const &) const = default;
};

using Output = std::variant<ContractOutput, VariableOutput>;

struct ScriptTransaction
{
    TxParameters params;
    byte_string script_data;
    std::vector<ContractInput> inputs;
    std::vector<Output> outputs;

    bool operator==(ScriptTransaction const &) const = default;
};

size_t count_variable_outputs(ScriptTransaction const &);

FUELCALL_NAMESPACE_END
