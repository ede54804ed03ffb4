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

#include <fuelcall/abi/param_type.hpp>
#include <fuelcall/abi/token.hpp>
#include <fuelcall/contract/parameters.hpp>
#include <fuelcall/contract/provider.hpp>
#include <fuelcall/contract/receipt.hpp>
#include <fuelcall/core/config.hpp>
#include <fuelcall/core/result.hpp>

#include <span>
#include <string>
#include <vector>

FUELCALL_NAMESPACE_BEGIN

struct CallResponse
{
    Result<Token> value;
    std::vector<Receipt> receipts;
    std::vector<std::string> logs;
};

// Turns the receipts of a dispatch into the typed response of a call to
// `contract_id` whose return value has the `output` schema.
CallResponse extract_response(
    ContractId const &contract_id, ParamType const &output, DispatchResult);

// `Log` receipts as the decimal value of `ra`, `LogData` receipts as the hex
// of their payload, in execution order.
std::vector<std::string> extract_logs(std::span<Receipt const>);

// Decodes the payload of every `LogData` receipt against `type`.
Result<std::vector<Token>>
decode_logs(ParamType const &type, std::span<Receipt const>);

FUELCALL_NAMESPACE_END
