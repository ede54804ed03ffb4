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
#include <fuelcall/core/bytes.hpp>
#include <fuelcall/core/config.hpp>

#include <cstdint>
#include <variant>

FUELCALL_NAMESPACE_BEGIN

enum class PanicReason : uint8_t
{
    Success = 0,
    ContractNotInInputs,
    NotEnoughBalance,
    OutputNotFound,
    OutOfGas,
    Unknown,
};

// Records emitted by the VM while executing a script, in execution order.
// `id` is the contract whose code emitted the record, all zero for the script
// itself.
namespace receipt
{
    struct Call
    {
        ContractId id;
        ContractId to;
        uint64_t amount;
        AssetId asset_id;
        uint64_t gas;
        uint64_t param1; // selector
        uint64_t param2; // call data address

        bool operator==(Call const &) const = default;
    };

    struct Return
    {
        ContractId id;
        uint64_t val;

        bool operator==(Return const &) const = default;
    };

    struct ReturnData
    {
        ContractId id;
        uint64_t ptr;
        byte_string data;

        bool operator==(ReturnData const &) const = default;
    };

    struct Panic
    {
        ContractId id;
        PanicReason reason;

        bool operator==(Panic const &) const = default;
    };

    struct Revert
    {
        ContractId id;
        uint64_t ra;

        bool operator==(Revert const &) const = default;
    };

    struct Log
    {
        ContractId id;
        uint64_t ra;
        uint64_t rb;
        uint64_t rc;
        uint64_t rd;

        bool operator==(Log const &) const = default;
    };

    struct LogData
    {
        ContractId id;
        uint64_t ra;
        uint64_t rb;
        uint64_t ptr;
        byte_string data;

        bool operator==(LogData const &) const = default;
    };

    // coins moved to another contract
    struct Transfer
    {
        ContractId id;
        ContractId to;
        uint64_t amount;
        AssetId asset_id;

        bool operator==(Transfer const &) const = default;
    };

    // coins moved to an address, which consumes a variable output
    struct TransferOut
    {
        ContractId id;
        Address to;
        uint64_t amount;
        AssetId asset_id;

        bool operator==(TransferOut const &) const = default;
    };

    struct ScriptResult
    {
        uint64_t result;
        uint64_t gas_used;

        bool operator==(ScriptResult const &) const = default;
    };
}

using Receipt = std::variant<
    receipt::Call, receipt::Return, receipt::ReturnData, receipt::Panic,
    receipt::Revert, receipt::Log, receipt::LogData, receipt::Transfer,
    receipt::TransferOut, receipt::ScriptResult>;

FUELCALL_NAMESPACE_END
