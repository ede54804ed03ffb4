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

#include <fuelcall/abi/constants.hpp>
#include <fuelcall/abi/function_selector.hpp>
#include <fuelcall/abi/param_type.hpp>
#include <fuelcall/abi/token.hpp>
#include <fuelcall/abi/tokenizable.hpp>
#include <fuelcall/contract/call_response.hpp>
#include <fuelcall/contract/parameters.hpp>
#include <fuelcall/contract/provider.hpp>
#include <fuelcall/contract/transaction.hpp>
#include <fuelcall/core/byte_string.hpp>
#include <fuelcall/core/config.hpp>
#include <fuelcall/core/result.hpp>

#include <boost/fiber/future/future.hpp>
#include <boost/outcome/success_failure.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

FUELCALL_NAMESPACE_BEGIN

// Script data starts with the contract id and the selector. Pointer words in
// the call data that follows are addresses relative to the start of the
// script data.
inline constexpr uint64_t CALL_DATA_OFFSET =
    sizeof(ContractId) + SELECTOR_SIZE;

// Everything a node needs to execute one contract method.
struct CallDescriptor
{
    ContractId contract_id;
    FunctionSelector selector;
    // encoded at CALL_DATA_OFFSET
    byte_string call_data;
    TxParameters tx_params;
    CallParameters call_params;
    size_t variable_outputs{0};
    // other contracts reached during execution, without duplicates
    std::vector<ContractId> external_contracts;

    // contract id || selector || call data
    byte_string script_data() const;

    Result<ScriptTransaction> to_transaction() const;
};

// Immutable builder for a contract call. Every setter returns a modified copy
// and leaves the original untouched, so a partially configured call can be
// reused as a template.
//
// commit() and simulate() launch a fiber that submits the call and extracts
// the response. The provider must outlive the returned future.
class ContractCall
{
    CallDescriptor descriptor_;
    ParamType output_;

public:
    ContractCall(CallDescriptor, ParamType output);

    CallDescriptor const &descriptor() const noexcept
    {
        return descriptor_;
    }

    ParamType const &output() const noexcept
    {
        return output_;
    }

    ContractCall tx_params(TxParameters const &) const;
    ContractCall call_params(CallParameters const &) const;
    ContractCall append_variable_outputs(size_t) const;
    ContractCall set_contracts(std::span<ContractId const>) const;
    ContractCall append_contract(ContractId const &) const;

    boost::fibers::future<CallResponse> commit(Provider &) const;
    boost::fibers::future<CallResponse> simulate(Provider &) const;

private:
    boost::fibers::future<CallResponse>
    dispatch(Provider &, DispatchMode) const;
};

Result<ContractCall> method_call(
    ContractId const &, std::string_view method_name,
    std::span<ParamType const> inputs, std::span<Token const> arguments,
    ParamType output);

Result<ContractCall> method_call(
    ContractId const &, FunctionSelector const &,
    std::span<ParamType const> inputs, std::span<Token const> arguments,
    ParamType output);

// Typed wrapper over method_call() for host types with a Tokenizable mapping.
template <TokenizableType R, TokenizableType... Args>
Result<ContractCall> typed_method_call(
    ContractId const &contract_id, std::string_view const method_name,
    Args const &...args)
{
    std::array<ParamType, sizeof...(Args)> const inputs{
        Tokenizable<Args>::param_type()...};
    std::array<Token, sizeof...(Args)> const arguments{
        Tokenizable<Args>::into_token(args)...};
    return method_call(
        contract_id,
        method_name,
        inputs,
        arguments,
        Tokenizable<R>::param_type());
}

template <TokenizableType R>
Result<R> typed_value(CallResponse const &response)
{
    if (response.value.has_error()) {
        return outcome::failure(response.value.error().clone());
    }
    return Tokenizable<R>::from_token(response.value.value());
}

FUELCALL_NAMESPACE_END
