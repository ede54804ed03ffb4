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

#include <fuelcall/abi/call_data.hpp>
#include <fuelcall/abi/fmt/token_fmt.hpp>
#include <fuelcall/abi/function_selector.hpp>
#include <fuelcall/contract/call_error.hpp>
#include <fuelcall/contract/contract_call.hpp>
#include <fuelcall/core/fmt/bytes_fmt.hpp>
#include <fuelcall/core/likely.h>

#include <boost/fiber/future/async.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <utility>

FUELCALL_NAMESPACE_BEGIN

byte_string CallDescriptor::script_data() const
{
    byte_string out;
    out.reserve(sizeof(ContractId) + selector.size() + call_data.size());
    out += to_byte_string_view(contract_id);
    out += to_byte_string_view(selector);
    out += call_data;
    return out;
}

Result<ScriptTransaction> CallDescriptor::to_transaction() const
{
    size_t const input_count = 1 + external_contracts.size();
    if (FUELCALL_UNLIKELY(input_count > MAX_INPUTS)) {
        LOG_ERROR(
            "call to {} needs {} contract inputs, at most {} are allowed",
            contract_id,
            input_count,
            MAX_INPUTS);
        return CallError::ValidationFailure;
    }

    ScriptTransaction tx{
        .params = tx_params,
        .script_data = script_data(),
        .inputs = {},
        .outputs = {}};

    tx.inputs.push_back(ContractInput{contract_id});
    for (auto const &id : external_contracts) {
        tx.inputs.push_back(ContractInput{id});
    }
    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        tx.outputs.emplace_back(ContractOutput{static_cast<uint8_t>(i)});
    }
    tx.outputs.insert(tx.outputs.end(), variable_outputs, VariableOutput{});
    return tx;
}

ContractCall::ContractCall(CallDescriptor descriptor, ParamType output)
    : descriptor_{std::move(descriptor)}
    , output_{std::move(output)}
{
}

ContractCall ContractCall::tx_params(TxParameters const &params) const
{
    ContractCall call{*this};
    call.descriptor_.tx_params = params;
    return call;
}

ContractCall ContractCall::call_params(CallParameters const &params) const
{
    ContractCall call{*this};
    call.descriptor_.call_params = params;
    return call;
}

ContractCall ContractCall::append_variable_outputs(size_t const n) const
{
    ContractCall call{*this};
    call.descriptor_.variable_outputs += n;
    return call;
}

ContractCall
ContractCall::set_contracts(std::span<ContractId const> const ids) const
{
    ContractCall call{*this};
    call.descriptor_.external_contracts.clear();
    for (auto const &id : ids) {
        call = call.append_contract(id);
    }
    return call;
}

ContractCall ContractCall::append_contract(ContractId const &id) const
{
    ContractCall call{*this};
    auto &contracts = call.descriptor_.external_contracts;
    if (id != descriptor_.contract_id &&
        std::ranges::find(contracts, id) == contracts.end()) {
        contracts.push_back(id);
    }
    return call;
}

boost::fibers::future<CallResponse>
ContractCall::commit(Provider &provider) const
{
    return dispatch(provider, DispatchMode::Commit);
}

boost::fibers::future<CallResponse>
ContractCall::simulate(Provider &provider) const
{
    return dispatch(provider, DispatchMode::Simulate);
}

boost::fibers::future<CallResponse>
ContractCall::dispatch(Provider &provider, DispatchMode const mode) const
{
    return boost::fibers::async(
        [&provider, descriptor = descriptor_, output = output_, mode] {
            LOG_DEBUG(
                "{} call to {} with {} variable outputs and {} external "
                "contracts",
                mode == DispatchMode::Commit ? "commit" : "simulate",
                descriptor.contract_id,
                descriptor.variable_outputs,
                descriptor.external_contracts.size());
            return extract_response(
                descriptor.contract_id,
                output,
                provider.submit(descriptor, mode).get());
        });
}

Result<ContractCall> method_call(
    ContractId const &contract_id, FunctionSelector const &selector,
    std::span<ParamType const> const inputs,
    std::span<Token const> const arguments, ParamType output)
{
    BOOST_OUTCOME_TRY(
        auto call_data,
        encode_call_arguments(inputs, arguments, CALL_DATA_OFFSET));
    return ContractCall{
        CallDescriptor{
            .contract_id = contract_id,
            .selector = selector,
            .call_data = std::move(call_data),
            .tx_params = {},
            .call_params = {},
            .variable_outputs = 0,
            .external_contracts = {}},
        std::move(output)};
}

Result<ContractCall> method_call(
    ContractId const &contract_id, std::string_view const method_name,
    std::span<ParamType const> const inputs,
    std::span<Token const> const arguments, ParamType output)
{
    auto const signature = abi_function_signature(method_name, inputs);
    LOG_DEBUG("preparing call to {}::{}", contract_id, signature);
    return method_call(
        contract_id,
        abi_encode_selector(signature),
        inputs,
        arguments,
        std::move(output));
}

FUELCALL_NAMESPACE_END
