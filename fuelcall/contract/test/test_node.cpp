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

#include <fuelcall/abi/abi_encode.hpp>
#include <fuelcall/abi/big_endian.hpp>
#include <fuelcall/abi/call_data.hpp>
#include <fuelcall/abi/constants.hpp>
#include <fuelcall/abi/function_selector.hpp>
#include <fuelcall/contract/call_error.hpp>
#include <fuelcall/contract/fmt/receipt_fmt.hpp>
#include <fuelcall/contract/test/test_node.hpp>
#include <fuelcall/core/fmt/bytes_fmt.hpp>
#include <fuelcall/core/likely.h>

#include <boost/fiber/future/promise.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstring>
#include <utility>

FUELCALL_ANONYMOUS_NAMESPACE_BEGIN

uint64_t to_word(byte_string_view const encoded)
{
    byte_string_fixed<WORD_SIZE> word{};
    std::copy(
        encoded.begin(), encoded.end(), word.end() - encoded.size());
    return u64_be::from_bytes(word.data()).native();
}

uint64_t to_word(FunctionSelector const &selector)
{
    return u64_be::from_bytes(selector.data()).native();
}

FUELCALL_ANONYMOUS_NAMESPACE_END

FUELCALL_NAMESPACE_BEGIN

namespace test
{
    ExecutionContext::ExecutionContext(
        TestNode &node, Execution &exec, ContractId const &self)
        : node_{node}
        , exec_{exec}
        , self_{self}
    {
    }

    ContractState &ExecutionContext::self_state()
    {
        return exec_.state.contracts[self_];
    }

    bool ExecutionContext::is_input(ContractId const &id) const
    {
        return std::ranges::find(exec_.inputs, id) != exec_.inputs.end();
    }

    uint64_t ExecutionContext::load(std::string const &key) const
    {
        auto const contract = exec_.state.contracts.find(self_);
        if (contract == exec_.state.contracts.end()) {
            return 0;
        }
        auto const it = contract->second.storage.find(key);
        return it == contract->second.storage.end() ? 0 : it->second;
    }

    void ExecutionContext::store(std::string const &key, uint64_t const value)
    {
        self_state().storage[key] = value;
    }

    uint64_t ExecutionContext::balance(AssetId const &asset_id) const
    {
        auto const contract = exec_.state.contracts.find(self_);
        if (contract == exec_.state.contracts.end()) {
            return 0;
        }
        auto const it = contract->second.balances.find(asset_id);
        return it == contract->second.balances.end() ? 0 : it->second;
    }

    void ExecutionContext::log(uint64_t const ra)
    {
        exec_.receipts.emplace_back(receipt::Log{
            .id = self_, .ra = ra, .rb = 0, .rc = 0, .rd = 0});
    }

    void ExecutionContext::log_data(byte_string data)
    {
        exec_.receipts.emplace_back(receipt::LogData{
            .id = self_, .ra = 0, .rb = 0, .ptr = 0, .data = std::move(data)});
    }

    Result<void>
    ExecutionContext::log_value(ParamType const &type, Token const &token)
    {
        BOOST_OUTCOME_TRY(auto data, abi_encode(type, token));
        log_data(std::move(data));
        return outcome::success();
    }

    Result<void> ExecutionContext::transfer_to_address(
        Address const &to, uint64_t const amount, AssetId const &asset_id)
    {
        if (FUELCALL_UNLIKELY(
                exec_.variable_outputs_used >= exec_.variable_outputs)) {
            return panic(PanicReason::OutputNotFound);
        }
        auto &balance = self_state().balances[asset_id];
        if (FUELCALL_UNLIKELY(balance < amount)) {
            return panic(PanicReason::NotEnoughBalance);
        }
        balance -= amount;
        exec_.state.wallets[{to, asset_id}] += amount;
        ++exec_.variable_outputs_used;
        exec_.receipts.emplace_back(receipt::TransferOut{
            .id = self_, .to = to, .amount = amount, .asset_id = asset_id});
        return outcome::success();
    }

    Result<void> ExecutionContext::transfer_to_contract(
        ContractId const &to, uint64_t const amount, AssetId const &asset_id)
    {
        if (FUELCALL_UNLIKELY(!is_input(to))) {
            return panic(PanicReason::ContractNotInInputs);
        }
        auto &balance = self_state().balances[asset_id];
        if (FUELCALL_UNLIKELY(balance < amount)) {
            return panic(PanicReason::NotEnoughBalance);
        }
        balance -= amount;
        exec_.state.contracts[to].balances[asset_id] += amount;
        exec_.receipts.emplace_back(receipt::Transfer{
            .id = self_, .to = to, .amount = amount, .asset_id = asset_id});
        return outcome::success();
    }

    Result<Token> ExecutionContext::call(
        ContractId const &to, std::string_view const method,
        std::span<ParamType const> const inputs,
        std::span<Token const> const args)
    {
        auto call_data =
            encode_call_arguments(inputs, args, CALL_DATA_OFFSET);
        if (FUELCALL_UNLIKELY(call_data.has_error())) {
            return panic(PanicReason::Unknown);
        }
        return node_.run_method(
            exec_,
            self_,
            to,
            abi_encode_selector(method, inputs),
            call_data.value(),
            CallParameters{});
    }

    CallError ExecutionContext::panic(PanicReason const reason)
    {
        exec_.receipts.emplace_back(
            receipt::Panic{.id = self_, .reason = reason});
        exec_.failed = true;
        return CallError::ExecutionRevert;
    }

    CallError ExecutionContext::revert(uint64_t const code)
    {
        exec_.receipts.emplace_back(receipt::Revert{.id = self_, .ra = code});
        exec_.failed = true;
        return CallError::ExecutionRevert;
    }

    void TestNode::deploy(ContractId const &id)
    {
        code_[id];
        state_.contracts[id];
    }

    void TestNode::add_method(
        ContractId const &id, std::string_view const name,
        std::vector<ParamType> inputs, ParamType output, Method method)
    {
        auto signature = abi_function_signature(name, inputs);
        auto const selector = abi_encode_selector(signature);
        deploy(id);
        code_[id][selector] = MethodEntry{
            .signature = std::move(signature),
            .inputs = std::move(inputs),
            .output = std::move(output),
            .method = std::move(method)};
    }

    void TestNode::fail_next_submissions(size_t const n)
    {
        transport_failures_ = n;
    }

    void TestNode::fund_contract(
        ContractId const &id, AssetId const &asset_id, uint64_t const amount)
    {
        state_.contracts[id].balances[asset_id] += amount;
    }

    uint64_t
    TestNode::storage(ContractId const &id, std::string const &key) const
    {
        auto const contract = state_.contracts.find(id);
        if (contract == state_.contracts.end()) {
            return 0;
        }
        auto const it = contract->second.storage.find(key);
        return it == contract->second.storage.end() ? 0 : it->second;
    }

    uint64_t TestNode::contract_balance(
        ContractId const &id, AssetId const &asset_id) const
    {
        auto const contract = state_.contracts.find(id);
        if (contract == state_.contracts.end()) {
            return 0;
        }
        auto const it = contract->second.balances.find(asset_id);
        return it == contract->second.balances.end() ? 0 : it->second;
    }

    uint64_t TestNode::wallet_balance(
        Address const &address, AssetId const &asset_id) const
    {
        auto const it = state_.wallets.find({address, asset_id});
        return it == state_.wallets.end() ? 0 : it->second;
    }

    Result<Token> TestNode::run_method(
        Execution &exec, ContractId const &caller, ContractId const &to,
        FunctionSelector const &selector, byte_string_view const call_data,
        CallParameters const &params)
    {
        ExecutionContext caller_ctx{*this, exec, caller};
        if (FUELCALL_UNLIKELY(!caller_ctx.is_input(to))) {
            return caller_ctx.panic(PanicReason::ContractNotInInputs);
        }
        if (FUELCALL_UNLIKELY(exec.gas_left < CALL_GAS)) {
            return caller_ctx.panic(PanicReason::OutOfGas);
        }
        exec.gas_left -= CALL_GAS;

        exec.receipts.emplace_back(receipt::Call{
            .id = caller,
            .to = to,
            .amount = params.amount,
            .asset_id = params.asset_id,
            .gas = exec.gas_left,
            .param1 = to_word(selector),
            .param2 = 0});

        // coins forwarded from the script come out of the caller's wallet
        if (params.amount > 0) {
            if (caller != ContractId{}) {
                auto &balance =
                    caller_ctx.self_state().balances[params.asset_id];
                if (FUELCALL_UNLIKELY(balance < params.amount)) {
                    return caller_ctx.panic(PanicReason::NotEnoughBalance);
                }
                balance -= params.amount;
            }
            exec.state.contracts[to].balances[params.asset_id] +=
                params.amount;
        }

        ExecutionContext ctx{*this, exec, to};

        auto const contract = code_.find(to);
        if (FUELCALL_UNLIKELY(contract == code_.end())) {
            return ctx.panic(PanicReason::ContractNotInInputs);
        }
        auto const entry = contract->second.find(selector);
        if (FUELCALL_UNLIKELY(entry == contract->second.end())) {
            LOG_ERROR("test node: contract {} has no such method", to);
            return ctx.panic(PanicReason::Unknown);
        }
        auto const &method = entry->second;

        auto args =
            decode_call_arguments(method.inputs, call_data, CALL_DATA_OFFSET);
        if (FUELCALL_UNLIKELY(args.has_error())) {
            LOG_ERROR(
                "test node: bad call data for {} on {}",
                method.signature,
                to);
            return ctx.panic(PanicReason::Unknown);
        }

        auto value = method.method(ctx, args.value());
        if (FUELCALL_UNLIKELY(value.has_error())) {
            if (!exec.failed) {
                ctx.revert(0);
            }
            return std::move(value).as_failure();
        }

        auto encoded = abi_encode(method.output, value.value());
        if (FUELCALL_UNLIKELY(encoded.has_error())) {
            return ctx.panic(PanicReason::Unknown);
        }
        if (is_fixed_size(method.output) &&
            encoding_width(method.output) <= WORD_SIZE) {
            exec.receipts.emplace_back(
                receipt::Return{.id = to, .val = to_word(encoded.value())});
        }
        else {
            exec.receipts.emplace_back(receipt::ReturnData{
                .id = to, .ptr = 0, .data = std::move(encoded).value()});
        }
        return value;
    }

    DispatchResult
    TestNode::execute(CallDescriptor const &descriptor, DispatchMode const mode)
    {
        if (transport_failures_ > 0) {
            --transport_failures_;
            return DispatchResult{CallError::TransportFailure, {}};
        }

        auto tx = descriptor.to_transaction();
        if (FUELCALL_UNLIKELY(tx.has_error())) {
            return DispatchResult{std::move(tx).as_failure(), {}};
        }

        Execution exec{
            .state = state_,
            .inputs = {},
            .variable_outputs = count_variable_outputs(tx.value()),
            .variable_outputs_used = 0,
            .gas_left = tx.value().params.gas_limit,
            .failed = false,
            .receipts = {}};
        for (auto const &input : tx.value().inputs) {
            if (FUELCALL_UNLIKELY(!code_.contains(input.contract_id))) {
                LOG_ERROR(
                    "test node: input contract {} is not deployed",
                    input.contract_id);
                return DispatchResult{CallError::ValidationFailure, {}};
            }
            exec.inputs.push_back(input.contract_id);
        }
        submitted_.push_back(tx.value());

        // the script reads its target from the script data
        byte_string_view script_data{tx.value().script_data};
        if (FUELCALL_UNLIKELY(script_data.size() < CALL_DATA_OFFSET)) {
            LOG_ERROR(
                "test node: script data of {} bytes has no call header",
                script_data.size());
            return DispatchResult{CallError::ValidationFailure, {}};
        }
        ContractId target;
        std::memcpy(target.bytes, script_data.data(), sizeof(ContractId));
        FunctionSelector selector{};
        std::memcpy(
            selector.data(),
            script_data.data() + sizeof(ContractId),
            SELECTOR_SIZE);
        script_data.remove_prefix(CALL_DATA_OFFSET);

        auto const value = run_method(
            exec,
            ContractId{},
            target,
            selector,
            script_data,
            descriptor.call_params);

        exec.receipts.emplace_back(receipt::ScriptResult{
            .result = value.has_value() ? 0u : 1u,
            .gas_used = tx.value().params.gas_limit - exec.gas_left});

        DispatchResult result;
        if (value.has_error()) {
            result.status = CallError::ExecutionRevert;
        }
        else if (mode == DispatchMode::Commit) {
            state_ = std::move(exec.state);
        }
        result.receipts = std::move(exec.receipts);
        return result;
    }

    boost::fibers::future<DispatchResult>
    TestNode::submit(CallDescriptor const &descriptor, DispatchMode const mode)
    {
        boost::fibers::promise<DispatchResult> promise;
        promise.set_value(execute(descriptor, mode));
        return promise.get_future();
    }
}

FUELCALL_NAMESPACE_END
