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

#include <fuelcall/abi/abi_decode.hpp>
#include <fuelcall/abi/abi_error.hpp>
#include <fuelcall/abi/big_endian.hpp>
#include <fuelcall/abi/call_data.hpp>
#include <fuelcall/abi/constants.hpp>
#include <fuelcall/abi/fmt/token_fmt.hpp>
#include <fuelcall/contract/call_error.hpp>
#include <fuelcall/contract/call_response.hpp>
#include <fuelcall/contract/fmt/receipt_fmt.hpp>
#include <fuelcall/core/fmt/bytes_fmt.hpp>
#include <fuelcall/core/likely.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <cstring>
#include <string>
#include <utility>
#include <variant>

FUELCALL_ANONYMOUS_NAMESPACE_BEGIN

void log_panic(receipt::Panic const &panic)
{
    switch (panic.reason) {
    case PanicReason::OutputNotFound:
        LOG_WARNING(
            "contract {} panicked with {}: the call transfers to an address, "
            "reserve variable outputs with append_variable_outputs()",
            panic.id,
            panic.reason);
        break;
    case PanicReason::ContractNotInInputs:
        LOG_WARNING(
            "contract {} panicked with {}: the call reaches another contract, "
            "declare it with set_contracts() or append_contract()",
            panic.id,
            panic.reason);
        break;
    default:
        LOG_ERROR("contract {} panicked with {}", panic.id, panic.reason);
        break;
    }
}

// Panic or Revert receipts mean the script did not complete, whatever the
// node reported.
bool execution_failed(std::vector<Receipt> const &receipts)
{
    bool failed = false;
    for (auto const &r : receipts) {
        if (auto const *const panic = std::get_if<receipt::Panic>(&r)) {
            log_panic(*panic);
            failed = true;
        }
        else if (auto const *const revert = std::get_if<receipt::Revert>(&r)) {
            LOG_ERROR(
                "contract {} reverted with {}", revert->id, revert->ra);
            failed = true;
        }
    }
    return failed;
}

Result<Token> extract_value(
    ContractId const &contract_id, ParamType const &output,
    DispatchResult &result)
{
    bool const failed = execution_failed(result.receipts);
    if (FUELCALL_UNLIKELY(result.status.has_error())) {
        LOG_ERROR(
            "call to {} failed: {}",
            contract_id,
            result.status.error().message().c_str());
        return std::move(result.status).as_failure();
    }
    if (FUELCALL_UNLIKELY(failed)) {
        return CallError::ExecutionRevert;
    }

    // values of one word come back in a register, anything else in memory
    bool const in_register =
        is_fixed_size(output) && encoding_width(output) <= WORD_SIZE;
    for (auto const &r : result.receipts) {
        if (auto const *const ret = std::get_if<receipt::Return>(&r)) {
            if (in_register && ret->id == contract_id) {
                u64_be const val{ret->val};
                byte_string_fixed<WORD_SIZE> word;
                std::memcpy(word.data(), val.bytes, WORD_SIZE);
                return decode_word(output, word);
            }
        }
        else if (auto const *const ret = std::get_if<receipt::ReturnData>(&r)) {
            if (!in_register && ret->id == contract_id) {
                byte_string_view data{ret->data};
                BOOST_OUTCOME_TRY(auto value, abi_decode(output, data));
                if (FUELCALL_UNLIKELY(!data.empty())) {
                    LOG_ERROR(
                        "call to {} returned {} trailing bytes after {}",
                        contract_id,
                        data.size(),
                        abi_type_signature(output));
                    return AbiError::InvalidValue;
                }
                return value;
            }
        }
    }

    if (output.kind() == ParamType::Kind::Unit) {
        return Token::unit();
    }
    LOG_ERROR(
        "call to {} produced no return value for {}",
        contract_id,
        abi_type_signature(output));
    return AbiError::MissingReturnValue;
}

FUELCALL_ANONYMOUS_NAMESPACE_END

FUELCALL_NAMESPACE_BEGIN

CallResponse extract_response(
    ContractId const &contract_id, ParamType const &output,
    DispatchResult result)
{
    for (auto const &r : result.receipts) {
        LOG_DEBUG("call to {}: {}", contract_id, r);
    }
    auto value = extract_value(contract_id, output, result);
    auto logs = extract_logs(result.receipts);
    if (value.has_value()) {
        LOG_DEBUG("call to {} returned {}", contract_id, value.value());
    }
    return CallResponse{
        std::move(value), std::move(result.receipts), std::move(logs)};
}

std::vector<std::string> extract_logs(std::span<Receipt const> const receipts)
{
    std::vector<std::string> logs;
    for (auto const &r : receipts) {
        if (auto const *const log = std::get_if<receipt::Log>(&r)) {
            logs.push_back(std::to_string(log->ra));
        }
        else if (auto const *const log = std::get_if<receipt::LogData>(&r)) {
            logs.push_back(fmt::format("0x{:02x}", fmt::join(log->data, "")));
        }
    }
    return logs;
}

Result<std::vector<Token>>
decode_logs(ParamType const &type, std::span<Receipt const> const receipts)
{
    std::vector<Token> tokens;
    for (auto const &r : receipts) {
        if (auto const *const log = std::get_if<receipt::LogData>(&r)) {
            byte_string_view data{log->data};
            BOOST_OUTCOME_TRY(auto token, abi_decode(type, data));
            tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

FUELCALL_NAMESPACE_END
