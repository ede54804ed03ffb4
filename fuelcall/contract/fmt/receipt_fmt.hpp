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

#include <fuelcall/contract/receipt.hpp>
#include <fuelcall/core/basic_formatter.hpp>
#include <fuelcall/core/fmt/bytes_fmt.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <cstddef>
#include <span>
#include <type_traits>
#include <variant>

template <>
struct quill::copy_loggable<fuelcall::PanicReason> : std::true_type
{
};

template <>
struct quill::copy_loggable<fuelcall::Receipt> : std::true_type
{
};

template <>
struct fmt::formatter<fuelcall::PanicReason> : public fuelcall::BasicFormatter
{
    template <typename FormatContext>
    auto format(fuelcall::PanicReason const &value, FormatContext &ctx) const
    {
        using fuelcall::PanicReason;

        char const *name = "Unknown";
        switch (value) {
        case PanicReason::Success:
            name = "Success";
            break;
        case PanicReason::ContractNotInInputs:
            name = "ContractNotInInputs";
            break;
        case PanicReason::NotEnoughBalance:
            name = "NotEnoughBalance";
            break;
        case PanicReason::OutputNotFound:
            name = "OutputNotFound";
            break;
        case PanicReason::OutOfGas:
            name = "OutOfGas";
            break;
        case PanicReason::Unknown:
            break;
        }
        fmt::format_to(ctx.out(), "{}", name);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<fuelcall::Receipt> : public fuelcall::BasicFormatter
{
    template <typename FormatContext>
    auto format(fuelcall::Receipt const &value, FormatContext &ctx) const
    {
        namespace r = fuelcall::receipt;

        std::visit(
            [&ctx](auto const &v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, r::Call>) {
                    fmt::format_to(
                        ctx.out(),
                        "Call{{id={} to={} amount={} asset_id={} gas={} "
                        "param1={} param2={}}}",
                        v.id,
                        v.to,
                        v.amount,
                        v.asset_id,
                        v.gas,
                        v.param1,
                        v.param2);
                }
                else if constexpr (std::is_same_v<T, r::Return>) {
                    fmt::format_to(
                        ctx.out(), "Return{{id={} val={}}}", v.id, v.val);
                }
                else if constexpr (std::is_same_v<T, r::ReturnData>) {
                    fmt::format_to(
                        ctx.out(),
                        "ReturnData{{id={} ptr={} data=0x{:02x}}}",
                        v.id,
                        v.ptr,
                        fmt::join(std::as_bytes(std::span(v.data)), ""));
                }
                else if constexpr (std::is_same_v<T, r::Panic>) {
                    fmt::format_to(
                        ctx.out(), "Panic{{id={} reason={}}}", v.id, v.reason);
                }
                else if constexpr (std::is_same_v<T, r::Revert>) {
                    fmt::format_to(
                        ctx.out(), "Revert{{id={} ra={}}}", v.id, v.ra);
                }
                else if constexpr (std::is_same_v<T, r::Log>) {
                    fmt::format_to(
                        ctx.out(),
                        "Log{{id={} ra={} rb={} rc={} rd={}}}",
                        v.id,
                        v.ra,
                        v.rb,
                        v.rc,
                        v.rd);
                }
                else if constexpr (std::is_same_v<T, r::LogData>) {
                    fmt::format_to(
                        ctx.out(),
                        "LogData{{id={} ra={} rb={} data=0x{:02x}}}",
                        v.id,
                        v.ra,
                        v.rb,
                        fmt::join(std::as_bytes(std::span(v.data)), ""));
                }
                else if constexpr (std::is_same_v<T, r::Transfer>) {
                    fmt::format_to(
                        ctx.out(),
                        "Transfer{{id={} to={} amount={} asset_id={}}}",
                        v.id,
                        v.to,
                        v.amount,
                        v.asset_id);
                }
                else if constexpr (std::is_same_v<T, r::TransferOut>) {
                    fmt::format_to(
                        ctx.out(),
                        "TransferOut{{id={} to={} amount={} asset_id={}}}",
                        v.id,
                        v.to,
                        v.amount,
                        v.asset_id);
                }
                else if constexpr (std::is_same_v<T, r::ScriptResult>) {
                    fmt::format_to(
                        ctx.out(),
                        "ScriptResult{{result={} gas_used={}}}",
                        v.result,
                        v.gas_used);
                }
            },
            value);
        return ctx.out();
    }
};
