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
#include <fuelcall/core/config.hpp>
#include <fuelcall/core/result.hpp>

#include <boost/fiber/future/future.hpp>

#include <vector>

FUELCALL_NAMESPACE_BEGIN

struct CallDescriptor;

enum class DispatchMode
{
    Commit,
    // dry run, state changes are discarded
    Simulate,
};

// Outcome of a submission. A failed dispatch still carries the receipts the
// node produced before it stopped, so that callers can inspect logs and panic
// reasons.
struct DispatchResult
{
    Result<void> status{outcome::success()};
    std::vector<Receipt> receipts;
};

// Capability to deliver a call to a node. Implementations report transport
// problems as CallError::TransportFailure, rejected transactions as
// CallError::ValidationFailure and failed execution as
// CallError::ExecutionRevert.
class Provider
{
public:
    virtual ~Provider() = default;

    virtual boost::fibers::future<DispatchResult>
    submit(CallDescriptor const &, DispatchMode) = 0;
};

FUELCALL_NAMESPACE_END
